#include <gemini_mcp/extract/text_extract.hpp>

#include <gemini_mcp/core/text.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>

namespace gemini_mcp {

namespace {

constexpr std::string_view kBullet = "\xE2\x80\xA2";  // U+2022 '•'

bool IsStopWord(const std::vector<std::string>& stop_words,
                const std::string& word) {
    return std::find(stop_words.begin(), stop_words.end(), word) !=
           stop_words.end();
}

// Strips one leading bullet marker, if any. Returns nullopt when the line
// does not start with a marker.
std::optional<std::string_view> StripBullet(std::string_view line) {
    auto body = Trim(line);
    if (!body.empty() && (body.front() == '-' || body.front() == '*')) {
        body.remove_prefix(1);
        return Trim(body);
    }
    if (body.substr(0, kBullet.size()) == kBullet) {
        body.remove_prefix(kBullet.size());
        return Trim(body);
    }
    return std::nullopt;
}

bool IsAsciiDigit(char c) { return c >= '0' && c <= '9'; }

// End of "<digits>[.<digits>]" starting at a digit.
std::size_t ScanNumber(std::string_view text, std::size_t pos) {
    while (pos < text.size() && IsAsciiDigit(text[pos])) ++pos;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && IsAsciiDigit(text[pos])) ++pos;
    }
    return pos;
}

std::string_view TrimNonAlpha(std::string_view s) {
    std::size_t begin = 0;
    while (begin < s.size() &&
           !std::isalpha(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    std::size_t end = s.size();
    while (end > begin &&
           !std::isalpha(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

} // anonymous namespace

const std::vector<std::string>& TopicStopWords() {
    static const std::vector<std::string> words = {
        "that", "this", "with", "from", "have", "will", "would", "could",
        "should", "about", "which", "their", "there", "these", "those",
        "been", "being", "were", "when", "where", "while", "after", "before",
    };
    return words;
}

const std::vector<std::string>& ThemeStopWords() {
    static const std::vector<std::string> words = [] {
        auto all = TopicStopWords();
        for (const char* w : {"using", "make", "more", "into", "over", "such",
                              "also", "some", "than", "them", "then", "very",
                              "well", "only", "just", "even"}) {
            all.emplace_back(w);
        }
        return all;
    }();
    return words;
}

std::string ExtractField(std::string_view text, std::string_view keyword,
                         std::string_view fallback) {
    const auto key = ToLower(keyword);
    for (auto line : SplitLines(text)) {
        if (ToLower(line).find(key) == std::string::npos) continue;
        auto colon = line.find(':');
        if (colon == std::string_view::npos) return "";
        return std::string(Trim(line.substr(colon + 1)));
    }
    return std::string(fallback);
}

double ExtractScore(std::string_view text, double fallback) {
    // Leftmost of "<n>/10" or "score<sep><n>", where <n> is digits with an
    // optional fraction and <sep> is one or more colons or spaces.
    std::string_view number;
    for (std::size_t i = 0; i < text.size() && number.empty(); ++i) {
        if (IsAsciiDigit(text[i])) {
            const auto end = ScanNumber(text, i);
            if (text.substr(end, 3) == "/10") {
                number = text.substr(i, end - i);
            }
            // Later starts inside the integer digits end at the same place.
            while (i + 1 < text.size() && IsAsciiDigit(text[i + 1])) ++i;
            continue;
        }
        if (i + 5 <= text.size() && ToLower(text.substr(i, 5)) == "score") {
            auto j = i + 5;
            while (j < text.size() &&
                   (text[j] == ':' || std::isspace(static_cast<unsigned char>(text[j])))) {
                ++j;
            }
            if (j > i + 5 && j < text.size() && IsAsciiDigit(text[j])) {
                number = text.substr(j, ScanNumber(text, j) - j);
            }
        }
    }
    if (number.empty()) return fallback;

    try {
        return std::stod(std::string(number));
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> ExtractList(std::string_view text,
                                     std::string_view keyword) {
    const auto key = ToLower(keyword);
    std::vector<std::string> items;
    for (auto line : SplitLines(text)) {
        if (ToLower(line).find(key) == std::string::npos) continue;
        if (auto item = StripBullet(line)) {
            items.emplace_back(*item);
        }
    }
    return items;
}

std::vector<CodeIssue> ExtractIssues(std::string_view text) {
    std::vector<CodeIssue> issues;
    for (auto line : SplitLines(text)) {
        auto lower = ToLower(line);
        if (lower.find("issue") == std::string::npos &&
            lower.find("problem") == std::string::npos) {
            continue;
        }
        issues.push_back(CodeIssue{"medium", "general",
                                   std::string(Trim(line)), std::nullopt});
    }
    return issues;
}

std::vector<Emotion> ExtractEmotions(std::string_view text) {
    static const char* const kEmotions[] = {
        "joy", "sadness", "anger", "fear", "surprise", "trust"};

    const auto lower = ToLower(text);
    std::vector<Emotion> emotions;
    for (const char* name : kEmotions) {
        if (lower.find(name) != std::string::npos) {
            emotions.push_back(Emotion{name, 0.5});
        }
    }
    return emotions;
}

std::string ExtractAnswer(std::string_view text) {
    const auto lines = SplitLines(text);
    for (auto line : lines) {
        if (ToLower(line).rfind("answer:", 0) == 0) {
            return std::string(Trim(line.substr(line.find(':') + 1)));
        }
    }

    std::string joined;
    for (std::size_t i = 0; i < lines.size() && i < 3; ++i) {
        if (i > 0) joined += ' ';
        joined.append(lines[i].data(), lines[i].size());
    }
    return std::string(Trim(joined));
}

std::vector<std::string> ExtractKeyTopics(std::string_view text) {
    std::vector<std::string> order;
    std::unordered_map<std::string, std::size_t> counts;

    std::istringstream iss{std::string(text)};
    std::string token;
    while (iss >> token) {
        auto clean = ToLower(TrimNonAlpha(token));
        if (clean.size() < 4) continue;
        if (counts[clean]++ == 0) {
            order.push_back(clean);
        }
    }

    std::vector<std::pair<std::string, std::size_t>> topics;
    for (const auto& word : order) {
        auto count = counts[word];
        if (count >= 2 && !IsStopWord(TopicStopWords(), word)) {
            topics.emplace_back(word, count);
        }
    }

    std::stable_sort(topics.begin(), topics.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<std::string> result;
    for (std::size_t i = 0; i < topics.size() && i < 5; ++i) {
        result.push_back(topics[i].first);
    }
    return result;
}

std::size_t CountWords(std::string_view text) {
    std::istringstream iss{std::string(text)};
    std::size_t count = 0;
    std::string token;
    while (iss >> token) ++count;
    return count;
}

} // namespace gemini_mcp
