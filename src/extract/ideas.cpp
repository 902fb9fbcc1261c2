#include <gemini_mcp/extract/ideas.hpp>

#include <gemini_mcp/core/text.hpp>
#include <gemini_mcp/extract/text_extract.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace gemini_mcp {

namespace {

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

bool IsWordChar(char c) {
    return IsDigit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

// "<ws><digits>[.]<ws><text>" with non-empty text. Returns the text.
std::optional<std::string_view> MatchIdeaLine(std::string_view line) {
    std::size_t i = 0;
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;

    const auto digits_begin = i;
    while (i < line.size() && IsDigit(line[i])) ++i;
    if (i == digits_begin) return std::nullopt;

    if (i < line.size() && line[i] == '.') ++i;

    auto text = Trim(line.substr(i));
    if (text.empty()) return std::nullopt;
    return text;
}

// Maximal runs of word characters that are all lowercase letters and at
// least four long.
std::vector<std::string_view> ThemeWords(std::string_view lowered) {
    std::vector<std::string_view> words;
    std::size_t i = 0;
    while (i < lowered.size()) {
        if (!IsWordChar(lowered[i])) {
            ++i;
            continue;
        }
        const auto begin = i;
        bool letters_only = true;
        while (i < lowered.size() && IsWordChar(lowered[i])) {
            if (lowered[i] < 'a' || lowered[i] > 'z') letters_only = false;
            ++i;
        }
        if (letters_only && i - begin >= 4) {
            words.push_back(lowered.substr(begin, i - begin));
        }
    }
    return words;
}

} // anonymous namespace

std::vector<Idea> ParseIdeas(std::string_view text) {
    std::vector<Idea> ideas;
    std::size_t next_id = 1;

    for (auto line : SplitLines(text)) {
        if (auto idea_text = MatchIdeaLine(line)) {
            ideas.push_back(Idea{next_id++, std::string(*idea_text)});
            continue;
        }

        auto continuation = Trim(line);
        if (continuation.empty() || ideas.empty()) continue;

        auto& last = ideas.back();
        last.text += ' ';
        last.text.append(continuation.data(), continuation.size());
    }

    return ideas;
}

std::vector<ConsensusTheme> ExtractConsensusThemes(const std::vector<Idea>& ideas) {
    // keyword -> ids of the ideas that mention it, in first-seen order
    std::vector<std::string> order;
    std::unordered_map<std::string, std::vector<std::size_t>> keyword_ideas;

    for (const auto& idea : ideas) {
        const auto lowered = ToLower(idea.text);
        std::unordered_set<std::string> seen_in_idea;

        for (auto view : ThemeWords(lowered)) {
            std::string word(view);
            if (!seen_in_idea.insert(word).second) continue;

            auto& ids = keyword_ideas[word];
            if (ids.empty()) order.push_back(word);
            ids.push_back(idea.id);
        }
    }

    const auto threshold = (ideas.size() * kConsensusPercent + 99) / 100;
    const auto& stop_words = ThemeStopWords();

    std::vector<ConsensusTheme> themes;
    for (const auto& word : order) {
        const auto& ids = keyword_ideas[word];
        if (ids.size() < threshold) continue;
        if (std::find(stop_words.begin(), stop_words.end(), word) != stop_words.end()) {
            continue;
        }
        themes.push_back(ConsensusTheme{word, ids.size(), ids});
    }

    std::stable_sort(themes.begin(), themes.end(),
                     [](const ConsensusTheme& a, const ConsensusTheme& b) {
                         return a.frequency > b.frequency;
                     });

    if (themes.size() > kMaxConsensusThemes) {
        themes.resize(kMaxConsensusThemes);
    }
    return themes;
}

} // namespace gemini_mcp
