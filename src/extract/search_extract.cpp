#include <gemini_mcp/extract/search_extract.hpp>

#include <gemini_mcp/core/text.hpp>

#include <algorithm>

namespace gemini_mcp {

namespace {

// An empty title or id would match every text; it never counts as a mention.
bool Mentions(std::string_view lowered_text, const std::string& needle) {
    if (needle.empty()) return false;
    return lowered_text.find(ToLower(needle)) != std::string_view::npos;
}

} // anonymous namespace

std::vector<SourceResult> ExtractResults(std::string_view text,
                                         const std::vector<Source>& sources) {
    const auto lowered = ToLower(text);

    std::vector<SourceResult> results;
    for (const auto& source : sources) {
        if (!Mentions(lowered, source.title) && !Mentions(lowered, source.id)) {
            continue;
        }
        results.push_back(SourceResult{source.id, source.title,
                                       ExtractExcerpt(text, source),
                                       kPlaceholderRelevance});
    }
    return results;
}

std::string ExtractExcerpt(std::string_view text, const Source& source) {
    if (!source.title.empty()) {
        std::size_t start = 0;
        while (start <= text.size()) {
            auto sep = text.find("\n\n", start);
            auto end = (sep == std::string_view::npos) ? text.size() : sep;
            auto paragraph = text.substr(start, end - start);
            if (ContainsIgnoreCase(paragraph, source.title)) {
                return TruncateChars(paragraph, kExcerptMaxChars);
            }
            if (sep == std::string_view::npos) break;
            start = sep + 2;
        }
    }
    return TruncateChars(source.content, kFallbackExcerptChars);
}

std::vector<Citation> ExtractCitations(std::string_view text,
                                       const std::vector<Source>& sources) {
    std::vector<Citation> citations;
    std::size_t open = text.find('"');
    while (open != std::string_view::npos) {
        const auto close = text.find('"', open + 1);
        if (close == std::string_view::npos) break;

        // A span shorter than the minimum leaves its closing quote free to
        // open the next span.
        if (close - open - 1 < kMinQuoteChars) {
            open = close;
            continue;
        }

        const std::string quote(text.substr(open + 1, close - open - 1));
        const auto lowered_quote = ToLower(quote);
        for (const auto& source : sources) {
            if (source.content.find(quote) != std::string::npos ||
                ToLower(source.content).find(lowered_quote) != std::string::npos) {
                citations.push_back(Citation{source.id, source.title, quote});
                break;
            }
        }
        open = text.find('"', close + 1);
    }
    return citations;
}

std::vector<SourceResult> RankResults(std::vector<SourceResult> results,
                                      const RankingOptions& options) {
    if (options.min_relevance.has_value()) {
        const double min = *options.min_relevance;
        results.erase(std::remove_if(results.begin(), results.end(),
                                     [min](const SourceResult& r) {
                                         return r.relevance_score < min;
                                     }),
                      results.end());
    }

    switch (options.criteria) {
        case RankingCriteria::Relevance:
        case RankingCriteria::Recency:
        case RankingCriteria::Popularity:
            std::stable_sort(results.begin(), results.end(),
                             [](const SourceResult& a, const SourceResult& b) {
                                 return a.relevance_score > b.relevance_score;
                             });
            break;
    }

    if (options.max_results.has_value() && results.size() > *options.max_results) {
        results.resize(*options.max_results);
    }
    return results;
}

} // namespace gemini_mcp
