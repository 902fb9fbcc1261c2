#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gemini_mcp {

// ---------------------------------------------------------------------------
// Source: caller-supplied document searched by the search tool.
// ---------------------------------------------------------------------------
struct Source {
    std::string id;
    std::string title;
    std::string content;
};

struct SourceResult {
    std::string source_id;
    std::string source_title;
    std::string excerpt;
    double relevance_score = 0.0;
};

struct Citation {
    std::string source_id;
    std::string source_title;
    std::string quote;
};

enum class RankingCriteria {
    Relevance,
    Recency,
    Popularity,
};

struct RankingOptions {
    RankingCriteria criteria = RankingCriteria::Relevance;
    std::optional<double> min_relevance;
    std::optional<std::size_t> max_results;
};

// Score assigned to every mentioned source. The model is asked for scores
// but they are not parsed; this constant stands in until they are.
constexpr double kPlaceholderRelevance = 0.7;

constexpr std::size_t kExcerptMaxChars = 200;
constexpr std::size_t kFallbackExcerptChars = 100;
constexpr std::size_t kMinQuoteChars = 20;

/// One result per source whose title or id the model mentions
/// (case-insensitive), in source order.
std::vector<SourceResult> ExtractResults(std::string_view text,
                                         const std::vector<Source>& sources);

/// First blank-line-delimited paragraph of `text` naming the source's title,
/// cut to kExcerptMaxChars; else the start of the source's own content.
std::string ExtractExcerpt(std::string_view text, const Source& source);

/// Double-quoted spans of at least kMinQuoteChars characters, each attributed
/// to the first source containing it. Unattributable quotes are dropped.
std::vector<Citation> ExtractCitations(std::string_view text,
                                       const std::vector<Source>& sources);

/// Filter by min_relevance, order, then truncate to max_results.
/// Recency and popularity have no per-source signal yet and order by
/// relevance as well.
std::vector<SourceResult> RankResults(std::vector<SourceResult> results,
                                      const RankingOptions& options);

} // namespace gemini_mcp
