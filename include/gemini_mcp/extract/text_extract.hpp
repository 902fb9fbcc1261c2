#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gemini_mcp {

// ---------------------------------------------------------------------------
// Heuristic extraction over free-text model output.
//
// All functions here are pure: text in, structure out. The model is asked for
// a "structured format" but nothing guarantees it; these helpers recover what
// they can from surface patterns and fall back to caller-supplied defaults.
// ---------------------------------------------------------------------------

struct CodeIssue {
    std::string severity;
    std::string category;
    std::string description;
    std::optional<std::string> location;
};

struct Emotion {
    std::string name;
    double intensity = 0.0;
};

/// Value after the first ':' on the first line whose lowercase form contains
/// `keyword`, trimmed. Empty if that line has no ':'. No such line → fallback.
std::string ExtractField(std::string_view text, std::string_view keyword,
                         std::string_view fallback);

/// First "<n>/10" or "score: <n>" (case-insensitive) as a number, else fallback.
double ExtractScore(std::string_view text, double fallback);

/// Bullet lines ('-', '*' or '•', optionally indented) whose lowercase form
/// contains `keyword`, with the marker and surrounding whitespace removed.
std::vector<std::string> ExtractList(std::string_view text,
                                     std::string_view keyword);

/// Every line mentioning "issue" or "problem" as a medium/general issue.
std::vector<CodeIssue> ExtractIssues(std::string_view text);

/// Fixed emotion vocabulary detected anywhere in the text, intensity 0.5.
std::vector<Emotion> ExtractEmotions(std::string_view text);

/// The "Answer:" line if present, otherwise the first three lines joined.
std::string ExtractAnswer(std::string_view text);

/// Up to five frequent (>= 2 occurrences) words of 4+ letters, stop words
/// removed, most frequent first; ties keep first-seen order.
std::vector<std::string> ExtractKeyTopics(std::string_view text);

/// Number of whitespace-separated tokens.
std::size_t CountWords(std::string_view text);

// Stop-word lists. Key topics use the short list; consensus themes extend it
// with filler words common in brainstormed ideas.
const std::vector<std::string>& TopicStopWords();
const std::vector<std::string>& ThemeStopWords();

} // namespace gemini_mcp
