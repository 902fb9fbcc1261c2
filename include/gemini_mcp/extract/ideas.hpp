#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace gemini_mcp {

struct Idea {
    std::size_t id = 0;
    std::string text;
};

struct ConsensusTheme {
    std::string theme;
    std::size_t frequency = 0;
    std::vector<std::size_t> related_ideas;
};

// Share of ideas (percent) a keyword must appear in to count as a consensus
// theme. The resulting idea count is rounded up.
constexpr std::size_t kConsensusPercent = 30;
constexpr std::size_t kMaxConsensusThemes = 10;

/// Parse a numbered list. Each line of the form "<digits>[.] <text>" opens a
/// new idea; ids are assigned 1, 2, 3, ... in order of appearance regardless
/// of the number the model wrote. Other non-empty lines are continuations of
/// the most recent idea, joined with a single space.
std::vector<Idea> ParseIdeas(std::string_view text);

/// Keywords (4+ letters, stop words removed) shared by at least
/// ceil(kConsensusPercent% of ideas.size()) ideas, most shared first.
/// Equal frequencies keep first-seen order. At most kMaxConsensusThemes.
std::vector<ConsensusTheme> ExtractConsensusThemes(const std::vector<Idea>& ideas);

} // namespace gemini_mcp
