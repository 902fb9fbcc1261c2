#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace gemini_mcp {

// ASCII lowercase copy. Non-ASCII bytes are passed through unchanged.
std::string ToLower(std::string_view s);

// Strip leading and trailing whitespace.
std::string_view Trim(std::string_view s);

// Split on '\n', dropping a trailing '\r' from each line. A final newline
// does not produce an empty last line.
std::vector<std::string_view> SplitLines(std::string_view text);

// Case-insensitive substring test (ASCII folding).
bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle);

// Copy of s with every invalid UTF-8 sequence replaced by U+FFFD.
std::string SanitizeUtf8(std::string_view s);

// First max_chars UTF-8 code points of s.
std::string TruncateChars(std::string_view s, std::size_t max_chars);

} // namespace gemini_mcp
