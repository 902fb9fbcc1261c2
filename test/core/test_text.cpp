#include <catch2/catch_test_macros.hpp>

#include <gemini_mcp/core/text.hpp>

#include <string>

using namespace gemini_mcp;

TEST_CASE("ToLower: folds ASCII only", "[core][text]") {
    CHECK(ToLower("Hello WORLD") == "hello world");
    CHECK(ToLower("\xC3\x84") == "\xC3\x84");
}

TEST_CASE("Trim: strips surrounding whitespace", "[core][text]") {
    CHECK(Trim("  abc \t\n") == "abc");
    CHECK(Trim("   ").empty());
    CHECK(Trim("a b") == "a b");
}

TEST_CASE("SplitLines: handles CRLF and trailing newline", "[core][text]") {
    auto lines = SplitLines("one\r\ntwo\n\nthree\n");
    REQUIRE(lines.size() == 4);
    CHECK(lines[0] == "one");
    CHECK(lines[1] == "two");
    CHECK(lines[2].empty());
    CHECK(lines[3] == "three");
}

TEST_CASE("SplitLines: empty input yields no lines", "[core][text]") {
    CHECK(SplitLines("").empty());
}

TEST_CASE("ContainsIgnoreCase: case-insensitive match", "[core][text]") {
    CHECK(ContainsIgnoreCase("The Rust Book", "rust book"));
    CHECK_FALSE(ContainsIgnoreCase("The Rust Book", "go"));
    CHECK(ContainsIgnoreCase("anything", ""));
}

TEST_CASE("TruncateChars: counts code points, not bytes", "[core][text]") {
    CHECK(TruncateChars("abcdef", 3) == "abc");
    CHECK(TruncateChars("ab", 5) == "ab");
    // "héllo": é is two bytes.
    CHECK(TruncateChars("h\xC3\xA9llo", 2) == "h\xC3\xA9");
}

// ===========================================================================
// SanitizeUtf8
// ===========================================================================

TEST_CASE("SanitizeUtf8: valid text is unchanged", "[core][text]") {
    const std::string text = "caf\xC3\xA9 \xE2\x80\xA2 \xF0\x9F\x98\x80 plain";
    CHECK(SanitizeUtf8(text) == text);
}

TEST_CASE("SanitizeUtf8: invalid bytes become U+FFFD", "[core][text]") {
    CHECK(SanitizeUtf8("d\xE9" "faillante") == "d\xEF\xBF\xBD" "faillante");
    CHECK(SanitizeUtf8("\xC3") == "\xEF\xBF\xBD");
    CHECK(SanitizeUtf8("\xC0\xAF") == "\xEF\xBF\xBD\xEF\xBF\xBD");
    CHECK(SanitizeUtf8("\xED\xA0\x80").find("\xED") == std::string::npos);
}

