#include <catch2/catch_test_macros.hpp>

#include <gemini_mcp/core/log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace gemini_mcp;

// ===========================================================================
// Helper: a sink that keeps copies of every record.
// ===========================================================================

namespace {

struct CapturedRecord {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<CapturedRecord>& out) : out_(out) {}

    void Write(const LogRecord& record) override {
        out_.push_back({record.level, std::string(record.component),
                        std::string(record.message)});
    }

private:
    std::vector<CapturedRecord>& out_;
};

LogRecord MakeRecord(LogLevel level, std::string_view component,
                     std::string_view message) {
    return LogRecord{std::chrono::system_clock::now(), level, component, message};
}

} // anonymous namespace

// ===========================================================================
// Levels
// ===========================================================================

TEST_CASE("ParseLogLevel: known names in any case", "[log]") {
    CHECK(ParseLogLevel("debug") == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO") == LogLevel::Info);
    CHECK(ParseLogLevel("warn") == LogLevel::Warn);
    CHECK(ParseLogLevel("Warning") == LogLevel::Warn);
    CHECK(ParseLogLevel("error") == LogLevel::Error);
}

TEST_CASE("ParseLogLevel: unknown names are rejected", "[log]") {
    CHECK_FALSE(ParseLogLevel("").has_value());
    CHECK_FALSE(ParseLogLevel("trace").has_value());
}

TEST_CASE("LogLevelName: upper-case names", "[log]") {
    CHECK(std::string(LogLevelName(LogLevel::Warn)) == "WARN");
    CHECK(std::string(LogLevelName(LogLevel::Error)) == "ERROR");
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: one parseable object per line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(MakeRecord(LogLevel::Info, "mcp", "Calling tool: gemini-query"));
    sink.Write(MakeRecord(LogLevel::Warn, "gemini", "HTTP 429"));

    std::istringstream lines(oss.str());
    std::string line;
    std::vector<nlohmann::json> parsed;
    while (std::getline(lines, line)) {
        parsed.push_back(nlohmann::json::parse(line));
    }
    REQUIRE(parsed.size() == 2);
    CHECK(parsed[0]["level"] == "INFO");
    CHECK(parsed[0]["component"] == "mcp");
    CHECK(parsed[0]["message"] == "Calling tool: gemini-query");
    CHECK(parsed[0]["ts"].get<std::string>().back() == 'Z');
    CHECK(parsed[1]["level"] == "WARN");
}

TEST_CASE("JsonSink: quotes and newlines survive the round trip", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(MakeRecord(LogLevel::Error, "test", "say \"hi\"\nbye"));

    auto text = oss.str();
    CHECK(text.find('\n') == text.size() - 1);
    CHECK(nlohmann::json::parse(text)["message"] == "say \"hi\"\nbye");
}

// ===========================================================================
// TextSink
// ===========================================================================

TEST_CASE("TextSink: plain mode has level and component", "[log]") {
    std::ostringstream oss;
    TextSink sink(false, oss);

    sink.Write(MakeRecord(LogLevel::Warn, "config", "fallback used"));

    auto line = oss.str();
    CHECK(line.find("Z [WARN] [config] fallback used\n") != std::string::npos);
    CHECK(line.find("\033[") == std::string::npos);
}

TEST_CASE("TextSink: color mode emits ANSI escapes", "[log]") {
    std::ostringstream oss;
    TextSink sink(true, oss);

    sink.Write(MakeRecord(LogLevel::Error, "main", "boom"));

    auto line = oss.str();
    CHECK(line.find("\033[31m") != std::string::npos);
    CHECK(line.find("[main]") != std::string::npos);
    CHECK(line.find("boom") != std::string::npos);
}

TEST_CASE("StderrWantsColor: NO_COLOR disables color", "[log]") {
    setenv("NO_COLOR", "1", 1);
    CHECK_FALSE(StderrWantsColor());
    unsetenv("NO_COLOR");
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: drops records below the minimum level", "[log]") {
    std::vector<CapturedRecord> captured;
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Warn);

    logger.Log(LogLevel::Debug, "c", "d");
    logger.Log(LogLevel::Info, "c", "i");
    logger.Log(LogLevel::Warn, "c", "w");
    logger.Log(LogLevel::Error, "c", "e");

    REQUIRE(captured.size() == 2);
    CHECK(captured[0].level == LogLevel::Warn);
    CHECK(captured[1].level == LogLevel::Error);
    CHECK_FALSE(logger.Enabled(LogLevel::Info));
    CHECK(logger.Enabled(LogLevel::Error));
}

TEST_CASE("Logger: SetLevel changes filtering", "[log]") {
    std::vector<CapturedRecord> captured;
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Error);

    logger.Log(LogLevel::Info, "c", "hidden");
    logger.SetLevel(LogLevel::Debug);
    logger.Log(LogLevel::Debug, "search", "results=2");

    REQUIRE(captured.size() == 1);
    CHECK(captured[0].component == "search");
    CHECK(captured[0].message == "results=2");
}

TEST_CASE("Logger: concurrent logging keeps every record", "[log]") {
    std::vector<CapturedRecord> captured;
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Debug);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < 100; ++i) {
                logger.Log(LogLevel::Info, "thread", std::to_string(t * 100 + i));
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(captured.size() == 400);
}

TEST_CASE("Global logger: free functions reach the installed sink", "[log]") {
    std::vector<CapturedRecord> captured;
    InitGlobalLogger(std::make_unique<CaptureSink>(captured), LogLevel::Info);

    LogDebug("g", "dropped");
    LogInfo("g", "kept");
    LogWarn("g", "warned");
    LogError("g", "failed");

    REQUIRE(captured.size() == 3);
    CHECK(captured[0].message == "kept");
    CHECK(captured[2].level == LogLevel::Error);

    // Do not leave the global logger pointing at this test's vector.
    static std::ostringstream discard;
    InitGlobalLogger(std::make_unique<JsonSink>(discard), LogLevel::Error);
}
