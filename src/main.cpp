#include <gemini_mcp/config/config_loader.hpp>
#include <gemini_mcp/core/log.hpp>
#include <gemini_mcp/core/version.hpp>
#include <gemini_mcp/gemini/gemini_client.hpp>
#include <gemini_mcp/mcp/mcp_server.hpp>
#include <gemini_mcp/mcp/mcp_tool_handlers.hpp>
#include <gemini_mcp/mcp/tool_registry.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;

// Startup errors go straight to stderr: the logger may not exist yet and
// stdout is reserved for protocol traffic.
void PrintError(const gemini_mcp::Error& error) {
    std::cerr << "gemini-mcp: " << error.ToString() << "\n";
}

gemini_mcp::LogLevel ResolveLogLevel(const gemini_mcp::AppConfig& config) {
    using gemini_mcp::LogLevel;
    if (config.verbose) return LogLevel::Debug;
    if (config.quiet) return LogLevel::Error;
    if (config.log_level.has_value()) {
        return gemini_mcp::ParseLogLevel(*config.log_level).value_or(LogLevel::Info);
    }
    return LogLevel::Info;
}

void InitLogging(const gemini_mcp::AppConfig& config) {
    using namespace gemini_mcp;
    auto level = ResolveLogLevel(config);
    if (config.log_json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), level);
        return;
    }
    InitGlobalLogger(std::make_unique<TextSink>(StderrWantsColor()), level);
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace gemini_mcp;

    // Step 1: Parse CLI args (argparse handles --help).
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error());
        return cli_result.Error().ExitCode();
    }
    auto config = std::move(cli_result).Value();

    if (config.show_version) {
        std::cout << "gemini-mcp " << kVersion << "\n";
        return kExitSuccess;
    }

    // Step 2: Load YAML config if -c/--config provided; CLI wins.
    if (config.config_file.has_value()) {
        auto yaml_result = LoadFromYaml(*config.config_file);
        if (yaml_result.IsErr()) {
            PrintError(yaml_result.Error());
            return yaml_result.Error().ExitCode();
        }
        config = MergeConfigs(std::move(yaml_result).Value(), config);
    }

    InitLogging(config);

    // Step 3: Environment (API key, model ids) and validation.
    auto resolved = ResolveEnvironment(std::move(config));
    if (resolved.IsErr()) {
        PrintError(resolved.Error());
        return resolved.Error().ExitCode();
    }
    config = std::move(resolved).Value();

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    LogInfo("main", std::string("gemini-mcp ") + kVersion + " starting");

    // Step 4: Gemini client, optionally verified before serving.
    GeminiClientOptions options;
    options.pro_model = *config.pro_model;
    options.flash_model = *config.flash_model;
    options.read_timeout = std::chrono::seconds(*config.timeout_seconds);
    auto client = std::make_unique<GeminiClient>(config.api_key, options);

    if (!config.skip_connection_test) {
        auto connected = client->TestConnection();
        if (connected.IsErr()) {
            PrintError(connected.Error());
            return connected.Error().ExitCode();
        }
    }

    // Step 5: Tool catalog and the stdio loop.
    ToolRegistry registry;
    RegisterGeminiTools(registry, *client);

    McpServer server(std::move(registry));
    server.Run();

    return kExitSuccess;
}
