#include <gemini_mcp/config/config_loader.hpp>

#include <gemini_mcp/core/log.hpp>
#include <gemini_mcp/core/version.hpp>
#include <gemini_mcp/gemini/i_generation_service.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>

namespace gemini_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, std::nullopt, std::nullopt,
                 ErrorCategory::Configuration};
}

std::optional<std::string> GetEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        YAML::Node root = YAML::LoadFile(std::string(file_path));
        if (!root.IsMap()) {
            if (root.IsNull()) {
                return Result<AppConfig, Error>::Ok(std::move(config));
            }
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Config file must contain a mapping: " +
                                std::string(file_path)));
        }

        if (root["api_key_env"]) {
            config.api_key_env = root["api_key_env"].as<std::string>();
        }
        if (root["api_key"]) {
            return Result<AppConfig, Error>::Err(MakeConfigError(
                "'api_key' is not accepted in config files; "
                "set api_key_env to the name of an environment variable"));
        }

        // -- Models --
        if (root["models"]) {
            const auto& models = root["models"];
            if (models["pro"]) {
                config.pro_model = models["pro"].as<std::string>();
            }
            if (models["flash"]) {
                config.flash_model = models["flash"].as<std::string>();
            }
        }

        // -- Options --
        if (root["timeout"]) {
            config.timeout_seconds = root["timeout"].as<int>();
        }
        if (root["log_level"]) {
            config.log_level = root["log_level"].as<std::string>();
        }
        if (root["log_json"]) {
            config.log_json = root["log_json"].as<bool>();
        }
        if (root["skip_connection_test"]) {
            config.skip_connection_test = root["skip_connection_test"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("gemini-mcp", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "MCP server exposing Gemini query, search, analysis, summarization "
        "and brainstorming tools over stdio.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--api-key-env")
        .help("Environment variable holding the Gemini API key (default: GEMINI_API_KEY)");
    program.add_argument("--pro-model")
        .help("Backend model id for the 'pro' variant");
    program.add_argument("--flash-model")
        .help("Backend model id for the 'flash' variant");
    program.add_argument("--timeout")
        .help("Backend read timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--skip-connection-test")
        .help("Do not contact Gemini at startup")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-json")
        .help("Write JSON log lines to stderr")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Debug logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Log errors only")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        // argparse reports unknown flags as runtime_error and bad numbers
        // from scan<> as invalid_argument.
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--api-key-env")) {
        config.api_key_env = *val;
    }
    if (auto val = program.present("--pro-model")) {
        config.pro_model = *val;
    }
    if (auto val = program.present("--flash-model")) {
        config.flash_model = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        config.timeout_seconds = *val;
    }
    config.skip_connection_test = program.get<bool>("--skip-connection-test");
    config.log_json = program.get<bool>("--log-json");
    config.verbose = program.get<bool>("--verbose");
    config.quiet = program.get<bool>("--quiet");
    config.show_version = program.get<bool>("--version");

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }
    if (cli_overrides.api_key_env.has_value()) {
        merged.api_key_env = cli_overrides.api_key_env;
    }
    if (!cli_overrides.api_key.empty()) {
        merged.api_key = cli_overrides.api_key;
    }
    if (cli_overrides.pro_model.has_value()) {
        merged.pro_model = cli_overrides.pro_model;
    }
    if (cli_overrides.flash_model.has_value()) {
        merged.flash_model = cli_overrides.flash_model;
    }
    if (cli_overrides.timeout_seconds.has_value()) {
        merged.timeout_seconds = cli_overrides.timeout_seconds;
    }
    if (cli_overrides.log_level.has_value()) {
        merged.log_level = cli_overrides.log_level;
    }

    // Flags only ever switch behavior on.
    if (cli_overrides.log_json) {
        merged.log_json = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.skip_connection_test) {
        merged.skip_connection_test = true;
    }
    if (cli_overrides.show_version) {
        merged.show_version = true;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveEnvironment
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveEnvironment(AppConfig config) {
    if (!config.pro_model.has_value()) {
        config.pro_model = GetEnv(kProModelEnv).value_or(kDefaultProModel);
    }
    if (!config.flash_model.has_value()) {
        config.flash_model = GetEnv(kFlashModelEnv).value_or(kDefaultFlashModel);
    }
    if (!config.timeout_seconds.has_value()) {
        config.timeout_seconds = kDefaultTimeoutSeconds;
    }

    if (config.api_key.empty()) {
        const auto env_var = config.api_key_env.value_or(kDefaultApiKeyEnv);
        auto key = GetEnv(env_var);
        if (!key.has_value()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Environment variable '" + env_var +
                                "' not set (Gemini API key)"));
        }
        config.api_key = *key;
        config.api_key_env = env_var;
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.api_key.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing Gemini API key"));
    }
    if (config.pro_model.has_value() && config.pro_model->empty()) {
        return Result<void, Error>::Err(MakeConfigError("Pro model id must not be empty"));
    }
    if (config.flash_model.has_value() && config.flash_model->empty()) {
        return Result<void, Error>::Err(MakeConfigError("Flash model id must not be empty"));
    }
    if (config.timeout_seconds.has_value() && *config.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " +
                            std::to_string(*config.timeout_seconds)));
    }
    if (config.log_level.has_value() && !ParseLogLevel(*config.log_level).has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid log_level '" + *config.log_level +
                            "': expected debug, info, warn or error"));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

} // namespace gemini_mcp
