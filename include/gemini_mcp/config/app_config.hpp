#pragma once

#include <optional>
#include <string>

namespace gemini_mcp {

constexpr const char* kDefaultApiKeyEnv = "GEMINI_API_KEY";
constexpr const char* kProModelEnv = "GEMINI_PRO_MODEL";
constexpr const char* kFlashModelEnv = "GEMINI_FLASH_MODEL";
constexpr int kDefaultTimeoutSeconds = 120;

// ---------------------------------------------------------------------------
// AppConfig: server settings from CLI, YAML and environment.
//
// Optional fields are unset until a source provides them; ResolveEnvironment
// fills the remaining gaps from the environment and built-in defaults.
// ---------------------------------------------------------------------------
struct AppConfig {
    std::optional<std::string> config_file;
    std::optional<std::string> api_key_env;  // name of the variable, never the key
    std::string api_key;                     // only ever read from the environment
    std::optional<std::string> pro_model;
    std::optional<std::string> flash_model;
    std::optional<int> timeout_seconds;      // backend read timeout
    std::optional<std::string> log_level;    // debug | info | warn | error
    bool log_json = false;
    bool verbose = false;
    bool quiet = false;
    bool skip_connection_test = false;
    bool show_version = false;
};

} // namespace gemini_mcp
