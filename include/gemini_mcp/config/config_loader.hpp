#pragma once

#include <gemini_mcp/config/app_config.hpp>
#include <gemini_mcp/core/result.hpp>

#include <string_view>

namespace gemini_mcp {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: fields set in cli_overrides replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Fill unset model ids from GEMINI_PRO_MODEL / GEMINI_FLASH_MODEL, then from
// built-in defaults, and read the API key from the variable named by
// api_key_env (default GEMINI_API_KEY). A missing or empty key is an error.
Result<AppConfig, Error> ResolveEnvironment(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace gemini_mcp
