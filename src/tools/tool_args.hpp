#pragma once

#include <gemini_mcp/core/result.hpp>
#include <gemini_mcp/core/text.hpp>
#include <gemini_mcp/gemini/i_generation_service.hpp>
#include <gemini_mcp/tools/tool_types.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

// Argument decoding shared by the tool executors. Absent or null fields fall
// back to defaults; present fields of the wrong type are rejected so that a
// caller typo never silently turns into a default.
namespace gemini_mcp::tool_args {

inline Error InvalidType(std::string_view operation, std::string_view key,
                         std::string_view expected) {
    return Error::InvalidInput(
        std::string(operation),
        "Invalid parameter '" + std::string(key) + "': expected " +
            std::string(expected));
}

inline bool IsAbsent(const nlohmann::json& args, const char* key) {
    return !args.is_object() || !args.contains(key) || args[key].is_null();
}

inline Result<std::string, Error> RequireString(const nlohmann::json& args,
                                                const char* key,
                                                std::string_view operation) {
    if (IsAbsent(args, key)) {
        return Result<std::string, Error>::Err(Error::InvalidInput(
            std::string(operation),
            "Missing required parameter: " + std::string(key)));
    }
    if (!args[key].is_string()) {
        return Result<std::string, Error>::Err(InvalidType(operation, key, "string"));
    }
    return Result<std::string, Error>::Ok(args[key].get<std::string>());
}

inline Result<std::optional<std::string>, Error> OptString(
    const nlohmann::json& args, const char* key, std::string_view operation) {
    using R = Result<std::optional<std::string>, Error>;
    if (IsAbsent(args, key)) return R::Ok(std::nullopt);
    if (!args[key].is_string()) return R::Err(InvalidType(operation, key, "string"));
    return R::Ok(args[key].get<std::string>());
}

inline Result<std::optional<double>, Error> OptNumber(
    const nlohmann::json& args, const char* key, std::string_view operation) {
    using R = Result<std::optional<double>, Error>;
    if (IsAbsent(args, key)) return R::Ok(std::nullopt);
    if (!args[key].is_number()) return R::Err(InvalidType(operation, key, "number"));
    return R::Ok(args[key].get<double>());
}

inline Result<std::optional<int64_t>, Error> OptInteger(
    const nlohmann::json& args, const char* key, std::string_view operation) {
    using R = Result<std::optional<int64_t>, Error>;
    if (IsAbsent(args, key)) return R::Ok(std::nullopt);
    if (!args[key].is_number_integer()) {
        return R::Err(InvalidType(operation, key, "integer"));
    }
    return R::Ok(args[key].get<int64_t>());
}

inline Result<std::optional<uint32_t>, Error> OptCount(
    const nlohmann::json& args, const char* key, std::string_view operation) {
    using R = Result<std::optional<uint32_t>, Error>;
    auto value = OptInteger(args, key, operation);
    if (value.IsErr()) return R::Err(value.Error());
    if (!value.Value().has_value()) return R::Ok(std::nullopt);
    auto n = *value.Value();
    if (n < 0 || n > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        return R::Err(InvalidType(operation, key, "non-negative integer"));
    }
    return R::Ok(static_cast<uint32_t>(n));
}

inline Result<bool, Error> OptBool(const nlohmann::json& args, const char* key,
                                   bool default_val, std::string_view operation) {
    if (IsAbsent(args, key)) return Result<bool, Error>::Ok(default_val);
    if (!args[key].is_boolean()) {
        return Result<bool, Error>::Err(InvalidType(operation, key, "boolean"));
    }
    return Result<bool, Error>::Ok(args[key].get<bool>());
}

inline Result<std::optional<std::vector<std::string>>, Error> OptStringArray(
    const nlohmann::json& args, const char* key, std::string_view operation) {
    using R = Result<std::optional<std::vector<std::string>>, Error>;
    if (IsAbsent(args, key)) return R::Ok(std::nullopt);
    if (!args[key].is_array()) return R::Err(InvalidType(operation, key, "array of strings"));
    std::vector<std::string> values;
    for (const auto& item : args[key]) {
        if (!item.is_string()) {
            return R::Err(InvalidType(operation, key, "array of strings"));
        }
        values.push_back(item.get<std::string>());
    }
    return R::Ok(std::move(values));
}

/// Optional object-valued field; returns nullopt when absent.
inline Result<std::optional<nlohmann::json>, Error> OptObject(
    const nlohmann::json& args, const char* key, std::string_view operation) {
    using R = Result<std::optional<nlohmann::json>, Error>;
    if (IsAbsent(args, key)) return R::Ok(std::nullopt);
    if (!args[key].is_object()) return R::Err(InvalidType(operation, key, "object"));
    return R::Ok(std::optional<nlohmann::json>(args[key]));
}

/// "model": "pro" | "flash". Absent means the caller has no preference.
inline Result<std::optional<ModelVariant>, Error> OptModel(
    const nlohmann::json& args, std::string_view operation) {
    using R = Result<std::optional<ModelVariant>, Error>;
    auto name = OptString(args, "model", operation);
    if (name.IsErr()) return R::Err(name.Error());
    if (!name.Value().has_value()) return R::Ok(std::nullopt);

    const auto lowered = ToLower(*name.Value());
    if (lowered == "pro") return R::Ok(ModelVariant::Pro);
    if (lowered == "flash") return R::Ok(ModelVariant::Flash);
    return R::Err(Error::InvalidInput(
        std::string(operation),
        "Invalid model '" + *name.Value() + "': expected 'pro' or 'flash'"));
}

/// "params": {temperature, max_tokens, top_p, top_k}.
inline Result<std::optional<GenerationParams>, Error> OptParams(
    const nlohmann::json& args, std::string_view operation) {
    using R = Result<std::optional<GenerationParams>, Error>;
    auto obj = OptObject(args, "params", operation);
    if (obj.IsErr()) return R::Err(obj.Error());
    if (!obj.Value().has_value()) return R::Ok(std::nullopt);
    const auto& p = *obj.Value();

    GenerationParams params;
    auto temperature = OptNumber(p, "temperature", operation);
    if (temperature.IsErr()) return R::Err(temperature.Error());
    params.temperature = temperature.Value();

    auto max_tokens = OptCount(p, "max_tokens", operation);
    if (max_tokens.IsErr()) return R::Err(max_tokens.Error());
    params.max_tokens = max_tokens.Value();

    auto top_p = OptNumber(p, "top_p", operation);
    if (top_p.IsErr()) return R::Err(top_p.Error());
    params.top_p = top_p.Value();

    auto top_k = OptCount(p, "top_k", operation);
    if (top_k.IsErr()) return R::Err(top_k.Error());
    params.top_k = top_k.Value();

    return R::Ok(params);
}

/// Reject blank required text before any backend call.
inline Result<void, Error> RequireNonBlank(const std::string& value,
                                           std::string_view operation,
                                           const std::string& message) {
    if (Trim(value).empty()) {
        return Result<void, Error>::Err(
            Error::InvalidInput(std::string(operation), message));
    }
    return Result<void, Error>::Ok();
}

} // namespace gemini_mcp::tool_args
