#include <gemini_mcp/core/result.hpp>

#include <gemini_mcp/core/text.hpp>

#include <nlohmann/json.hpp>

namespace gemini_mcp {

namespace {

// Google APIs report failures as {"error":{"code":..,"message":..,"status":..}}.
std::optional<std::string> ExtractApiMessage(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;

    auto it = parsed.find("error");
    if (it == parsed.end() || !it->is_object()) return std::nullopt;

    auto msg = it->find("message");
    if (msg == it->end() || !msg->is_string()) return std::nullopt;

    auto text = msg->get<std::string>();
    if (text.empty()) return std::nullopt;
    return text;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            int status_code,
                            const std::string& response_body) {
    auto api_message = ExtractApiMessage(response_body);

    std::optional<std::string> detail = api_message;
    if (!detail.has_value() && !response_body.empty()) {
        // Proxies may answer with Latin-1 pages; detail ends up in JSON.
        detail = SanitizeUtf8(response_body);
    }

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::Api;
            message = "Bad request";
            break;
        case 401:
        case 403:
            category = ErrorCategory::Authentication;
            message = "Authentication failed - check the API key";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Model or endpoint not found";
            break;
        case 408:
        case 504:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 429:
            category = ErrorCategory::RateLimit;
            message = "Too many requests - retry later";
            break;
        case 500:
            category = ErrorCategory::Api;
            message = "Backend internal error";
            break;
        case 502:
        case 503:
            category = ErrorCategory::Connection;
            message = "Backend unavailable";
            break;
        default:
            category = ErrorCategory::Api;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, message, status_code, detail, category};
}

} // namespace gemini_mcp
