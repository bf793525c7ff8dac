#include <mcp_agent/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace mcp_agent {

namespace {

// Anthropic error bodies look like
//   {"type":"error","error":{"type":"overloaded_error","message":"Overloaded"}}
std::optional<std::string> ExtractApiError(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;

    auto it = parsed.find("error");
    if (it == parsed.end()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (!it->is_object()) return std::nullopt;

    auto msg = it->find("message");
    if (msg == it->end() || !msg->is_string()) return std::nullopt;
    auto text = msg->get<std::string>();
    if (text.empty()) return std::nullopt;

    auto type = it->find("type");
    if (type != it->end() && type->is_string()) {
        return type->get<std::string>() + ": " + text;
    }
    return text;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto api_error = ExtractApiError(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::Completion;
            message = "Invalid request";
            break;
        case 401:
            category = ErrorCategory::Authentication;
            message = "Authentication failed - check the API key";
            break;
        case 403:
            category = ErrorCategory::Authentication;
            message = "Permission denied for this API key";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Not found - check the model identifier and base URL";
            break;
        case 408:
        case 504:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 413:
            category = ErrorCategory::Completion;
            message = "Request too large";
            break;
        case 429:
            category = ErrorCategory::RateLimited;
            message = "Rate limited - retry later";
            break;
        case 529:
            category = ErrorCategory::RateLimited;
            message = "Completion service overloaded";
            break;
        case 500:
        case 502:
        case 503:
            category = ErrorCategory::Completion;
            message = "Completion service unavailable";
            break;
        default:
            category = ErrorCategory::Completion;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, endpoint, status_code, message, api_error, category};
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    if (detail.has_value() && !detail->empty()) {
        oss << " (" << *detail << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
    };
    if (!endpoint.empty()) {
        body["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        body["http_status"] = *http_status;
    }
    if (detail.has_value() && !detail->empty()) {
        body["detail"] = *detail;
    }
    body["exit_code"] = ExitCode();

    nlohmann::json root = {{"error", std::move(body)}};
    return root.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace mcp_agent
