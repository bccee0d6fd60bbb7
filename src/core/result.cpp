#include <portainer_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace portainer_mcp {

namespace {

// Portainer reports failures as {"message": "...", "details": "..."}.
// Prefer "details" when both are present, it carries the root cause.
std::optional<std::string> ExtractBackendError(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    std::string message;
    std::string details;
    if (j.contains("message") && j["message"].is_string()) {
        message = j["message"].get<std::string>();
    }
    if (j.contains("details") && j["details"].is_string()) {
        details = j["details"].get<std::string>();
    }

    if (!message.empty() && !details.empty() && message != details) {
        return message + ": " + details;
    }
    if (!details.empty()) return details;
    if (!message.empty()) return message;
    return std::nullopt;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto backend_error = ExtractBackendError(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::Internal;
            message = "Bad request";
            break;
        case 401:
            category = ErrorCategory::Authentication;
            message = "Authentication failed, check the API token";
            break;
        case 403:
            category = ErrorCategory::Authentication;
            message = "Access denied for this API token";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Not found";
            break;
        case 409:
            category = ErrorCategory::Conflict;
            message = "Conflict";
            break;
        case 408:
        case 504:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 502:
        case 503:
            category = ErrorCategory::Connection;
            message = "Portainer server unavailable";
            break;
        default:
            if (status_code >= 500) {
                category = ErrorCategory::Server;
                message = "Portainer server error (HTTP " +
                          std::to_string(status_code) + ")";
            } else {
                category = ErrorCategory::Internal;
                message = "Unexpected HTTP " + std::to_string(status_code);
            }
            break;
    }

    return Error{operation, endpoint, status_code, message, backend_error, category};
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
    if (backend_error.has_value() && !backend_error->empty()) {
        oss << " (" << *backend_error << ")";
    }
    return oss.str();
}

} // namespace portainer_mcp
