#include "gateway/GatewayError.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace sg::gateway {

GatewayError::GatewayError(const unsigned int status, std::string body, const std::string& what)
    : std::runtime_error(what), status_(status), body_(std::move(body)) {}

std::string GatewayError::payload(const int code, const std::string& message) {
    return nlohmann::json{{"code", code}, {"message", message}}.dump();
}

unsigned int GatewayError::clampStatus(const long long code) noexcept {
    return code >= 100 && code < 600 ? static_cast<unsigned int>(code) : 500;
}

UnauthorizedError::UnauthorizedError(const std::string& reason)
    : GatewayError(401, payload(401, reason), "Unauthorized: " + reason) {}

BackendNonJsonError::BackendNonJsonError(const unsigned int backendStatus)
    : GatewayError(backendStatus,
                   payload(static_cast<int>(backendStatus), fmt::format("Request failed with status: {}", backendStatus)),
                   fmt::format("Backend returned a non-JSON response with status {}", backendStatus)) {}

BackendDeclaredError::BackendDeclaredError(const unsigned int status, std::string backendBody)
    : GatewayError(status, std::move(backendBody), fmt::format("Backend declared error {}", status)) {}

BackendProtocolError::BackendProtocolError(const std::string& detail)
    : GatewayError(502, payload(502, "Invalid response from backend"), "Invalid backend response: " + detail) {}

BackendUnavailableError::BackendUnavailableError(const std::string& detail)
    : GatewayError(502, payload(502, "Backend unreachable"), "Backend unreachable: " + detail) {}

UpstreamFetchError::UpstreamFetchError(const std::string& detail)
    : GatewayError(502, payload(502, "Upstream fetch failed"), "Upstream fetch failed: " + detail) {}

TooManyRedirectsError::TooManyRedirectsError(const unsigned int limit)
    : GatewayError(508, payload(508, "Too many redirects"), fmt::format("Redirect limit of {} exceeded", limit)) {}

}
