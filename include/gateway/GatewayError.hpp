#pragma once

#include <stdexcept>
#include <string>

namespace sg::gateway {

// A terminal failure that is answered with `status` and a JSON `body`.
class GatewayError : public std::runtime_error {
public:
    GatewayError(unsigned int status, std::string body, const std::string& what);

    [[nodiscard]] unsigned int status() const noexcept { return status_; }
    [[nodiscard]] const std::string& body() const noexcept { return body_; }

    // {"code":<code>,"message":<message>}
    static std::string payload(int code, const std::string& message);

    // code when it is a valid HTTP status, 500 otherwise
    static unsigned int clampStatus(long long code) noexcept;

private:
    unsigned int status_;
    std::string body_;
};

class UnauthorizedError final : public GatewayError {
public:
    explicit UnauthorizedError(const std::string& reason);
};

// Backend answered with something other than JSON; its body must never reach the client.
class BackendNonJsonError final : public GatewayError {
public:
    explicit BackendNonJsonError(unsigned int backendStatus);
};

// Backend answered JSON with code != 200; its payload is forwarded verbatim.
class BackendDeclaredError final : public GatewayError {
public:
    BackendDeclaredError(unsigned int status, std::string backendBody);
};

class BackendProtocolError final : public GatewayError {
public:
    explicit BackendProtocolError(const std::string& detail);
};

class BackendUnavailableError final : public GatewayError {
public:
    explicit BackendUnavailableError(const std::string& detail);
};

class UpstreamFetchError final : public GatewayError {
public:
    explicit UpstreamFetchError(const std::string& detail);
};

class TooManyRedirectsError final : public GatewayError {
public:
    explicit TooManyRedirectsError(unsigned int limit);
};

}
