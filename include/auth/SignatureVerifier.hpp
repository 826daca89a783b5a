#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sg::auth {

enum class SignatureError {
    MissingExpiry,
    InvalidExpiry,
    Expired,
    SignatureMismatch
};

// Client-facing reason, e.g. "expire expired"
std::string_view toString(SignatureError err) noexcept;

/**
 * Signed-path tokens have the form "<base64url(HMAC-SHA256(secret, path:expiry))>:<expiry>".
 * An expiry of 0 never expires.
 */
class SignatureVerifier {
public:
    using clock = std::chrono::system_clock;

    explicit SignatureVerifier(std::string secret);

    [[nodiscard]] std::optional<SignatureError> verify(std::string_view path, std::string_view token) const;
    [[nodiscard]] std::optional<SignatureError> verify(std::string_view path, std::string_view token,
                                                       clock::time_point now) const;

    [[nodiscard]] std::string sign(std::string_view path, int64_t expiry) const;

    // Leading-integer parse ("123abc" -> 123); nullopt when no digits lead.
    static std::optional<int64_t> parseExpiry(std::string_view s);

private:
    std::string secret_;
};

}
