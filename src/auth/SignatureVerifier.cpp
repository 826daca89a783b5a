#include "auth/SignatureVerifier.hpp"
#include "crypto/util/hash.hpp"

#include <cctype>
#include <fmt/core.h>
#include <limits>

using namespace sg::crypto;

namespace sg::auth {

std::string_view toString(const SignatureError err) noexcept {
    switch (err) {
    case SignatureError::MissingExpiry:     return "expire missing";
    case SignatureError::InvalidExpiry:     return "expire invalid";
    case SignatureError::Expired:           return "expire expired";
    case SignatureError::SignatureMismatch: return "sign mismatch";
    }
    return "sign invalid";
}

SignatureVerifier::SignatureVerifier(std::string secret) : secret_(std::move(secret)) {}

std::optional<SignatureError> SignatureVerifier::verify(const std::string_view path, const std::string_view token) const {
    return verify(path, token, clock::now());
}

std::optional<SignatureError> SignatureVerifier::verify(const std::string_view path,
                                                        const std::string_view token,
                                                        const clock::time_point now) const {
    const auto sep = token.rfind(':');
    const auto expirySegment = sep == std::string_view::npos ? token : token.substr(sep + 1);
    if (expirySegment.empty()) return SignatureError::MissingExpiry;

    const auto expiry = parseExpiry(expirySegment);
    if (!expiry) return SignatureError::InvalidExpiry;

    // expired once the current time, with its sub-second part, has passed the expiry second
    const auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    if (*expiry > 0 && *expiry <= (nowMs - 1) / 1000) return SignatureError::Expired;

    if (!hash::constantTimeEquals(token, sign(path, *expiry))) return SignatureError::SignatureMismatch;

    return std::nullopt;
}

std::string SignatureVerifier::sign(const std::string_view path, const int64_t expiry) const {
    const auto message = fmt::format("{}:{}", path, expiry);
    return fmt::format("{}:{}", hash::base64Url(hash::hmacSha256Raw(secret_, message)), expiry);
}

std::optional<int64_t> SignatureVerifier::parseExpiry(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);

    bool negative = false;
    if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }

    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.front()))) return std::nullopt;

    int64_t value = 0;
    for (const char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) break;
        const int digit = c - '0';
        if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }

    return negative ? -value : value;
}

}
