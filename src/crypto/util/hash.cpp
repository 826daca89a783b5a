#include "crypto/util/hash.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace sg::crypto::hash {

std::string hmacSha256Raw(const std::string_view key, const std::string_view data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &len))
        throw std::runtime_error("HMAC-SHA256 computation failed");
    return {reinterpret_cast<char*>(digest), len};
}

std::string base64(const std::string_view raw) {
    // EVP_EncodeBlock NUL-terminates, hence the +1
    std::vector<unsigned char> out(4 * ((raw.size() + 2) / 3) + 1);
    const int n = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(raw.data()),
                                  static_cast<int>(raw.size()));
    if (n < 0) throw std::runtime_error("base64 encoding failed");
    return {reinterpret_cast<char*>(out.data()), static_cast<size_t>(n)};
}

std::string base64Url(const std::string_view raw) {
    auto s = base64(raw);
    std::replace(s.begin(), s.end(), '+', '-');
    std::replace(s.begin(), s.end(), '/', '_');
    return s;
}

bool constantTimeEquals(const std::string_view a, const std::string_view b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}
