#include "util/url.hpp"
#include "util/curlWrappers.hpp"

#include <algorithm>
#include <memory>

namespace sg::util {

namespace {

std::string_view stripFragment(std::string_view target) {
    if (const auto hash = target.find('#'); hash != std::string_view::npos) target = target.substr(0, hash);
    return target;
}

std::string_view queryOf(std::string_view target) {
    target = stripFragment(target);
    const auto q = target.find('?');
    return q == std::string_view::npos ? std::string_view{} : target.substr(q + 1);
}

}

std::string percentDecode(const std::string_view s, const bool plusAsSpace) {
    std::string in(s);
    if (plusAsSpace) std::replace(in.begin(), in.end(), '+', ' ');

    int outLen = 0;
    char* out = curl_easy_unescape(nullptr, in.c_str(), static_cast<int>(in.size()), &outLen);
    if (!out) throw std::runtime_error("curl_easy_unescape failed");
    const std::unique_ptr<char, decltype(&curl_free)> guard(out, &curl_free);
    return {out, static_cast<size_t>(outLen)};
}

std::string targetPath(std::string_view target) {
    target = stripFragment(target);
    if (const auto q = target.find('?'); q != std::string_view::npos) target = target.substr(0, q);

    // absolute-form: skip scheme and authority
    if (const auto scheme = target.find("://"); scheme != std::string_view::npos) {
        const auto slash = target.find('/', scheme + 3);
        target = slash == std::string_view::npos ? std::string_view{"/"} : target.substr(slash);
    }

    if (target.empty()) return "/";
    return percentDecode(target);
}

std::string queryParam(const std::string_view target, const std::string_view name) {
    auto query = queryOf(target);

    while (!query.empty()) {
        const auto amp = query.find('&');
        const auto pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

        const auto eq = pair.find('=');
        const auto key = percentDecode(pair.substr(0, eq), true);
        if (key != name) continue;
        return eq == std::string_view::npos ? std::string{} : percentDecode(pair.substr(eq + 1), true);
    }

    return {};
}

std::string resolveLocation(const std::string& base, const std::string& location) {
    CurlUrl url;
    if (curl_url_set(url, CURLUPART_URL, base.c_str(), 0) != CURLUE_OK)
        throw std::runtime_error("Invalid base URL: " + base);

    // with a base already set, CURLUPART_URL resolves relative references
    if (curl_url_set(url, CURLUPART_URL, location.c_str(), 0) != CURLUE_OK)
        throw std::runtime_error("Invalid redirect location: " + location);

    char* out = nullptr;
    if (curl_url_get(url, CURLUPART_URL, &out, 0) != CURLUE_OK || !out)
        throw std::runtime_error("Failed to resolve redirect location: " + location);
    const std::unique_ptr<char, decltype(&curl_free)> guard(out, &curl_free);
    return out;
}

}
