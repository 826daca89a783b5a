#include "gateway/ResponseSanitizer.hpp"
#include "protocols/http/ResponseSink.hpp"
#include "util/url.hpp"

using namespace sg::util;

namespace sg::gateway {

std::string ResponseSanitizer::allowOrigin(const http::fields& requestHeaders) {
    const auto it = requestHeaders.find(http::field::origin);
    return it == requestHeaders.end() ? "*" : toString(it->value());
}

void ResponseSanitizer::sanitize(http::fields& upstream, const std::string& origin) {
    upstream.erase(http::field::set_cookie);
    upstream.erase(http::field::connection);
    upstream.erase(http::field::keep_alive);
    applyCors(upstream, origin);
}

void ResponseSanitizer::applyCors(http::fields& headers, const std::string& origin) {
    headers.set(http::field::access_control_allow_origin, origin);
    headers.insert(http::field::vary, "Origin");
}

bool ResponseSanitizer::writeJson(protocols::http::ResponseSink& sink, const unsigned int status,
                                  const std::string& body, const std::string& origin) {
    http::fields headers;
    headers.set(http::field::content_type, JSON_CONTENT_TYPE);
    headers.set(http::field::content_length, std::to_string(body.size()));
    applyCors(headers, origin);

    return sink.writeHead(status, headers) && sink.writeText(body) && sink.finish();
}

}
