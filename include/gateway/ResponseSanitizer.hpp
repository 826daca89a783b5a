#pragma once

#include <boost/beast/http/fields.hpp>
#include <string>

namespace sg::protocols::http { class ResponseSink; }

namespace sg::gateway {

namespace http = boost::beast::http;

struct ResponseSanitizer {
    static constexpr const auto* JSON_CONTENT_TYPE = "application/json;charset=UTF-8";

    // Value for Access-Control-Allow-Origin: the request's Origin, or "*" when it has none.
    static std::string allowOrigin(const http::fields& requestHeaders);

    // Prepares an upstream response head for the client: drops Set-Cookie and
    // connection-scoped headers, then applies CORS.
    static void sanitize(http::fields& upstream, const std::string& origin);

    static void applyCors(http::fields& headers, const std::string& origin);

    // Writes a complete locally generated JSON response.
    static bool writeJson(protocols::http::ResponseSink& sink, unsigned int status,
                          const std::string& body, const std::string& origin);
};

}
