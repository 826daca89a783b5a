#pragma once

#include <boost/beast/http.hpp>
#include <string>

namespace sg::gateway::model {

namespace http = boost::beast::http;

// One top-level request travelling through the pipeline. Self-redirects replace `target`.
struct ProxyRequest {
    std::string method = "GET";
    std::string target;     // origin-form, e.g. "/a/b.txt?sign=..."
    http::fields headers;
    std::string body;

    static ProxyRequest fromInbound(const http::request<http::string_body>& req);

    [[nodiscard]] std::string header(http::field name) const;
    // Every field line of `name`, joined with ", "
    [[nodiscard]] std::string headerList(http::field name) const;
    [[nodiscard]] bool hasHeader(http::field name) const;
};

}
