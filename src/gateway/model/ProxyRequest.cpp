#include "gateway/model/ProxyRequest.hpp"
#include "util/url.hpp"

using namespace sg::util;

namespace sg::gateway::model {

ProxyRequest ProxyRequest::fromInbound(const http::request<http::string_body>& req) {
    ProxyRequest pr;
    pr.method = toString(req.method_string());
    pr.target = toString(req.target());
    for (const auto& f : req) pr.headers.insert(f.name_string(), f.value());
    pr.body = req.body();
    return pr;
}

std::string ProxyRequest::header(const http::field name) const {
    const auto it = headers.find(name);
    return it == headers.end() ? std::string{} : toString(it->value());
}

std::string ProxyRequest::headerList(const http::field name) const {
    std::string out;
    for (auto [it, end] = headers.equal_range(name); it != end; ++it) {
        if (!out.empty()) out += ", ";
        out += toString(it->value());
    }
    return out;
}

bool ProxyRequest::hasHeader(const http::field name) const {
    return headers.find(name) != headers.end();
}

}
