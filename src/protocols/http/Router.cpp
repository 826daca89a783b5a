#include "protocols/http/Router.hpp"
#include "protocols/http/ResponseSink.hpp"
#include "gateway/Gateway.hpp"
#include "gateway/model/ProxyRequest.hpp"
#include "logging/LogRegistry.hpp"
#include "util/url.hpp"

using namespace sg::gateway;
using namespace sg::logging;

namespace sg::protocols::http {

bool CorsPolicy::isPreflight(const model::ProxyRequest& req) {
    return req.hasHeader(field::origin) && req.hasHeader(field::access_control_request_method);
}

bool CorsPolicy::handleOptions(const model::ProxyRequest& req, ResponseSink& sink) {
    boost::beast::http::fields headers;

    if (isPreflight(req)) {
        headers.set(field::access_control_allow_origin, "*");
        headers.set(field::access_control_allow_methods, ALLOWED_METHODS);
        headers.set(field::access_control_max_age, MAX_AGE);
        headers.set(field::access_control_allow_headers, req.headerList(field::access_control_request_headers));
    } else {
        headers.set(field::allow, ALLOW_HEADER);
    }
    headers.set(field::content_length, "0");

    return sink.writeHead(static_cast<unsigned int>(status::ok), headers) && sink.finish();
}

Router::Router(std::shared_ptr<const Gateway> gateway) : gateway_(std::move(gateway)) {}

void Router::route(const request& req, ResponseSink& sink) const {
    route(model::ProxyRequest::fromInbound(req), sink);
}

void Router::route(const model::ProxyRequest& req, ResponseSink& sink) const {
    if (req.method == "OPTIONS") {
        LogRegistry::http()->debug("[Router] OPTIONS {} (preflight: {})", util::targetPath(req.target), CorsPolicy::isPreflight(req));
        CorsPolicy::handleOptions(req, sink);
        return;
    }

    gateway_->handle(req, sink);
}

}
