#pragma once

#include <boost/beast/http.hpp>
#include <memory>

namespace sg::gateway {
class Gateway;
namespace model { struct ProxyRequest; }
}

namespace sg::protocols::http {

class ResponseSink;

using request = boost::beast::http::request<boost::beast::http::string_body>;
using field = boost::beast::http::field;
using verb = boost::beast::http::verb;
using status = boost::beast::http::status;

struct CorsPolicy {
    static constexpr const auto* ALLOWED_METHODS = "GET,HEAD,POST,OPTIONS";
    static constexpr const auto* ALLOW_HEADER = "GET, HEAD, POST, OPTIONS";
    static constexpr const auto* MAX_AGE = "86400";

    static bool isPreflight(const gateway::model::ProxyRequest& req);

    // Full preflight answer, or a plain Allow listing when the request is not a CORS preflight.
    static bool handleOptions(const gateway::model::ProxyRequest& req, ResponseSink& sink);
};

class Router {
public:
    explicit Router(std::shared_ptr<const gateway::Gateway> gateway);

    void route(const request& req, ResponseSink& sink) const;
    void route(const gateway::model::ProxyRequest& req, ResponseSink& sink) const;

private:
    std::shared_ptr<const gateway::Gateway> gateway_;
};

}
