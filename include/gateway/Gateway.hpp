#pragma once

#include "auth/SignatureVerifier.hpp"
#include "gateway/LinkResolver.hpp"
#include "gateway/RedirectingFetcher.hpp"

#include <memory>

namespace sg::config { struct Config; }
namespace sg::protocols::http { class ResponseSink; }

namespace sg::gateway {

// verify -> resolve -> fetch -> sanitize, re-entered for every self-redirect.
class Gateway {
public:
    Gateway(const config::Config& cfg, std::shared_ptr<transport::HttpTransport> transport);

    void handle(const model::ProxyRequest& req, protocols::http::ResponseSink& sink) const;

private:
    void runPipeline(model::ProxyRequest current, const std::string& origin, protocols::http::ResponseSink& sink) const;

    auth::SignatureVerifier verifier_;
    LinkResolver resolver_;
    RedirectingFetcher fetcher_;
    std::string publicAddress_;
    unsigned int maxRedirects_;
};

}
