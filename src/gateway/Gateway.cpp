#include "gateway/Gateway.hpp"
#include "gateway/GatewayError.hpp"
#include "gateway/ResponseSanitizer.hpp"
#include "config/Config.hpp"
#include "protocols/http/ResponseSink.hpp"
#include "logging/LogRegistry.hpp"
#include "util/url.hpp"

using namespace sg::logging;
using namespace sg::util;

namespace sg::gateway {

Gateway::Gateway(const config::Config& cfg, std::shared_ptr<transport::HttpTransport> transport)
    : verifier_(cfg.gateway.secret),
      resolver_(transport, cfg.backend),
      fetcher_(transport, cfg.gateway.public_address),
      publicAddress_(cfg.gateway.public_address),
      maxRedirects_(cfg.gateway.max_redirects) {}

void Gateway::handle(const model::ProxyRequest& req, protocols::http::ResponseSink& sink) const {
    const auto origin = ResponseSanitizer::allowOrigin(req.headers);

    try {
        runPipeline(req, origin, sink);
    } catch (const GatewayError& e) {
        if (sink.headWritten()) {
            LogRegistry::gateway()->warn("[Gateway] {} after the response head was sent, dropping connection", e.what());
            return;
        }
        if (e.status() >= 500) LogRegistry::gateway()->warn("[Gateway] {} -> HTTP {}", e.what(), e.status());
        else LogRegistry::gateway()->debug("[Gateway] {} -> HTTP {}", e.what(), e.status());
        ResponseSanitizer::writeJson(sink, e.status(), e.body(), origin);
    }
}

void Gateway::runPipeline(model::ProxyRequest current, const std::string& origin,
                          protocols::http::ResponseSink& sink) const {
    RedirectBudget budget(maxRedirects_);

    for (;;) {
        const auto path = targetPath(current.target);
        const auto sign = queryParam(current.target, "sign");

        if (const auto err = verifier_.verify(path, sign)) {
            LogRegistry::auth()->info("[Gateway] Rejected signature for {}: {}", path, auth::toString(*err));
            throw UnauthorizedError(std::string(auth::toString(*err)));
        }

        const auto link = resolver_.resolve(path);
        const auto outcome = fetcher_.fetch(link.url, current, link.extraHeaders, origin, budget, sink);
        if (!outcome.selfRedirect) return;

        // a brand-new top-level request for the path the redirect names
        budget.consume();
        current.target = outcome.selfRedirect->substr(publicAddress_.size());
        LogRegistry::gateway()->debug("[Gateway] Self-redirect re-entering pipeline for {} (hop {}/{})",
                                      targetPath(current.target), budget.used(), budget.limit());
    }
}

}
