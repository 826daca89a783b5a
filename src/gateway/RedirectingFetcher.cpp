#include "gateway/RedirectingFetcher.hpp"
#include "gateway/GatewayError.hpp"
#include "gateway/ResponseSanitizer.hpp"
#include "protocols/http/ResponseSink.hpp"
#include "logging/LogRegistry.hpp"
#include "util/url.hpp"

#include <algorithm>
#include <array>

using namespace sg::logging;
using namespace sg::transport;
using namespace sg::util;

namespace sg::gateway {

namespace {

// Describe the inbound connection, not the outbound one; the transport sets its own.
constexpr std::array HOP_HEADERS{
    http::field::host,
    http::field::content_length,
    http::field::connection,
    http::field::keep_alive,
    http::field::transfer_encoding,
    http::field::te,
    http::field::upgrade,
    http::field::expect
};

bool isHopHeader(const http::field f) {
    return std::find(HOP_HEADERS.begin(), HOP_HEADERS.end(), f) != HOP_HEADERS.end();
}

bool isRedirect(const unsigned int status) { return status >= 300 && status < 400; }

// Relays one hop: redirects are captured, anything else goes to the client.
class HopRelay final : public StreamHandler {
public:
    HopRelay(protocols::http::ResponseSink& sink, const std::string& origin) : sink_(sink), origin_(origin) {}

    bool onHead(ResponseHead&& head) override {
        status_ = head.status;

        if (isRedirect(head.status)) {
            if (auto loc = toString(head.headers[http::field::location]); !loc.empty()) {
                location_ = std::move(loc);
                return false;
            }
        }

        ResponseSanitizer::sanitize(head.headers, origin_);
        delivered_ = true;
        return sink_.writeHead(head.status, head.headers);
    }

    bool onData(const char* data, const std::size_t size) override {
        if (!delivered_) return true;
        return sink_.writeBody(data, size);
    }

    [[nodiscard]] const std::optional<std::string>& location() const noexcept { return location_; }
    [[nodiscard]] bool delivered() const noexcept { return delivered_; }
    [[nodiscard]] unsigned int status() const noexcept { return status_; }

private:
    protocols::http::ResponseSink& sink_;
    const std::string& origin_;
    std::optional<std::string> location_;
    unsigned int status_ = 0;
    bool delivered_ = false;
};

}

void RedirectBudget::consume() {
    if (used_ >= limit_) throw TooManyRedirectsError(limit_);
    ++used_;
}

RedirectingFetcher::RedirectingFetcher(std::shared_ptr<HttpTransport> transport, std::string publicAddress)
    : transport_(std::move(transport)), selfPrefix_(std::move(publicAddress) + "/") {}

bool RedirectingFetcher::isSelfRedirect(const std::string& location) const {
    return location.rfind(selfPrefix_, 0) == 0;
}

OutboundRequest RedirectingFetcher::buildRequest(const std::string& url,
                                                 const model::ProxyRequest& original,
                                                 const HeaderMap& extraHeaders) {
    OutboundRequest req;
    req.method = original.method;
    req.url = url;
    req.body = original.body;

    for (const auto& f : original.headers)
        if (!isHopHeader(f.name())) req.headers.insert(f.name_string(), f.value());

    // backend-supplied headers replace the client's and keep every value
    for (const auto& [name, values] : extraHeaders) {
        req.headers.erase(name);
        for (const auto& v : values) req.headers.insert(name, v);
    }

    return req;
}

FetchOutcome RedirectingFetcher::fetch(const std::string& resolvedUrl,
                                       const model::ProxyRequest& original,
                                       const HeaderMap& extraHeaders,
                                       const std::string& origin,
                                       RedirectBudget& budget,
                                       protocols::http::ResponseSink& sink) const {
    auto req = buildRequest(resolvedUrl, original, extraHeaders);

    for (;;) {
        HopRelay relay(sink, origin);
        StreamResult result;

        try {
            result = transport_->stream(req, relay);
        } catch (const TransportError& e) {
            LogRegistry::fetch()->error("[RedirectingFetcher] {} after {} redirect(s)", e.what(), budget.used());
            throw UpstreamFetchError(e.what());
        }

        if (const auto& location = relay.location()) {
            if (isSelfRedirect(*location)) {
                LogRegistry::fetch()->debug("[RedirectingFetcher] HTTP {} points back into the gateway", relay.status());
                return {*location};
            }

            budget.consume();
            try {
                req.url = resolveLocation(req.url, *location);
            } catch (const std::runtime_error& e) {
                throw UpstreamFetchError(e.what());
            }
            LogRegistry::fetch()->debug("[RedirectingFetcher] Following HTTP {} (hop {}/{})",
                                        relay.status(), budget.used(), budget.limit());
            continue;
        }

        if (!relay.delivered()) throw UpstreamFetchError("upstream closed without a response");

        if (result == StreamResult::Stopped) {
            LogRegistry::fetch()->info("[RedirectingFetcher] Client went away, upstream transfer aborted");
            return {};
        }

        if (!sink.finish()) LogRegistry::fetch()->debug("[RedirectingFetcher] Client went away before the final chunk");
        return {};
    }
}

}
