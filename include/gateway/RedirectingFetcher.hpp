#pragma once

#include "gateway/model/ProxyRequest.hpp"
#include "transport/HttpTransport.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sg::protocols::http { class ResponseSink; }

namespace sg::gateway {

using HeaderMap = std::map<std::string, std::vector<std::string>>;

// Hops shared by every redirect of one client request, self-redirects included.
class RedirectBudget {
public:
    explicit RedirectBudget(unsigned int limit) : limit_(limit) {}

    // Throws TooManyRedirectsError once more than `limit` hops were taken.
    void consume();

    [[nodiscard]] unsigned int used() const noexcept { return used_; }
    [[nodiscard]] unsigned int limit() const noexcept { return limit_; }

private:
    unsigned int limit_;
    unsigned int used_ = 0;
};

struct FetchOutcome {
    // Location that points back into this gateway; the caller re-enters the pipeline with it.
    std::optional<std::string> selfRedirect;
};

class RedirectingFetcher {
public:
    RedirectingFetcher(std::shared_ptr<transport::HttpTransport> transport, std::string publicAddress);

    /**
     * Fetches `resolvedUrl` with the client's method, headers and body plus every
     * value of `extraHeaders`, following external redirects until a terminal
     * response, which is sanitized and streamed into `sink`.
     *
     * Throws UpstreamFetchError or TooManyRedirectsError.
     */
    FetchOutcome fetch(const std::string& resolvedUrl,
                       const model::ProxyRequest& original,
                       const HeaderMap& extraHeaders,
                       const std::string& origin,
                       RedirectBudget& budget,
                       protocols::http::ResponseSink& sink) const;

    [[nodiscard]] bool isSelfRedirect(const std::string& location) const;

    static transport::OutboundRequest buildRequest(const std::string& url,
                                                   const model::ProxyRequest& original,
                                                   const HeaderMap& extraHeaders);

private:
    std::shared_ptr<transport::HttpTransport> transport_;
    std::string selfPrefix_;
};

}
