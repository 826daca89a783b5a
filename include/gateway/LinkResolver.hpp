#pragma once

#include "transport/HttpTransport.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sg::config { struct BackendConfig; }

namespace sg::gateway {

struct BackendLinkResult {
    unsigned int statusCode = 200;
    std::string url;
    std::map<std::string, std::vector<std::string>> extraHeaders;
};

/**
 * Exchanges a verified path for a direct download URL through the backend's
 * POST /api/fs/link endpoint.
 *
 * Throws BackendNonJsonError, BackendDeclaredError, BackendProtocolError or
 * BackendUnavailableError; see GatewayError.hpp for what reaches the client.
 */
class LinkResolver {
public:
    static constexpr const auto* LINK_ENDPOINT = "/api/fs/link";

    LinkResolver(std::shared_ptr<transport::HttpTransport> transport, const config::BackendConfig& cfg);

    [[nodiscard]] BackendLinkResult resolve(const std::string& path) const;

private:
    [[nodiscard]] transport::OutboundRequest buildRequest(const std::string& path) const;

    std::shared_ptr<transport::HttpTransport> transport_;
    std::string endpoint_;
    std::string token_;
    std::string verifyHeader_;
    std::string verifySecret_;
};

}
