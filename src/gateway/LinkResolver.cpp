#include "gateway/LinkResolver.hpp"
#include "gateway/GatewayError.hpp"
#include "gateway/ResponseSanitizer.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"
#include "util/url.hpp"

#include <nlohmann/json.hpp>

using namespace sg::logging;
using namespace sg::transport;
using namespace sg::util;
using json = nlohmann::json;

namespace sg::gateway {

namespace {

std::vector<std::string> headerValues(const json& v) {
    std::vector<std::string> out;
    if (v.is_string()) out.push_back(v.get<std::string>());
    else if (v.is_array())
        for (const auto& item : v)
            if (item.is_string()) out.push_back(item.get<std::string>());
    return out;
}

}

LinkResolver::LinkResolver(std::shared_ptr<HttpTransport> transport, const config::BackendConfig& cfg)
    : transport_(std::move(transport)),
      endpoint_(cfg.address + LINK_ENDPOINT),
      token_(cfg.token),
      verifyHeader_(cfg.verify_header),
      verifySecret_(cfg.verify_secret) {}

OutboundRequest LinkResolver::buildRequest(const std::string& path) const {
    OutboundRequest req;
    req.method = "POST";
    req.url = endpoint_;
    // bytes that are not UTF-8 are sent as U+FFFD
    req.body = json{{"path", path}}.dump(-1, ' ', false, json::error_handler_t::replace);
    req.headers.set(http::field::content_type, ResponseSanitizer::JSON_CONTENT_TYPE);
    req.headers.set(http::field::authorization, token_);
    if (!verifyHeader_.empty()) req.headers.set(verifyHeader_, verifySecret_);
    return req;
}

BackendLinkResult LinkResolver::resolve(const std::string& path) const {
    BufferedResponse resp;
    try {
        resp = transport_->exchange(buildRequest(path));
    } catch (const TransportError& e) {
        LogRegistry::backend()->error("[LinkResolver] Backend request failed: {}", e.what());
        throw BackendUnavailableError(e.what());
    }

    const auto contentType = toString(resp.headers[http::field::content_type]);
    if (contentType.find("application/json") == std::string::npos) {
        LogRegistry::backend()->warn("[LinkResolver] Backend answered {} with content type '{}'", resp.status, contentType);
        throw BackendNonJsonError(resp.status);
    }

    const auto payload = json::parse(resp.body, nullptr, /*allow_exceptions=*/false);
    if (payload.is_discarded() || !payload.is_object()) {
        LogRegistry::backend()->warn("[LinkResolver] Backend sent malformed JSON (HTTP {})", resp.status);
        throw BackendProtocolError("malformed JSON body");
    }

    const auto code = payload.find("code");
    if (code == payload.end() || !code->is_number() || code->get<double>() != 200) {
        const auto status = code != payload.end() && code->is_number_integer()
            ? GatewayError::clampStatus(code->get<long long>())
            : 500u;
        LogRegistry::backend()->info("[LinkResolver] Backend declined link for request: code {}", status);
        throw BackendDeclaredError(status, resp.body);
    }

    const auto data = payload.find("data");
    if (data == payload.end() || !data->is_object() || !data->contains("url") || !data->at("url").is_string())
        throw BackendProtocolError("success payload without data.url");

    BackendLinkResult result;
    result.statusCode = 200;
    result.url = data->at("url").get<std::string>();

    if (const auto hdr = data->find("header"); hdr != data->end() && hdr->is_object())
        for (const auto& [name, values] : hdr->items())
            if (auto list = headerValues(values); !list.empty()) result.extraHeaders[name] = std::move(list);

    LogRegistry::backend()->debug("[LinkResolver] Resolved link with {} extra header(s)", result.extraHeaders.size());
    return result;
}

}
