#include "transport/CurlTransport.hpp"
#include "util/curlWrappers.hpp"

#include <cctype>
#include <exception>
#include <fmt/core.h>
#include <string_view>

using namespace sg::util;

namespace sg::transport {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// Assembles response heads from curl's line-by-line header callback.
class HeadParser {
public:
    // True once a final (non-1xx) head is complete and ready to take().
    bool feed(std::string_view line) {
        if (line.rfind("HTTP/", 0) == 0) {
            head_ = {};
            const auto sp = line.find(' ');
            if (sp != std::string_view::npos) {
                unsigned int status = 0;
                for (auto i = sp + 1; i < line.size() && std::isdigit(static_cast<unsigned char>(line[i])); ++i)
                    status = status * 10 + static_cast<unsigned int>(line[i] - '0');
                head_.status = status;
            }
            return false;
        }

        const auto trimmed = trim(line);
        if (trimmed.empty()) return head_.status >= 200;

        const auto colon = trimmed.find(':');
        if (colon == std::string_view::npos || colon == 0) return false;
        const std::string name(trim(trimmed.substr(0, colon)));
        const std::string value(trim(trimmed.substr(colon + 1)));
        head_.headers.insert(name, value);
        return false;
    }

    ResponseHead take() { return std::move(head_); }

private:
    ResponseHead head_;
};

struct ExchangeContext {
    HeadParser parser;
    BufferedResponse response;
};

struct StreamContext {
    explicit StreamContext(StreamHandler& h) : handler(h) {}

    StreamHandler& handler;
    HeadParser parser;
    bool stopped = false;
    std::exception_ptr error;
};

size_t exchangeHeader(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* ctx = static_cast<ExchangeContext*>(userdata);
    const auto n = size * nmemb;
    if (ctx->parser.feed({ptr, n})) {
        auto head = ctx->parser.take();
        ctx->response.status = head.status;
        ctx->response.headers = std::move(head.headers);
    }
    return n;
}

size_t exchangeBody(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* ctx = static_cast<ExchangeContext*>(userdata);
    ctx->response.body.append(ptr, size * nmemb);
    return size * nmemb;
}

// Returning anything but n makes curl abort with CURLE_WRITE_ERROR.
size_t streamHeader(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    const auto n = size * nmemb;
    if (ctx->stopped) return 0;

    try {
        if (ctx->parser.feed({ptr, n}) && !ctx->handler.onHead(ctx->parser.take())) {
            ctx->stopped = true;
            return 0;
        }
    } catch (...) {
        ctx->error = std::current_exception();
        return 0;
    }
    return n;
}

size_t streamBody(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    const auto n = size * nmemb;
    if (ctx->stopped) return 0;

    try {
        if (!ctx->handler.onData(ptr, n)) {
            ctx->stopped = true;
            return 0;
        }
    } catch (...) {
        ctx->error = std::current_exception();
        return 0;
    }
    return n;
}

[[noreturn]] void throwCurlError(const OutboundRequest& req, const CURLcode rc, const char* detail) {
    throw TransportError(fmt::format("{} request failed: {}{}{}", req.method, curl_easy_strerror(rc),
                                     *detail ? " - " : "", detail));
}

}

CurlTransport::CurlTransport(const CurlTransportOptions opts) : opts_(opts) { ensureCurlGlobalInit(); }

void CurlTransport::prepare(CURL* h, const OutboundRequest& req, SList& headers) const {
    curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h, CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);
    if (opts_.connectTimeoutSeconds > 0) curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, opts_.connectTimeoutSeconds);

    if (req.method == "GET" && req.body.empty()) {
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    } else if (req.method == "HEAD") {
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
        if (req.method != "POST") curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
    }

    for (const auto& f : req.headers) {
        const auto name = f.name_string();
        const auto value = f.value();
        // "Name;" is curl's spelling of a header with an empty value
        if (value.empty()) headers.add(fmt::format("{};", std::string_view(name.data(), name.size())));
        else headers.add(fmt::format("{}: {}", std::string_view(name.data(), name.size()),
                                     std::string_view(value.data(), value.size())));
    }
    headers.add("Expect:");
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
}

BufferedResponse CurlTransport::exchange(const OutboundRequest& req) {
    CurlEasy h;
    SList headers;
    ExchangeContext ctx;
    char errbuf[CURL_ERROR_SIZE] = {};

    prepare(h, req, headers);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    if (opts_.exchangeTimeoutSeconds > 0) curl_easy_setopt(h, CURLOPT_TIMEOUT, opts_.exchangeTimeoutSeconds);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, exchangeHeader);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, exchangeBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);

    if (const auto rc = curl_easy_perform(h); rc != CURLE_OK) throwCurlError(req, rc, errbuf);

    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    ctx.response.status = static_cast<unsigned int>(status);
    return std::move(ctx.response);
}

StreamResult CurlTransport::stream(const OutboundRequest& req, StreamHandler& handler) {
    CurlEasy h;
    SList headers;
    StreamContext ctx(handler);
    char errbuf[CURL_ERROR_SIZE] = {};

    prepare(h, req, headers);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    if (opts_.lowSpeedSeconds > 0) {
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, opts_.lowSpeedSeconds);
    }
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, streamHeader);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, streamBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);

    const auto rc = curl_easy_perform(h);

    if (ctx.error) std::rethrow_exception(ctx.error);
    if (ctx.stopped) return StreamResult::Stopped;
    if (rc != CURLE_OK) throwCurlError(req, rc, errbuf);
    return StreamResult::Completed;
}

}
