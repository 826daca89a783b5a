#pragma once

#include "transport/HttpTransport.hpp"

#include <algorithm>
#include <deque>
#include <string>
#include <vector>

namespace sg::test {

namespace http = boost::beast::http;

struct ScriptedHop {
    unsigned int status = 200;
    http::fields headers;
    std::string body;
    std::string failure; // non-empty: the hop throws TransportError with this message
};

// Replays scripted responses in order and records every request it was given.
class FakeTransport final : public transport::HttpTransport {
public:
    std::deque<transport::BufferedResponse> exchanges;
    std::deque<ScriptedHop> hops;
    std::string exchangeFailure;
    std::size_t chunkSize = 4;

    std::vector<transport::OutboundRequest> exchanged;
    std::vector<transport::OutboundRequest> streamed;

    transport::BufferedResponse exchange(const transport::OutboundRequest& req) override {
        exchanged.push_back(req);
        if (!exchangeFailure.empty()) throw transport::TransportError(exchangeFailure);
        if (exchanges.empty()) throw transport::TransportError("no scripted backend response");
        auto resp = std::move(exchanges.front());
        exchanges.pop_front();
        return resp;
    }

    transport::StreamResult stream(const transport::OutboundRequest& req, transport::StreamHandler& handler) override {
        streamed.push_back(req);
        if (hops.empty()) throw transport::TransportError("no scripted upstream response");
        auto hop = std::move(hops.front());
        hops.pop_front();
        if (!hop.failure.empty()) throw transport::TransportError(hop.failure);

        transport::ResponseHead head;
        head.status = hop.status;
        head.headers = hop.headers;
        if (!handler.onHead(std::move(head))) return transport::StreamResult::Stopped;

        for (std::size_t off = 0; off < hop.body.size(); off += chunkSize) {
            const auto n = std::min(chunkSize, hop.body.size() - off);
            if (!handler.onData(hop.body.data() + off, n)) return transport::StreamResult::Stopped;
        }
        return transport::StreamResult::Completed;
    }

    // Backend reply helpers
    void backendJson(const unsigned int status, std::string body) {
        transport::BufferedResponse r;
        r.status = status;
        r.headers.set(http::field::content_type, "application/json; charset=utf-8");
        r.body = std::move(body);
        exchanges.push_back(std::move(r));
    }

    void backendLink(const std::string& url, const std::string& headerJson = "{}") {
        backendJson(200, R"({"code":200,"message":"success","data":{"url":")" + url + R"(","header":)" + headerJson + "}}");
    }

    void upstream(const unsigned int status, std::string body = {}, http::fields headers = {}) {
        ScriptedHop hop;
        hop.status = status;
        hop.headers = std::move(headers);
        hop.body = std::move(body);
        hops.push_back(std::move(hop));
    }

    void redirect(const unsigned int status, const std::string& location) {
        http::fields h;
        h.set(http::field::location, location);
        upstream(status, {}, std::move(h));
    }
};

}
