#pragma once

#include "transport/HttpTransport.hpp"

#include <curl/curl.h>

namespace sg::util { class SList; }

namespace sg::transport {

struct CurlTransportOptions {
    long connectTimeoutSeconds = 10;
    long exchangeTimeoutSeconds = 15;   // whole buffered exchange, 0 = none
    long lowSpeedSeconds = 60;          // streamed hops stalled below 1 B/s this long are aborted, 0 = never
};

class CurlTransport final : public HttpTransport {
public:
    explicit CurlTransport(CurlTransportOptions opts = {});

    BufferedResponse exchange(const OutboundRequest& req) override;
    StreamResult stream(const OutboundRequest& req, StreamHandler& handler) override;

private:
    void prepare(CURL* h, const OutboundRequest& req, util::SList& headers) const;

    CurlTransportOptions opts_;
};

}
