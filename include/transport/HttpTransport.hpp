#pragma once

#include <boost/beast/http/fields.hpp>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace sg::transport {

namespace http = boost::beast::http;

struct OutboundRequest {
    std::string method = "GET";
    std::string url;
    http::fields headers;
    std::string body;
};

struct ResponseHead {
    unsigned int status = 0;
    http::fields headers;
};

struct BufferedResponse {
    unsigned int status = 0;
    http::fields headers;
    std::string body;
};

class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Receives a single hop of a streamed exchange.
class StreamHandler {
public:
    virtual ~StreamHandler() = default;

    // Final (non-1xx) response head. Returning false stops the transfer before any body is read.
    virtual bool onHead(ResponseHead&& head) = 0;

    // Returning false aborts the transfer.
    virtual bool onData(const char* data, std::size_t size) = 0;
};

enum class StreamResult { Completed, Stopped };

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Whole response in memory; throws TransportError when no response was received.
    virtual BufferedResponse exchange(const OutboundRequest& req) = 0;

    // One hop, redirects are never followed. Throws TransportError on network failure;
    // returns Stopped when the handler ended the transfer.
    virtual StreamResult stream(const OutboundRequest& req, StreamHandler& handler) = 0;
};

}
