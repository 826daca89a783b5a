#pragma once

#include "protocols/http/ResponseSink.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include <memory>

namespace sg::protocols::http {

namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

// Streams one response onto the client socket. The body is written as it
// arrives, with chunked framing when the head carries no Content-Length.
class SocketResponseSink final : public ResponseSink {
public:
    SocketResponseSink(tcp::socket& socket, unsigned int version, bool keepAlive, bool headRequest);

    bool writeHead(unsigned int status, const beast_http::fields& headers) override;
    bool writeBody(const char* data, std::size_t size) override;
    bool finish() override;

    [[nodiscard]] bool headWritten() const noexcept override { return headWritten_; }
    [[nodiscard]] bool finished() const noexcept override { return finished_; }
    [[nodiscard]] bool keepAlive() const noexcept { return keepAlive_; }

private:
    [[nodiscard]] bool fail(const beast::error_code& ec, const char* stage);

    tcp::socket& socket_;
    unsigned int version_;
    bool keepAlive_;
    bool headRequest_;
    bool bodyless_ = false;
    bool headWritten_ = false;
    bool finished_ = false;
    bool broken_ = false;

    std::unique_ptr<beast_http::response<beast_http::buffer_body>> res_;
    std::unique_ptr<beast_http::response_serializer<beast_http::buffer_body>> sr_;
};

}
