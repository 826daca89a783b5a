#include "protocols/http/SocketResponseSink.hpp"
#include "logging/LogRegistry.hpp"

using namespace sg::logging;

namespace sg::protocols::http {

SocketResponseSink::SocketResponseSink(tcp::socket& socket, const unsigned int version,
                                       const bool keepAlive, const bool headRequest)
    : socket_(socket), version_(version), keepAlive_(keepAlive), headRequest_(headRequest) {}

bool SocketResponseSink::fail(const beast::error_code& ec, const char* stage) {
    if (!ec) return false;
    broken_ = true;
    keepAlive_ = false;
    LogRegistry::http()->debug("[SocketResponseSink] Write error during {}: {}", stage, ec.message());
    return true;
}

bool SocketResponseSink::writeHead(const unsigned int status, const beast_http::fields& headers) {
    if (broken_ || headWritten_) return false;

    res_ = std::make_unique<beast_http::response<beast_http::buffer_body>>();
    res_->version(version_);
    res_->result(status);
    for (const auto& f : headers) res_->insert(f.name_string(), f.value());

    // framing is decided here, upstream's transfer coding was already undone by the transport
    res_->erase(beast_http::field::transfer_encoding);
    bodyless_ = headRequest_ || status / 100 == 1 || status == 204 || status == 304;
    const bool knownLength = res_->find(beast_http::field::content_length) != res_->end();
    if (!bodyless_ && !knownLength) {
        if (version_ >= 11) res_->chunked(true);
        else keepAlive_ = false; // HTTP/1.0: the body ends when the connection does
    }
    res_->keep_alive(keepAlive_);

    res_->body().data = nullptr;
    res_->body().more = true;
    sr_ = std::make_unique<beast_http::response_serializer<beast_http::buffer_body>>(*res_);

    beast::error_code ec;
    beast_http::write_header(socket_, *sr_, ec);
    headWritten_ = true;
    return !fail(ec, "head");
}

bool SocketResponseSink::writeBody(const char* data, const std::size_t size) {
    if (!headWritten_ || broken_ || finished_) return false;
    if (bodyless_ || size == 0) return true;

    res_->body().data = const_cast<char*>(data);
    res_->body().size = size;
    res_->body().more = true;

    beast::error_code ec;
    beast_http::write(socket_, *sr_, ec);
    if (ec == beast_http::error::need_buffer) ec = {};
    return !fail(ec, "body");
}

bool SocketResponseSink::finish() {
    if (!headWritten_ || broken_) return false;
    if (finished_) return true;
    finished_ = true;
    if (bodyless_) return true;

    res_->body().data = nullptr;
    res_->body().size = 0;
    res_->body().more = false;

    beast::error_code ec;
    beast_http::write(socket_, *sr_, ec);
    if (ec == beast_http::error::need_buffer) ec = {};
    return !fail(ec, "finish");
}

}
