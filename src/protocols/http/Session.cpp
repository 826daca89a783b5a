#include "protocols/http/Session.hpp"
#include "protocols/http/RequestTask.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/SocketResponseSink.hpp"
#include "concurrency/ThreadPool.hpp"
#include "gateway/GatewayError.hpp"
#include "gateway/ResponseSanitizer.hpp"
#include "logging/LogRegistry.hpp"
#include "util/url.hpp"

using namespace sg::protocols::http;
using namespace sg::logging;
using sg::gateway::GatewayError;
using sg::gateway::ResponseSanitizer;


Session::Session(tcp::socket socket, std::shared_ptr<const Router> router,
                 std::shared_ptr<concurrency::ThreadPool> pool)
    : socket_(std::move(socket)), router_(std::move(router)), pool_(std::move(pool)) {}

void Session::run() {
    boost::asio::dispatch(socket_.get_executor(), [self = shared_from_this()] { self->doRead(); });
}

void Session::doRead() {
    {
        std::scoped_lock lock(mutex_);
        if (closing_) return doClose();
    }

    parser_.emplace();
    parser_->header_limit(HEADER_LIMIT);
    parser_->body_limit(BODY_LIMIT);

    beast_http::async_read(socket_, buffer_, *parser_,
                           [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
                               self->onRead(ec, bytes);
                           });
}

void Session::onRead(beast::error_code ec, std::size_t bytes) {
    if (ec == beast_http::error::end_of_stream || ec == boost::asio::error::connection_reset
        || ec == boost::asio::error::operation_aborted) return doClose();

    // the header is in, so the client can still be told why its body was refused
    oversized_ = ec == beast_http::error::body_limit;
    if (ec && !oversized_) {
        LogRegistry::http()->debug("[Session] Read error: {}", ec.message());
        return doClose();
    }

    LogRegistry::http()->trace("[Session] Read {} bytes", bytes);

    std::scoped_lock lock(mutex_);
    if (closing_) return doClose();
    handling_ = true;
    pool_->submit(std::make_shared<RequestTask>(shared_from_this(), RequestTask::clock::now()));
}

void Session::serve() {
    if (oversized_) return rejectOversized();

    const auto& req = parser_->get();
    SocketResponseSink sink(socket_, req.version(), req.keep_alive(), req.method() == beast_http::verb::head);

    try {
        router_->route(req, sink);
    } catch (const std::exception& e) {
        LogRegistry::http()->error("[Session] Unhandled error for {} request: {}",
                                   sg::util::toString(req.method_string()), e.what());
        if (!sink.headWritten()) {
            const auto origin = ResponseSanitizer::allowOrigin(req.base());
            ResponseSanitizer::writeJson(sink, 500, GatewayError::payload(500, "Internal server error"), origin);
        }
    }

    const bool again = sink.finished() && sink.keepAlive();

    std::scoped_lock lock(mutex_);
    handling_ = false;
    if (!again || closing_) return doClose();
    boost::asio::post(socket_.get_executor(), [self = shared_from_this()] { self->doRead(); });
}

void Session::rejectOversized() {
    const auto& req = parser_->get();
    LogRegistry::http()->warn("[Session] Refusing {} request body over {} bytes",
                              sg::util::toString(req.method_string()), BODY_LIMIT);

    SocketResponseSink sink(socket_, req.version(), false, req.method() == beast_http::verb::head);
    ResponseSanitizer::writeJson(sink, 413, GatewayError::payload(413, "Request body too large"),
                                 ResponseSanitizer::allowOrigin(req.base()));

    std::scoped_lock lock(mutex_);
    handling_ = false;
    doClose();
}

void Session::shutdown() {
    std::scoped_lock lock(mutex_);
    closing_ = true;
    if (handling_) return;
    boost::asio::post(socket_.get_executor(), [self = shared_from_this()] { self->doClose(); });
}

void Session::doClose() {
    if (!socket_.is_open()) return;
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != boost::asio::error::not_connected)
        LogRegistry::http()->debug("[Session] Shutdown error: {}", ec.message());
    socket_.close(ec);
}
