#include "protocols/TcpServerBase.hpp"
#include "logging/LogRegistry.hpp"

#include <utility>

using sg::logging::LogRegistry;

namespace sg::protocols {

TcpServerBase::TcpServerBase(asio::io_context& ioc,
                             const tcp::endpoint& endpoint,
                             const TcpServerOptions opts)
    : ioc_(ioc), acceptor_(ioc), opts_(opts) { initAcceptor(acceptor_, endpoint); }

void TcpServerBase::run() {
    LogRegistry::http()->info("[{}] Listening on {}", serverName(), endpointToString(acceptor_.local_endpoint()));

    const auto n = opts_.acceptConcurrency == 0 ? 1u : opts_.acceptConcurrency;
    for (unsigned int i = 0; i < n; ++i) doAccept();
}

void TcpServerBase::stop() {
    auto self = shared_from_this();
    asio::post(ioc_, [self] {
        beast::error_code ec;
        self->acceptor_.close(ec);
        if (ec) LogRegistry::http()->debug("[{}] acceptor close: {}", self->serverName(), ec.message());
        self->onStop();
    });
}

void TcpServerBase::onAcceptError(const beast::error_code& ec) {
    LogRegistry::http()->debug("[{}] accept error: {}", serverName(), ec.message());
}

void TcpServerBase::doAccept() {
    auto self = shared_from_this();

    acceptor_.async_accept(asio::make_strand(ioc_), [self](const beast::error_code& ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted || !self->acceptor_.is_open()) return; // shutting down
        self->doAccept(); // re-arm ASAP

        if (ec) {
            self->onAcceptError(ec);
            return;
        }

        ++self->accepted_;
        self->onAccept(std::move(socket));
    });
}

}
