#pragma once

#include "protocols/TCPAcceptor.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>

namespace sg::protocols {

namespace asio  = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

struct TcpServerOptions {
    unsigned int acceptConcurrency{1};
};

// Listens on one endpoint and keeps an accept armed until stop().
class TcpServerBase : public std::enable_shared_from_this<TcpServerBase> {
public:
    TcpServerBase(asio::io_context& ioc, const tcp::endpoint& endpoint, TcpServerOptions opts);
    virtual ~TcpServerBase() = default;

    void run();

    // Closes the acceptor, then lets the subclass wind down its open connections.
    void stop();

    [[nodiscard]] tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }
    [[nodiscard]] std::uint64_t acceptedConnections() const noexcept { return accepted_.load(); }

protected:
    virtual std::string_view serverName() const noexcept = 0;
    virtual void onAccept(tcp::socket socket) = 0;

    virtual void onAcceptError(const beast::error_code& ec);

    // Runs on the io_context right after the acceptor is closed.
    virtual void onStop() {}

    asio::io_context& ioc() const noexcept { return ioc_; }

private:
    void doAccept();

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    TcpServerOptions opts_;
    std::atomic<std::uint64_t> accepted_{0};
};

}
