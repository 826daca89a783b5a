#pragma once

#include "protocols/TcpServerBase.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace sg::concurrency { class ThreadPool; }

namespace sg::protocols::http {

namespace net = boost::asio;
using tcp = net::ip::tcp;

class Router;
class Session;

// Accepts on the io_context and starts a Session per connection. Requests
// are answered on the worker pool.
class Server final : public TcpServerBase {
public:
    Server(net::io_context& ioc, const tcp::endpoint& endpoint,
           std::shared_ptr<const Router> router,
           std::shared_ptr<concurrency::ThreadPool> pool);

private:
    std::string_view serverName() const noexcept override { return "HttpServer"; }
    void onAccept(tcp::socket socket) override;
    void onStop() override;

    std::shared_ptr<const Router> router_;
    std::shared_ptr<concurrency::ThreadPool> pool_;

    std::mutex sessionsMutex_;
    std::vector<std::weak_ptr<Session>> sessions_;
};

}
