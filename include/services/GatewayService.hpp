#pragma once

#include <boost/asio/io_context.hpp>
#include <memory>
#include <thread>

namespace sg::config { struct Config; }
namespace sg::concurrency { class ThreadPool; }
namespace sg::protocols::http { class Server; }

namespace sg::services {

namespace asio = boost::asio;

// Owns the listener, its io_context thread and the worker pool.
class GatewayService {
public:
    explicit GatewayService(const config::Config& cfg);
    ~GatewayService();

    GatewayService(const GatewayService&) = delete;
    GatewayService& operator=(const GatewayService&) = delete;

    // Binds the listen socket and starts accepting. Throws when the address cannot be bound.
    void start();
    void stop();

    [[nodiscard]] bool isRunning() const noexcept { return running_; }

private:
    const config::Config& cfg_;
    std::shared_ptr<asio::io_context> ioContext_;
    std::shared_ptr<concurrency::ThreadPool> pool_;
    std::shared_ptr<protocols::http::Server> server_;
    std::thread ioThread_;
    bool running_ = false;
};

}
