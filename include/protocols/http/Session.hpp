#pragma once

#include "protocols/http/ResponseSink.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <memory>
#include <mutex>
#include <optional>

namespace sg::concurrency { class ThreadPool; }

namespace sg::protocols::http {

namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

class Router;

// One client connection. Reads wait on the io_context; each parsed request
// is handed to the worker pool, which writes the response and re-arms the read.
class Session : public std::enable_shared_from_this<Session> {
public:
    static constexpr std::uint32_t HEADER_LIMIT = 16 * 1024;
    static constexpr std::uint64_t BODY_LIMIT = 1024 * 1024;

    Session(tcp::socket socket, std::shared_ptr<const Router> router,
            std::shared_ptr<concurrency::ThreadPool> pool);

    void run();

    // Runs on a pool worker while no read is pending.
    void serve();

    // Closes the connection once the request in flight, if any, has been answered.
    void shutdown();

private:
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void rejectOversized();
    void doClose();

    tcp::socket socket_;
    beast::flat_buffer buffer_;
    std::optional<beast_http::request_parser<beast_http::string_body>> parser_;
    std::shared_ptr<const Router> router_;
    std::shared_ptr<concurrency::ThreadPool> pool_;

    std::mutex mutex_;
    bool handling_ = false;
    bool closing_ = false;
    bool oversized_ = false;
};

}
