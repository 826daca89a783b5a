#include "protocols/http/Server.hpp"
#include "protocols/http/Session.hpp"
#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

using namespace sg::protocols::http;
using namespace sg::concurrency;
using sg::logging::LogRegistry;

Server::Server(net::io_context& ioc, const tcp::endpoint& endpoint,
               std::shared_ptr<const Router> router,
               std::shared_ptr<ThreadPool> pool)
    : TcpServerBase(ioc, endpoint, protocols::TcpServerOptions{ .acceptConcurrency = 1 }),
      router_(std::move(router)), pool_(std::move(pool)) {}

void Server::onAccept(tcp::socket socket) {
    auto session = std::make_shared<Session>(std::move(socket), router_, pool_);
    {
        std::scoped_lock lock(sessionsMutex_);
        std::erase_if(sessions_, [](const auto& s) { return s.expired(); });
        sessions_.push_back(session);
    }
    session->run();
}

void Server::onStop() {
    std::vector<std::weak_ptr<Session>> open;
    {
        std::scoped_lock lock(sessionsMutex_);
        open.swap(sessions_);
    }

    size_t closing = 0;
    for (const auto& weak : open) {
        if (const auto s = weak.lock()) {
            s->shutdown();
            ++closing;
        }
    }
    if (closing) LogRegistry::http()->debug("[HttpServer] Closing {} open connection(s)", closing);
}

