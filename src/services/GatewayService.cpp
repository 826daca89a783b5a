#include "services/GatewayService.hpp"
#include "config/Config.hpp"
#include "concurrency/ThreadPool.hpp"
#include "gateway/Gateway.hpp"
#include "logging/LogRegistry.hpp"
#include "protocols/TCPAcceptor.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/Server.hpp"
#include "transport/CurlTransport.hpp"

using namespace sg::services;
using namespace sg::logging;

GatewayService::GatewayService(const config::Config& cfg) : cfg_(cfg) {}

GatewayService::~GatewayService() {
    stop();
}

void GatewayService::start() {
    if (running_) return;

    transport::CurlTransportOptions opts;
    opts.connectTimeoutSeconds = cfg_.fetch.connect_timeout_seconds;
    opts.exchangeTimeoutSeconds = cfg_.backend.timeout_seconds;
    opts.lowSpeedSeconds = cfg_.fetch.low_speed_seconds;

    auto gw = std::make_shared<const gateway::Gateway>(cfg_, std::make_shared<transport::CurlTransport>(opts));
    auto router = std::make_shared<const protocols::http::Router>(std::move(gw));

    pool_ = std::make_shared<concurrency::ThreadPool>(cfg_.server.worker_threads);
    ioContext_ = std::make_shared<asio::io_context>();

    const auto endpoint = protocols::resolveListenEndpoint(cfg_.server.host, cfg_.server.port);
    server_ = std::make_shared<protocols::http::Server>(*ioContext_, endpoint, std::move(router), pool_);
    server_->run();

    ioThread_ = std::thread([ctx = ioContext_] {
        try {
            ctx->run();
        } catch (const std::exception& e) {
            LogRegistry::gateway()->error("[GatewayService] io_context stopped on error: {}", e.what());
        }
    });

    running_ = true;
    LogRegistry::gateway()->info("[GatewayService] Serving {} with {} workers, backend {}",
                                 cfg_.gateway.public_address, pool_->workerCount(), cfg_.backend.address);
}

void GatewayService::stop() {
    if (!running_) return;
    running_ = false;

    LogRegistry::gateway()->info("[GatewayService] Stopping...");
    // closing the acceptor and every idle connection leaves the io_context without work, so run() returns
    server_->stop();
    if (ioThread_.joinable()) ioThread_.join();
    pool_->stop();

    server_.reset();
    LogRegistry::gateway()->info("[GatewayService] Stopped.");
}
