#pragma once

#include "concurrency/Task.hpp"
#include "protocols/http/Session.hpp"
#include "logging/LogRegistry.hpp"

#include <chrono>

namespace sg::protocols::http {

// Answers one parsed request on a pool worker.
struct RequestTask final : concurrency::Task {
    using clock = std::chrono::steady_clock;

    std::shared_ptr<Session> session;
    clock::time_point queuedAt;

    RequestTask(std::shared_ptr<Session> s, const clock::time_point queued)
        : session(std::move(s)), queuedAt(queued) {}

    void operator()() override {
        const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - queuedAt);
        if (waited.count() > 100)
            logging::LogRegistry::http()->warn("[RequestTask] Request waited {} ms for a worker", waited.count());
        session->serve();
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "http-request"; }
};

}
