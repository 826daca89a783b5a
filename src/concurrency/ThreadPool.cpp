#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>

using namespace sg::concurrency;
using namespace sg::logging;

ThreadPool::ThreadPool(unsigned int nThreads) : state_(std::make_shared<State>()) {
    if (nThreads == 0) nThreads = std::max(std::thread::hardware_concurrency(), 4u);
    for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop(const std::chrono::milliseconds gracefulTimeout) {
    bool drained;
    {
        std::unique_lock lock(state_->mutex);
        if (threads_.empty()) return;

        std::queue<std::shared_ptr<Task>> empty;
        std::swap(state_->queue, empty);
        state_->stop = true;
        state_->cv.notify_all();

        drained = state_->exited.wait_for(lock, gracefulTimeout, [this] { return state_->running == 0; });
    }

    if (!drained)
        LogRegistry::gateway()->warn("[ThreadPool] Workers still busy after {} ms, detaching them",
                                     gracefulTimeout.count());

    for (auto& t : threads_) {
        if (!t.joinable()) continue;
        if (drained) t.join();
        else t.detach();
    }
    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(state_->mutex);
        if (state_->stop) return;
        state_->queue.push(std::move(task));
    }
    state_->cv.notify_one();
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(state_->mutex);
    return state_->queue.size();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    {
        std::scoped_lock lock(state_->mutex);
        ++state_->running;
    }

    threads_.emplace_back([state = state_] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(state->mutex);
                state->cv.wait(lock, [&state] { return state->stop || !state->queue.empty(); });
                if (state->stop) break;

                task = std::move(state->queue.front());
                state->queue.pop();
            }

            try {
                (*task)();
            } catch (const std::exception& e) {
                LogRegistry::gateway()->error("[ThreadPool] {} threw: {}", task->name(), e.what());
            }
        }

        std::scoped_lock lock(state->mutex);
        if (--state->running == 0) state->exited.notify_all();
    });
}
