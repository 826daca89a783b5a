#pragma once

#include "Task.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace sg::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drops queued tasks, waits up to gracefulTimeout for running ones, then detaches the rest.
    void stop(std::chrono::milliseconds gracefulTimeout = std::chrono::milliseconds(1200));

    void submit(std::shared_ptr<Task> task);

    size_t queueDepth() const;

    [[nodiscard]] unsigned int workerCount() const;

private:
    // Shared with the workers so a detached straggler never outlives what it touches.
    struct State {
        std::condition_variable cv;
        std::condition_variable exited;
        mutable std::mutex mutex;
        std::queue<std::shared_ptr<Task>> queue;
        unsigned int running = 0;
        bool stop = false;
    };

    void spawnWorker();

    std::shared_ptr<State> state_;
    std::vector<std::thread> threads_;
};

}
