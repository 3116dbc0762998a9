#pragma once

#include "Task.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace skiff::concurrency {

// Fixed-size pool; the worker count bounds how many tasks run at once.
class ThreadPool {
public:
    explicit ThreadPool(std::string name, unsigned int nThreads);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drops queued tasks and joins the workers; running tasks finish first.
    void stop();

    void submit(std::shared_ptr<Task> task);

    [[nodiscard]] unsigned int workerCount() const;

private:
    void spawnWorker();

    std::string name_;
    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

} // namespace skiff::concurrency
