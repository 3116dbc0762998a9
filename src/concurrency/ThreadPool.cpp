#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace skiff::concurrency;
using namespace skiff;

ThreadPool::ThreadPool(std::string name, const unsigned int nThreads)
    : name_(std::move(name)), stopFlag(false) {
    const auto n = std::max(1u, nThreads);
    for (unsigned int i = 0; i < n; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    if (stopFlag.exchange(true)) return;

    {
        std::scoped_lock lock(mutex);
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(queue, empty);
    }

    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable() && t.get_id() != std::this_thread::get_id()) t.join();

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    if (stopFlag.load()) throw std::runtime_error("[ThreadPool:" + name_ + "] submit() after stop()");

    {
        std::scoped_lock lock(mutex);
        queue.push(std::move(task));
    }
    cv.notify_one();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            if (!task) continue;

            try {
                (*task)();
            } catch (const std::exception& e) {
                // tasks report through their promise; this only guards the worker
                if (log::Registry::isInitialized())
                    log::Registry::skiff()->error("[ThreadPool:{}] Task escaped with exception: {}", name_, e.what());
            }
        }
    });
}
