#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace skiff::concurrency {

class AsyncService {
public:
    explicit AsyncService(std::string serviceName);

    virtual ~AsyncService();

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    [[nodiscard]] bool shouldStop() const { return interruptFlag_.load(std::memory_order_acquire); }

    // Sleeps for up to `duration`; returns early once stop() is requested.
    template <typename Rep, typename Period>
    void lazySleep(const std::chrono::duration<Rep, Period>& duration) {
        std::unique_lock lock(sleepMutex_);
        sleepCv_.wait_for(lock, duration, [this] { return shouldStop(); });
    }

    virtual void runLoop() = 0;

private:
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
};

}
