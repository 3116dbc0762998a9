#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>
#include <memory>

namespace skiff::cache {

class Registry;

class SweepService final : public concurrency::AsyncService {
public:
    SweepService(std::shared_ptr<Registry> cache, std::chrono::milliseconds interval);
    ~SweepService() override;

    [[nodiscard]] uint64_t sweepCount() const { return sweeps_.load(); }

protected:
    void runLoop() override;

private:
    std::shared_ptr<Registry> cache_;
    std::chrono::milliseconds sweep_interval_;
    std::atomic<uint64_t> sweeps_{0};
};

}
