#include "cache/SweepService.hpp"
#include "cache/Registry.hpp"
#include "log/Registry.hpp"

using namespace skiff::cache;
using namespace skiff;

SweepService::SweepService(std::shared_ptr<Registry> cache, const std::chrono::milliseconds interval)
    : AsyncService("CacheSweeper"), cache_(std::move(cache)), sweep_interval_(interval) {}

SweepService::~SweepService() {
    stop();
}

void SweepService::runLoop() {
    while (!shouldStop()) {
        lazySleep(sweep_interval_);
        if (shouldStop()) break;

        const auto removed = cache_->sweep();
        ++sweeps_;
        if (removed > 0) log::Registry::cache()->debug("[CacheSweeper] Evicted {} stale listings", removed);
    }
}
