#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace skiff::concurrency;
using namespace skiff;

namespace {

template <typename... Args>
void serviceLog(const spdlog::level::level_enum lvl, fmt::format_string<Args...> format, Args&&... args) {
    if (log::Registry::isInitialized()) log::Registry::skiff()->log(lvl, format, std::forward<Args>(args)...);
}

}

AsyncService::AsyncService(std::string serviceName)
    : serviceName_(std::move(serviceName)) {}

AsyncService::~AsyncService() {
    if (worker_.joinable()) {
        interruptFlag_.store(true, std::memory_order_release);
        sleepCv_.notify_all();
        if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
        else worker_.detach();
    }
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            serviceLog(spdlog::level::err, "[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    serviceLog(spdlog::level::info, "[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    serviceLog(spdlog::level::info, "[{}] Stopping service...", serviceName_);
    {
        std::scoped_lock lock(sleepMutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    sleepCv_.notify_all();

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    serviceLog(spdlog::level::info, "[{}] Service stopped.", serviceName_);
}
