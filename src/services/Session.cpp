#include "services/Session.hpp"
#include "remote/Store.hpp"
#include "remote/Editor.hpp"
#include "cache/Registry.hpp"
#include "cache/Loader.hpp"
#include "cache/SweepService.hpp"
#include "transfer/Manager.hpp"
#include "transfer/Controller.hpp"
#include "log/Registry.hpp"

using namespace skiff::services;
using namespace skiff;

Session::Session(const config::Config& cfg, std::shared_ptr<remote::Store> store)
    : config_(cfg),
      store_(std::move(store)),
      cache_(std::make_shared<cache::Registry>(config_.caching)),
      loader_(std::make_shared<cache::Loader>(cache_, store_, config_.transfers.max_concurrent_loads)),
      manager_(std::make_unique<transfer::Manager>()),
      controller_(std::make_unique<transfer::Controller>(*manager_, store_, loader_, config_.transfers)),
      editor_(std::make_unique<remote::Editor>(store_, cache_)),
      sweeper_(std::make_unique<cache::SweepService>(cache_, config_.caching.cleanupInterval())) {}

Session::~Session() {
    stop();
}

void Session::start() {
    log::Registry::skiff()->info("[Session] Starting: {} transfer workers, {} load workers, cache max age {}m",
                                 config_.transfers.max_concurrent_transfers,
                                 config_.transfers.max_concurrent_loads,
                                 config_.caching.max_age_minutes);
    sweeper_->start();
}

void Session::stop() {
    sweeper_->stop();
    controller_->stop();
    loader_->stop();
}
