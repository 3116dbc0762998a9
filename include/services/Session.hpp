#pragma once

#include "config/Config.hpp"

#include <memory>

namespace skiff::remote { class Store; class Editor; }
namespace skiff::cache { class Registry; class Loader; class SweepService; }
namespace skiff::transfer { class Manager; class Controller; }

namespace skiff::services {

// Owns every long-lived component of one application session and wires them
// together. Handles are passed by reference from here; nothing is global.
class Session {
public:
    Session(const config::Config& cfg, std::shared_ptr<remote::Store> store);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void start();
    void stop();

    [[nodiscard]] remote::Store& store() const { return *store_; }
    [[nodiscard]] cache::Registry& cache() const { return *cache_; }
    [[nodiscard]] cache::Loader& loader() const { return *loader_; }
    [[nodiscard]] transfer::Manager& transfers() const { return *manager_; }
    [[nodiscard]] transfer::Controller& controller() const { return *controller_; }
    [[nodiscard]] remote::Editor& editor() const { return *editor_; }

private:
    config::Config config_;
    std::shared_ptr<remote::Store> store_;
    std::shared_ptr<cache::Registry> cache_;
    std::shared_ptr<cache::Loader> loader_;
    std::unique_ptr<transfer::Manager> manager_;
    std::unique_ptr<transfer::Controller> controller_;
    std::unique_ptr<remote::Editor> editor_;
    std::unique_ptr<cache::SweepService> sweeper_;
};

}
