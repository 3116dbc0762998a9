// Services
#include "services/Session.hpp"

// Core
#include "cache/Loader.hpp"
#include "remote/LocalStore.hpp"
#include "transfer/Controller.hpp"
#include "transfer/Manager.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "util/paths.hpp"

// Libraries
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <nlohmann/json.hpp>

using namespace skiff;
using namespace skiff::config;

namespace {
std::atomic shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}

constexpr auto USAGE =
    "usage: skiff [-c config.yaml] upload <local-path> <store-root> [parent-id]\n"
    "       skiff [-c config.yaml] download <store-root> <remote-id> <local-dir>\n"
    "       skiff [-c config.yaml] ls <store-root> [folder-id]\n";

// Waits for a dispatched transfer, cancelling it on SIGINT/SIGTERM
int awaitTransfer(services::Session& session, transfer::Controller::Dispatched& dispatched) {
    bool cancelRequested = false;
    while (dispatched.done.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
        if (shouldExit && !cancelRequested) {
            log::Registry::skiff()->info("[!] Signal received. Cancelling transfer {}...", dispatched.transfer.id);
            try {
                session.controller().cancel(dispatched.transfer.id);
            } catch (const InvalidState& e) {
                log::Registry::skiff()->debug("[!] {}", e.what());
            }
            cancelRequested = true;
        }
    }

    const bool completed = dispatched.done.get();
    const nlohmann::json snapshot = session.transfers().getTransfer(dispatched.transfer.id);
    std::cout << snapshot.dump(2) << std::endl;
    return completed ? 0 : 1;
}

int listFolder(services::Session& session, const std::string& folderId) {
    int rc = 1;
    auto done = session.loader().load(cache::ListingKey::remote(folderId), [&rc](const cache::LoadResult& result) {
        if (result.ok()) {
            const nlohmann::json listing = *result.entries;
            std::cout << listing.dump(2) << std::endl;
            rc = 0;
        } else {
            std::cerr << describeFailure(result.error, result.reason) << std::endl;
        }
    });
    done.wait();
    return rc;
}
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    if (args.size() >= 2 && args[0] == "-c") {
        paths::setConfigPath(args[1]);
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty()) {
        std::cerr << USAGE;
        return 2;
    }

    try {
        ConfigRegistry::init(paths::getConfigPath());
        const auto& cfg = ConfigRegistry::get();
        log::Registry::init(cfg.logging.log_dir.empty() ? paths::getLogPath() : cfg.logging.log_dir,
                            cfg.logging.levels);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        const auto& cmd = args[0];
        int rc = 2;

        if (cmd == "upload" && (args.size() == 3 || args.size() == 4)) {
            auto store = std::make_shared<remote::LocalStore>(args[2], cfg.transfers.chunk_size_bytes);
            services::Session session(cfg, store);
            session.start();
            auto dispatched = session.controller().upload(args[1], args.size() == 4 ? args[3] : store->rootId());
            rc = awaitTransfer(session, dispatched);
        } else if (cmd == "download" && args.size() == 4) {
            auto store = std::make_shared<remote::LocalStore>(args[1], cfg.transfers.chunk_size_bytes);
            services::Session session(cfg, store);
            session.start();
            auto dispatched = session.controller().download(args[2], args[3]);
            rc = awaitTransfer(session, dispatched);
        } else if (cmd == "ls" && (args.size() == 2 || args.size() == 3)) {
            auto store = std::make_shared<remote::LocalStore>(args[1], cfg.transfers.chunk_size_bytes);
            services::Session session(cfg, store);
            session.start();
            rc = listFolder(session, args.size() == 3 ? args[2] : store->rootId());
        } else {
            std::cerr << USAGE;
        }

        log::Registry::shutdown();
        return rc;
    } catch (const Error& e) {
        std::cerr << describeFailure(e.code(), e.what()) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "skiff: " << e.what() << std::endl;
    }

    if (log::Registry::isInitialized()) log::Registry::shutdown();
    return 1;
}
