#pragma once

#include "config/Config.hpp"
#include "transfer/model/Transfer.hpp"

#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace skiff::remote { class Store; }
namespace skiff::cache { class Loader; }
namespace skiff::concurrency { class ThreadPool; }

namespace skiff::transfer {

class Manager;

// Command surface for the presentation layer. Every command that starts work
// hands the transfer to a pool worker and returns immediately.
class Controller {
public:
    struct Dispatched {
        model::Transfer transfer;
        std::future<bool> done;   // true when the run ended with the transfer completed
    };

    Controller(Manager& manager, std::shared_ptr<remote::Store> store,
               std::shared_ptr<cache::Loader> loader, config::TransfersConfig cfg);
    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    Dispatched upload(const std::filesystem::path& localPath, const std::string& parentId);

    Dispatched download(const std::string& remoteId, const std::filesystem::path& localDir);

    void cancel(const std::string& transferId);

    // Resets failed files and runs the transfer again over what is pending.
    // Returns nothing when there was nothing to retry.
    std::optional<std::future<bool>> retry(const std::string& transferId,
                                           const std::optional<std::vector<std::string>>& fileIds = std::nullopt);

    std::vector<std::string> clearCompleted();

    void stop();

    [[nodiscard]] Manager& manager() const { return manager_; }
    [[nodiscard]] unsigned int workerCount() const;

private:
    Manager& manager_;
    std::shared_ptr<remote::Store> store_;
    std::shared_ptr<cache::Loader> loader_;
    config::TransfersConfig config_;
    std::unique_ptr<concurrency::ThreadPool> pool_;

    // Caller must hold ownership of the transfer
    std::future<bool> submit(const model::Transfer& transfer);
};

}
