#pragma once

#include "concurrency/Task.hpp"
#include "config/Config.hpp"
#include "remote/Store.hpp"
#include "transfer/model/Transfer.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace skiff::cache { class Loader; }

namespace skiff::transfer {

class Manager;

namespace tasks {

// What every transfer task needs from the session
struct Context {
    Manager& manager;
    std::shared_ptr<remote::Store> store;
    std::shared_ptr<cache::Loader> loader;
    config::TransfersConfig config;
};

// Drives one transfer that the caller has already acquired from the Manager.
// Ownership is released when the task finishes; the future resolves to
// true when the transfer ended as completed.
class TransferTask : public concurrency::PromisedTask {
public:
    TransferTask(Context ctx, std::string transferId);

    void operator()() final;

    [[nodiscard]] const std::string& transferId() const { return transferId_; }

protected:
    Context ctx_;
    std::string transferId_;

    virtual void run() = 0;

    [[nodiscard]] bool cancelled() const;

    // Throttled to one report per chunk, plus the final byte count
    [[nodiscard]] remote::ProgressCallback fileProgress(const std::string& fileId, uintmax_t size) const;
    [[nodiscard]] remote::ProgressCallback ownProgress(uintmax_t size) const;

    // Name + kind match in the destination listing. Existence alone counts.
    [[nodiscard]] bool existsInRemoteFolder(const std::string& folderId, const std::string& name, remote::Kind kind) const;
    [[nodiscard]] bool existsInLocalDir(const std::filesystem::path& dir, const std::string& name) const;

    [[nodiscard]] std::optional<std::string> findRemoteFolder(const std::string& parentId, const std::string& name) const;

    // Reuses a same-named folder when configured to, otherwise creates one
    std::string ensureRemoteFolder(const std::string& parentId, const std::string& name) const;

    std::string uploadFile(const std::filesystem::path& path, const std::string& parentId,
                           const remote::ProgressCallback& progress) const;

    std::filesystem::path downloadFile(const std::string& fileId, const std::filesystem::path& dir,
                                       const std::string& name, const remote::ProgressCallback& progress) const;

    [[nodiscard]] bool isExcluded(const std::filesystem::path& path) const;

    // Records a failure on one file; failures that race with a cancel are dropped
    void failFile(const std::string& fileId, const std::exception& e) const;
    void failTransfer(const std::exception& e) const;

    // Registers a subtree that could not be walked as a failed folder child, so
    // it lands in the error set and a retry walks it again. False after a cancel.
    bool failFolder(const model::FileDescriptor& folder, const std::optional<std::string>& resultId,
                    const std::exception& e) const;

    // Hands every pending child of a folder transfer to `transferOne`, one at a
    // time, stopping at the first file boundary after a cancel. Children
    // registered along the way are picked up before returning.
    void transferPendingFiles(const std::function<void(const model::FileTransfer&)>& transferOne);

    [[nodiscard]] static std::string childPath(const std::string& relative, const std::string& name);
};

}

}
