#pragma once

#include "transfer/tasks/TransferTask.hpp"

#include <deque>

namespace skiff::transfer::tasks {

struct FolderDownload final : TransferTask {
    FolderDownload(Context ctx, std::string transferId);

protected:
    void run() override;

private:
    struct PendingDir {
        std::string remoteId;
        std::filesystem::path path;
        std::string relative;
        std::filesystem::path parentPath;
        std::string parentRelative;
    };

    // Creates the local root and lists the source. Returns false when the
    // transfer failed or was cancelled before every file was registered.
    bool enumerate(const model::Transfer& transfer);

    // Walks `top` breadth-first, creating local folders and registering one
    // child per file. A subfolder that cannot be created or listed is
    // recorded as a failed folder child and its siblings carry on.
    bool walk(const PendingDir& top, const remote::Listing& listing);
    bool visit(const PendingDir& dir, const remote::Listing& listing, std::deque<PendingDir>& queue, size_t& registered);

    void transferOne(const model::FileTransfer& file);
    void resumeFolder(const model::FileTransfer& folder);

    [[nodiscard]] static model::FileDescriptor describe(const PendingDir& dir);
};

}
