#include "transfer/tasks/Upload.hpp"
#include "transfer/Manager.hpp"
#include "log/Registry.hpp"

using namespace skiff::transfer::tasks;
using namespace skiff::transfer::model;
using namespace skiff;

namespace fs = std::filesystem;

Upload::Upload(Context ctx, std::string transferId)
    : TransferTask(std::move(ctx), std::move(transferId)) {}

void Upload::run() {
    const auto t = ctx_.manager.getTransfer(transferId_);
    if (t.status != TransferStatus::Pending) {
        log::Registry::transfer()->debug("[UploadTask] Transfer {} is {}, nothing to do", transferId_, to_string(t.status));
        return;
    }

    const fs::path path(t.source);

    try {
        if (existsInRemoteFolder(t.destination, path.filename().string(), remote::Kind::File)) {
            ctx_.manager.markDuplicateSkip(transferId_);
            return;
        }

        ctx_.manager.updateStatus(transferId_, FileStatus::InProgress, 0);
        const auto id = uploadFile(path, t.destination, ownProgress(t.size));
        ctx_.manager.setResult(transferId_, id);
        ctx_.manager.updateStatus(transferId_, FileStatus::Completed, t.size);
    } catch (const std::exception& e) {
        log::Registry::transfer()->error("[UploadTask] Failed to upload file: {} - {}", path.string(), e.what());
        failTransfer(e);
    }
}
