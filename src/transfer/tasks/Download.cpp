#include "transfer/tasks/Download.hpp"
#include "transfer/Manager.hpp"
#include "log/Registry.hpp"

using namespace skiff::transfer::tasks;
using namespace skiff::transfer::model;
using namespace skiff;

namespace fs = std::filesystem;

Download::Download(Context ctx, std::string transferId)
    : TransferTask(std::move(ctx), std::move(transferId)) {}

void Download::run() {
    const auto t = ctx_.manager.getTransfer(transferId_);
    if (t.status != TransferStatus::Pending) {
        log::Registry::transfer()->debug("[DownloadTask] Transfer {} is {}, nothing to do", transferId_, to_string(t.status));
        return;
    }

    const fs::path dir(t.destination);

    try {
        if (existsInLocalDir(dir, t.name)) {
            ctx_.manager.markDuplicateSkip(transferId_);
            return;
        }

        ctx_.manager.updateStatus(transferId_, FileStatus::InProgress, 0);
        const auto written = downloadFile(t.source, dir, t.name, ownProgress(t.size));
        ctx_.manager.setResult(transferId_, written.string());
        ctx_.manager.updateStatus(transferId_, FileStatus::Completed, t.size);
    } catch (const std::exception& e) {
        log::Registry::transfer()->error("[DownloadTask] Failed to download file: {} - {}", t.source, e.what());
        failTransfer(e);
    }
}
