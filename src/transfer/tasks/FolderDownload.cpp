#include "transfer/tasks/FolderDownload.hpp"
#include "transfer/Manager.hpp"
#include "cache/Loader.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

using namespace skiff::transfer::tasks;
using namespace skiff::transfer::model;
using namespace skiff;

namespace fs = std::filesystem;

FolderDownload::FolderDownload(Context ctx, std::string transferId)
    : TransferTask(std::move(ctx), std::move(transferId)) {}

void FolderDownload::run() {
    const auto t = ctx_.manager.getTransfer(transferId_);
    if (t.status == TransferStatus::Cancelled) return;

    if (t.files.empty() && !enumerate(t)) return;

    transferPendingFiles([this](const FileTransfer& f) { transferOne(f); });

    const auto after = ctx_.manager.getTransfer(transferId_);
    if (after.files.empty() && after.status == TransferStatus::InProgress) {
        log::Registry::transfer()->info("[FolderDownloadTask] {} contains no files to download", t.name);
        ctx_.manager.updateStatus(transferId_, FileStatus::Completed, 0);
    }
}

bool FolderDownload::enumerate(const Transfer& transfer) {
    const auto root = fs::path(transfer.destination) / transfer.name;
    const PendingDir top{transfer.source, root, "", transfer.destination, ""};
    remote::Listing listing;

    try {
        ctx_.manager.updateStatus(transferId_, FileStatus::InProgress, 0);
        fs::create_directories(root);
        ctx_.loader->cache()->invalidate(cache::ListingKey::local(transfer.destination));
        ctx_.manager.setResult(transferId_, root.string());
        listing = ctx_.loader->fetch(cache::ListingKey::remote(transfer.source));
    } catch (const std::exception& e) {
        log::Registry::transfer()->error("[FolderDownloadTask] Cannot start download of {}: {}", transfer.source, e.what());
        failTransfer(e);
        return false;
    }

    return walk(top, listing);
}

bool FolderDownload::walk(const PendingDir& top, const remote::Listing& listing) {
    std::deque<PendingDir> queue;
    size_t registered = 0;

    if (!visit(top, listing, queue, registered)) return false;

    while (!queue.empty()) {
        if (cancelled()) return false;

        const auto dir = std::move(queue.front());
        queue.pop_front();

        remote::Listing entries;
        try {
            entries = ctx_.loader->fetch(cache::ListingKey::remote(dir.remoteId));
        } catch (const std::exception& e) {
            log::Registry::transfer()->error("[FolderDownloadTask] Could not enumerate {}: {}", dir.relative, e.what());
            if (!failFolder(describe(dir), dir.path.string(), e)) return false;
            continue;
        }

        if (!visit(dir, entries, queue, registered)) return false;
    }

    log::Registry::transfer()->debug("[FolderDownloadTask] Registered {} files under {}", registered, top.path.string());
    return true;
}

bool FolderDownload::visit(const PendingDir& dir, const remote::Listing& listing,
                           std::deque<PendingDir>& queue, size_t& registered) {
    for (const auto& entry : listing) {
        if (cancelled()) return false;

        const auto relative = childPath(dir.relative, entry.name);

        if (entry.isFolder()) {
            PendingDir sub{entry.id, dir.path / entry.name, relative, dir.path, dir.relative};
            try {
                fs::create_directories(sub.path);
            } catch (const std::exception& e) {
                log::Registry::transfer()->error("[FolderDownloadTask] Cannot create {}: {}", sub.path.string(), e.what());
                if (!failFolder(describe(sub), std::nullopt, e)) return false;
                continue;
            }
            queue.push_back(std::move(sub));
            continue;
        }

        try {
            ctx_.manager.addFileToTransfer(transferId_, {entry.id, entry.name, entry.size, dir.relative, dir.path.string()});
            ++registered;
        } catch (const InvalidState& e) {
            if (cancelled()) return false;
            log::Registry::transfer()->error("[FolderDownloadTask] Could not register {}: {}", relative, e.what());
        }
    }

    return true;
}

void FolderDownload::transferOne(const FileTransfer& file) {
    if (file.isFolder()) {
        resumeFolder(file);
        return;
    }

    if (existsInLocalDir(file.destination, file.name)) {
        ctx_.manager.markDuplicateSkip(transferId_, file.id);
        return;
    }

    ctx_.manager.updateFileStatus(transferId_, file.id, FileStatus::InProgress, 0);
    const auto written = downloadFile(file.id, file.destination, file.name, fileProgress(file.id, file.size));
    ctx_.manager.setFileResult(transferId_, file.id, written.string());
    ctx_.manager.updateFileStatus(transferId_, file.id, FileStatus::Completed, file.size);
}

void FolderDownload::resumeFolder(const FileTransfer& folder) {
    ctx_.manager.updateFileStatus(transferId_, folder.id, FileStatus::InProgress, 0);

    const PendingDir dir{folder.id, fs::path(folder.destination) / folder.name,
                         childPath(folder.relative_dir, folder.name), folder.destination, folder.relative_dir};
    fs::create_directories(dir.path);
    ctx_.manager.setFileResult(transferId_, folder.id, dir.path.string());

    const auto listing = ctx_.loader->refresh(cache::ListingKey::remote(folder.id));
    if (!walk(dir, listing)) return;

    ctx_.manager.updateFileStatus(transferId_, folder.id, FileStatus::Completed, 0);
}

FileDescriptor FolderDownload::describe(const PendingDir& dir) {
    return {dir.remoteId, dir.path.filename().string(), 0, dir.parentRelative, dir.parentPath.string(), remote::Kind::Folder};
}
