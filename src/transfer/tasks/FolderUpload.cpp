#include "transfer/tasks/FolderUpload.hpp"
#include "transfer/Manager.hpp"
#include "cache/Loader.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

using namespace skiff::transfer::tasks;
using namespace skiff::transfer::model;
using namespace skiff;

namespace fs = std::filesystem;

FolderUpload::FolderUpload(Context ctx, std::string transferId)
    : TransferTask(std::move(ctx), std::move(transferId)) {}

void FolderUpload::run() {
    const auto t = ctx_.manager.getTransfer(transferId_);
    if (t.status == TransferStatus::Cancelled) return;

    // A resumed run only revisits children that are pending again
    if (t.files.empty() && !enumerate(t)) return;

    transferPendingFiles([this](const FileTransfer& f) { transferOne(f); });

    const auto after = ctx_.manager.getTransfer(transferId_);
    if (after.files.empty() && after.status == TransferStatus::InProgress) {
        log::Registry::transfer()->info("[FolderUploadTask] {} contains no files to upload", t.source);
        ctx_.manager.updateStatus(transferId_, FileStatus::Completed, 0);
    }
}

bool FolderUpload::enumerate(const Transfer& transfer) {
    const fs::path root(transfer.source);
    PendingDir top{root, "", "", transfer.destination, ""};
    remote::Listing listing;

    try {
        if (!fs::is_directory(root)) throw NotFound("Not a directory: " + root.string());
        ctx_.manager.updateStatus(transferId_, FileStatus::InProgress, 0);
        top.remoteId = ensureRemoteFolder(transfer.destination, root.filename().string());
        ctx_.manager.setResult(transferId_, top.remoteId);
        listing = ctx_.loader->refresh(cache::ListingKey::local(root.string()));
    } catch (const std::exception& e) {
        log::Registry::transfer()->error("[FolderUploadTask] Cannot start upload of {}: {}", root.string(), e.what());
        failTransfer(e);
        return false;
    }

    return walk(top, listing);
}

bool FolderUpload::walk(const PendingDir& top, const remote::Listing& listing) {
    std::deque<PendingDir> queue;
    size_t registered = 0;

    if (!visit(top, listing, queue, registered)) return false;

    while (!queue.empty()) {
        if (cancelled()) return false;

        const auto dir = std::move(queue.front());
        queue.pop_front();

        remote::Listing entries;
        try {
            entries = ctx_.loader->refresh(cache::ListingKey::local(dir.path.string()));
        } catch (const std::exception& e) {
            log::Registry::transfer()->error("[FolderUploadTask] Could not enumerate {}: {}", dir.path.string(), e.what());
            if (!failFolder(describe(dir), dir.remoteId, e)) return false;
            continue;
        }

        if (!visit(dir, entries, queue, registered)) return false;
    }

    log::Registry::transfer()->debug("[FolderUploadTask] Registered {} files under {}", registered, top.path.string());
    return true;
}

bool FolderUpload::visit(const PendingDir& dir, const remote::Listing& listing,
                         std::deque<PendingDir>& queue, size_t& registered) {
    for (const auto& entry : listing) {
        if (cancelled()) return false;

        const auto relative = childPath(dir.relative, entry.name);

        if (entry.isFolder()) {
            PendingDir sub{dir.path / entry.name, "", relative, dir.remoteId, dir.relative};
            try {
                sub.remoteId = ensureRemoteFolder(dir.remoteId, entry.name);
            } catch (const std::exception& e) {
                log::Registry::transfer()->error("[FolderUploadTask] Cannot create remote folder for {}: {}", relative, e.what());
                if (!failFolder(describe(sub), std::nullopt, e)) return false;
                continue;
            }
            queue.push_back(std::move(sub));
            continue;
        }

        if (isExcluded(entry.name)) {
            log::Registry::transfer()->debug("[FolderUploadTask] Excluded {}", relative);
            continue;
        }

        try {
            ctx_.manager.addFileToTransfer(transferId_, {entry.id, entry.name, entry.size, dir.relative, dir.remoteId});
            ++registered;
        } catch (const InvalidState& e) {
            if (cancelled()) return false;
            log::Registry::transfer()->error("[FolderUploadTask] Could not register {}: {}", relative, e.what());
        }
    }

    return true;
}

void FolderUpload::transferOne(const FileTransfer& file) {
    if (file.isFolder()) {
        resumeFolder(file);
        return;
    }

    if (existsInRemoteFolder(file.destination, file.name, remote::Kind::File)) {
        ctx_.manager.markDuplicateSkip(transferId_, file.id);
        return;
    }

    ctx_.manager.updateFileStatus(transferId_, file.id, FileStatus::InProgress, 0);
    const auto id = uploadFile(file.id, file.destination, fileProgress(file.id, file.size));
    ctx_.manager.setFileResult(transferId_, file.id, id);
    ctx_.manager.updateFileStatus(transferId_, file.id, FileStatus::Completed, file.size);
}

void FolderUpload::resumeFolder(const FileTransfer& folder) {
    ctx_.manager.updateFileStatus(transferId_, folder.id, FileStatus::InProgress, 0);

    PendingDir dir{folder.id, folder.result_id.value_or(""), childPath(folder.relative_dir, folder.name),
                   folder.destination, folder.relative_dir};
    if (dir.remoteId.empty()) {
        dir.remoteId = ensureRemoteFolder(folder.destination, folder.name);
        ctx_.manager.setFileResult(transferId_, folder.id, dir.remoteId);
    }

    const auto listing = ctx_.loader->refresh(cache::ListingKey::local(folder.id));
    if (!walk(dir, listing)) return;

    ctx_.manager.updateFileStatus(transferId_, folder.id, FileStatus::Completed, 0);
}

FileDescriptor FolderUpload::describe(const PendingDir& dir) {
    return {dir.path.string(), dir.path.filename().string(), 0, dir.parentRelative, dir.parentId, remote::Kind::Folder};
}
