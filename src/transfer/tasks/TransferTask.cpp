#include "transfer/tasks/TransferTask.hpp"
#include "transfer/Manager.hpp"
#include "cache/Loader.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fstream>
#include <unordered_set>

using namespace skiff::transfer::tasks;
using namespace skiff::transfer::model;
using namespace skiff;

namespace fs = std::filesystem;

namespace {

remote::ProgressCallback throttled(const uintmax_t chunk, const uintmax_t size,
                                   std::function<void(uintmax_t)> report) {
    auto last = std::make_shared<uintmax_t>(0);
    return [chunk, size, report = std::move(report), last](const uintmax_t bytes) {
        if (bytes == *last) return;
        if (bytes - std::min(bytes, *last) < chunk && bytes < size) return;
        *last = bytes;
        report(bytes);
    };
}

}

TransferTask::TransferTask(Context ctx, std::string transferId)
    : ctx_(std::move(ctx)), transferId_(std::move(transferId)) {}

void TransferTask::operator()() {
    bool completed = false;

    try {
        run();
        completed = ctx_.manager.getTransfer(transferId_).status == TransferStatus::Completed;
    } catch (const std::exception& e) {
        log::Registry::transfer()->error("[TransferTask] Transfer {} aborted: {}", transferId_, e.what());
    }

    try {
        ctx_.manager.release(transferId_);
    } catch (const NotFound& e) {
        log::Registry::transfer()->warn("[TransferTask] {}", e.what());
    }

    promise.set_value(completed);
}

bool TransferTask::cancelled() const {
    return ctx_.manager.isCancelled(transferId_);
}

remote::ProgressCallback TransferTask::fileProgress(const std::string& fileId, const uintmax_t size) const {
    auto& manager = ctx_.manager;
    const auto& id = transferId_;
    return throttled(ctx_.config.chunk_size_bytes, size, [&manager, id, fileId](const uintmax_t bytes) {
        manager.updateFileStatus(id, fileId, FileStatus::InProgress, bytes);
    });
}

remote::ProgressCallback TransferTask::ownProgress(const uintmax_t size) const {
    auto& manager = ctx_.manager;
    const auto& id = transferId_;
    return throttled(ctx_.config.chunk_size_bytes, size, [&manager, id](const uintmax_t bytes) {
        manager.updateStatus(id, FileStatus::InProgress, bytes);
    });
}

bool TransferTask::existsInRemoteFolder(const std::string& folderId, const std::string& name, const remote::Kind kind) const {
    const auto listing = ctx_.loader->fetch(cache::ListingKey::remote(folderId));
    return std::ranges::any_of(listing, [&](const remote::Entry& e) { return e.name == name && e.kind == kind; });
}

bool TransferTask::existsInLocalDir(const fs::path& dir, const std::string& name) const {
    if (!fs::is_directory(dir)) return false;
    const auto listing = ctx_.loader->fetch(cache::ListingKey::local(dir.string()));
    return std::ranges::any_of(listing, [&](const remote::Entry& e) { return e.name == name && !e.isFolder(); });
}

std::optional<std::string> TransferTask::findRemoteFolder(const std::string& parentId, const std::string& name) const {
    const auto listing = ctx_.loader->fetch(cache::ListingKey::remote(parentId));
    const auto it = std::ranges::find_if(listing, [&](const remote::Entry& e) { return e.isFolder() && e.name == name; });
    if (it == listing.end()) return std::nullopt;
    return it->id;
}

std::string TransferTask::ensureRemoteFolder(const std::string& parentId, const std::string& name) const {
    if (ctx_.config.use_existing_folders)
        if (auto existing = findRemoteFolder(parentId, name)) return *existing;

    ctx_.loader->cache()->invalidate(cache::ListingKey::remote(parentId));
    auto id = ctx_.store->createFolder(parentId, name);
    log::Registry::transfer()->debug("[TransferTask] Created remote folder {} ({}) under {}", name, id, parentId);
    return id;
}

std::string TransferTask::uploadFile(const fs::path& path, const std::string& parentId,
                                     const remote::ProgressCallback& progress) const {
    const auto size = fs::file_size(path);
    std::ifstream in(path, std::ios::binary);
    if (!in) throw LocalIO("Cannot open " + path.string() + " for reading");

    auto id = ctx_.store->upload(parentId, path.filename().string(), in, size, progress);
    ctx_.loader->cache()->invalidate(cache::ListingKey::remote(parentId));
    return id;
}

fs::path TransferTask::downloadFile(const std::string& fileId, const fs::path& dir,
                                    const std::string& name, const remote::ProgressCallback& progress) const {
    fs::create_directories(dir);
    const auto target = dir / name;
    const auto part = dir / (name + ".part");

    try {
        {
            std::ofstream out(part, std::ios::binary | std::ios::trunc);
            if (!out) throw LocalIO("Cannot open " + part.string() + " for writing");
            ctx_.store->download(fileId, out, progress);
            out.close();
            if (!out) throw LocalIO("Failed to flush " + part.string());
        }
        fs::rename(part, target);
    } catch (const std::exception&) {
        std::error_code ec;
        fs::remove(part, ec);
        throw;
    }

    ctx_.loader->cache()->invalidate(cache::ListingKey::local(dir.string()));
    return target;
}

bool TransferTask::isExcluded(const fs::path& path) const {
    const auto ext = remote::lowercase(path.extension().string());
    if (ext.empty()) return false;
    return std::ranges::any_of(ctx_.config.excluded_extensions,
                               [&](const std::string& x) { return remote::lowercase(x) == ext; });
}

void TransferTask::failFile(const std::string& fileId, const std::exception& e) const {
    const auto code = classify(e);
    try {
        ctx_.manager.updateFileStatus(transferId_, fileId, FileStatus::Error, 0, describeFailure(code, e.what()), code);
    } catch (const InvalidState& ise) {
        log::Registry::transfer()->debug("[TransferTask] Dropped failure for {}: {}", fileId, ise.what());
    }
}

void TransferTask::failTransfer(const std::exception& e) const {
    const auto code = classify(e);
    try {
        ctx_.manager.updateStatus(transferId_, FileStatus::Error, 0, describeFailure(code, e.what()), code);
    } catch (const InvalidState& ise) {
        log::Registry::transfer()->debug("[TransferTask] Dropped failure for {}: {}", transferId_, ise.what());
    }
}

bool TransferTask::failFolder(const FileDescriptor& folder, const std::optional<std::string>& resultId,
                              const std::exception& e) const {
    try {
        ctx_.manager.addFileToTransfer(transferId_, folder);
        if (resultId) ctx_.manager.setFileResult(transferId_, folder.id, *resultId);
    } catch (const InvalidState& ise) {
        if (cancelled()) return false;
        log::Registry::transfer()->error("[TransferTask] Could not record failed folder {}: {}", folder.name, ise.what());
        return true;
    }

    failFile(folder.id, e);
    return true;
}

void TransferTask::transferPendingFiles(const std::function<void(const FileTransfer&)>& transferOne) {
    std::unordered_set<std::string> attempted;

    while (true) {
        std::vector<FileTransfer> batch;
        for (auto& file : ctx_.manager.getTransfer(transferId_).pendingFiles())
            if (!attempted.contains(file.id)) batch.push_back(std::move(file));
        if (batch.empty()) return;

        for (const auto& file : batch) {
            if (cancelled()) {
                log::Registry::transfer()->info("[TransferTask] Transfer {} cancelled; stopping before {}", transferId_, file.name);
                return;
            }

            attempted.insert(file.id);

            try {
                transferOne(file);
            } catch (const InvalidState& e) {
                if (cancelled()) return;
                failFile(file.id, e);
            } catch (const std::exception& e) {
                log::Registry::transfer()->error("[TransferTask] {} failed: {}", file.name, e.what());
                failFile(file.id, e);
            }
        }
    }
}

std::string TransferTask::childPath(const std::string& relative, const std::string& name) {
    return relative.empty() ? name : relative + "/" + name;
}
