#include "transfer/model/Transfer.hpp"

#include <algorithm>
#include <iterator>
#include <nlohmann/json.hpp>

namespace skiff::transfer::model {

TransferStatus aggregate(const std::vector<FileTransfer>& files) {
    size_t pending = 0, inProgress = 0, done = 0, errors = 0;
    for (const auto& f : files) {
        switch (f.status) {
            case FileStatus::Pending: ++pending; break;
            case FileStatus::InProgress: ++inProgress; break;
            case FileStatus::Completed:
            case FileStatus::Skipped: ++done; break;
            case FileStatus::Error: ++errors; break;
        }
    }

    if (files.empty() || pending == files.size()) return TransferStatus::Pending;
    if (errors == files.size()) return TransferStatus::Error;
    if (inProgress > 0 || pending > 0) return TransferStatus::InProgress;
    if (errors > 0) return TransferStatus::CompletedWithErrors;
    return TransferStatus::Completed;
}

uintmax_t Transfer::totalBytes() const {
    if (!isFolder()) return size;
    uintmax_t total = 0;
    for (const auto& f : files) total += f.size;
    return total;
}

uintmax_t Transfer::bytesTransferred() const {
    if (!isFolder()) return bytes_transferred;
    uintmax_t total = 0;
    for (const auto& f : files) total += f.bytes_transferred;
    return total;
}

double Transfer::progress() const {
    if (!isFolder()) {
        if (status == TransferStatus::Completed) return 1.0;
        if (size == 0) return 0.0;
        return std::min(1.0, static_cast<double>(bytes_transferred) / static_cast<double>(size));
    }

    uintmax_t total = 0, finished = 0;
    for (const auto& f : files) {
        total += f.size;
        if (isDone(f.status)) finished += f.size;
    }
    if (total == 0) return 0.0;
    return static_cast<double>(finished) / static_cast<double>(total);
}

FileTransfer* Transfer::findFile(const std::string& fileId) {
    const auto it = std::ranges::find(files, fileId, &FileTransfer::id);
    return it == files.end() ? nullptr : &*it;
}

const FileTransfer* Transfer::findFile(const std::string& fileId) const {
    const auto it = std::ranges::find(files, fileId, &FileTransfer::id);
    return it == files.end() ? nullptr : &*it;
}

std::vector<FileTransfer> Transfer::failedFiles() const {
    std::vector<FileTransfer> out;
    std::ranges::copy_if(files, std::back_inserter(out),
                         [](const FileTransfer& f) { return f.status == FileStatus::Error; });
    return out;
}

std::vector<FileTransfer> Transfer::pendingFiles() const {
    std::vector<FileTransfer> out;
    std::ranges::copy_if(files, std::back_inserter(out),
                         [](const FileTransfer& f) { return f.status == FileStatus::Pending; });
    return out;
}

void Transfer::recompute() {
    if (status == TransferStatus::Cancelled || !isAggregated()) return;
    status = aggregate(files);
}

void to_json(nlohmann::json& j, const Transfer& t) {
    j = {
        {"id", t.id},
        {"kind", to_string(t.kind)},
        {"direction", to_string(t.direction)},
        {"name", t.name},
        {"source", t.source},
        {"destination", t.destination},
        {"status", to_string(t.status)},
        {"progress", t.progress()},
        {"total_bytes", t.totalBytes()},
        {"bytes_transferred", t.bytesTransferred()},
        {"retry_count", t.retry_count},
        {"created", t.created},
        {"files", t.files}
    };

    if (t.completed) j["completed"] = *t.completed;
    else j["completed"] = nullptr;
    if (t.error) j["error"] = *t.error;
    if (t.error_code) j["error_code"] = skiff::to_string(*t.error_code);
    if (t.result_id) j["result_id"] = *t.result_id;
}

}
