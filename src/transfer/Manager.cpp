#include "transfer/Manager.hpp"
#include "transfer/Observer.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>

using namespace skiff::transfer;
using namespace skiff::transfer::model;
using namespace skiff;

namespace skiff::transfer {

void to_json(nlohmann::json& j, const FailedFile& f) {
    j = f.file;
    j["transfer_id"] = f.transfer_id;
}

void to_json(nlohmann::json& j, const TransferStats& s) {
    j = {
        {"transfers", s.transfers},
        {"active", s.active},
        {"cancelled", s.cancelled},
        {"pending", s.pending},
        {"in_progress", s.in_progress},
        {"completed", s.completed},
        {"skipped", s.skipped},
        {"failed", s.failed},
        {"total_bytes", s.total_bytes},
        {"transferred_bytes", s.transferred_bytes},
        {"progress", s.progress},
        {"bytes_per_second", s.bytes_per_second}
    };
}

}

namespace {

TransferStatus toTransferStatus(const FileStatus status) {
    switch (status) {
        case FileStatus::Pending: return TransferStatus::Pending;
        case FileStatus::InProgress: return TransferStatus::InProgress;
        case FileStatus::Completed:
        case FileStatus::Skipped: return TransferStatus::Completed;
        case FileStatus::Error: return TransferStatus::Error;
    }
    return TransferStatus::Error;
}

// File status implied by a childless transfer's own status
FileStatus ownFileStatus(const Transfer& t, const bool inFlight) {
    switch (t.status) {
        case TransferStatus::Pending: return FileStatus::Pending;
        case TransferStatus::InProgress: return FileStatus::InProgress;
        case TransferStatus::Completed: return FileStatus::Completed;
        case TransferStatus::CompletedWithErrors:
        case TransferStatus::Error: return FileStatus::Error;
        case TransferStatus::Cancelled: return inFlight ? FileStatus::InProgress : FileStatus::Pending;
    }
    return FileStatus::Pending;
}

void checkTransition(const FileStatus from, const FileStatus to,
                     const uintmax_t bytesBefore, const uintmax_t bytesAfter,
                     const bool cancelled, const std::string& what) {
    if (cancelled && from != FileStatus::InProgress)
        throw InvalidState("Transfer is cancelled; cannot move " + what + " to " + to_string(to));

    if (from == FileStatus::Pending && (to == FileStatus::InProgress || to == FileStatus::Error)) return;

    if (from == FileStatus::InProgress) {
        if (to == FileStatus::Error || to == FileStatus::Completed) return;
        if (to == FileStatus::InProgress) {
            if (bytesAfter >= bytesBefore) return;
            throw InvalidState("Bytes transferred for " + what + " went backwards (" +
                               std::to_string(bytesBefore) + " -> " + std::to_string(bytesAfter) + ")");
        }
    }

    throw InvalidState("Illegal status change for " + what + ": " + to_string(from) + " -> " + to_string(to));
}

std::string errorMessage(const std::optional<std::string>& error) {
    return error && !error->empty() ? *error : std::string("Unknown error");
}

}

Manager::Manager(IdGenerator ids) : nextId_(std::move(ids)) {
    if (!nextId_) {
        auto gen = std::make_shared<boost::uuids::random_generator>();
        nextId_ = [gen] { return boost::uuids::to_string((*gen)()); };
    }
}

Manager::~Manager() = default;

void Manager::addObserver(std::shared_ptr<Observer> observer) {
    std::scoped_lock lock(observersMutex_);
    observers_.push_back(std::move(observer));
}

void Manager::removeObserver(const std::shared_ptr<Observer>& observer) {
    std::scoped_lock lock(observersMutex_);
    std::erase(observers_, observer);
}

std::shared_ptr<Manager::Slot> Manager::slot(const std::string& transferId) const {
    std::shared_lock lock(mutex_);
    const auto it = slots_.find(transferId);
    if (it == slots_.end()) throw NotFound("Unknown transfer: " + transferId);
    return it->second;
}

FileTransfer& Manager::file(Slot& s, const std::string& fileId) const {
    const auto it = s.fileIndex.find(fileId);
    if (it == s.fileIndex.end())
        throw NotFound("Unknown file " + fileId + " in transfer " + s.transfer.id);
    return s.transfer.files[it->second];
}

Transfer Manager::createTransfer(const std::string& source, const std::string& destination,
                                 const Direction direction, const Kind kind,
                                 const std::string& name, const uintmax_t size) {
    auto s = std::make_shared<Slot>();
    auto& t = s->transfer;
    t.kind = kind;
    t.direction = direction;
    t.source = source;
    t.destination = destination;
    t.name = name.empty() ? source : name;
    t.size = kind == Kind::SingleFile ? size : 0;
    t.created = util::now();

    {
        std::unique_lock lock(mutex_);
        do t.id = nextId_(); while (slots_.contains(t.id));
        order_.push_back(t.id);
        slots_.emplace(t.id, s);
    }

    log::Registry::transfer()->info("[TransferManager] Created {} {} transfer {} ({} -> {})",
                                    to_string(kind), to_string(direction), t.id, source, destination);

    const auto snapshot = t;
    dispatch(*s, {Event{[snapshot](Observer& o) { o.onTransferCreated(snapshot); }}});
    return snapshot;
}

FileTransfer Manager::addFileToTransfer(const std::string& transferId, const FileDescriptor& desc) {
    const auto s = slot(transferId);
    std::vector<Event> events;
    FileTransfer added;

    {
        std::scoped_lock lock(s->mutex);
        auto& t = s->transfer;
        if (!t.isFolder()) throw InvalidState("Cannot add files to single-file transfer " + transferId);
        if (t.status != TransferStatus::Pending && t.status != TransferStatus::InProgress)
            throw InvalidState("Cannot add files to transfer " + transferId + " in status " + to_string(t.status));
        if (desc.id.empty()) throw InvalidState("File id must not be empty");
        if (s->fileIndex.contains(desc.id))
            throw InvalidState("File " + desc.id + " already belongs to transfer " + transferId);

        const auto before = t.status;
        const auto progressBefore = t.progress();
        const auto bytesBefore = t.bytesTransferred();

        s->fileIndex.emplace(desc.id, t.files.size());
        t.files.emplace_back(desc, t.direction);
        added = t.files.back();

        events.push_back({[transferId, added](Observer& o) { o.onFileAdded(transferId, added); }});
        settle(*s, before, progressBefore, bytesBefore, events);
    }

    dispatch(*s, events);
    return added;
}

void Manager::updateFileStatus(const std::string& transferId, const std::string& fileId,
                               const FileStatus status, const uintmax_t bytesTransferred,
                               const std::optional<std::string>& error, const std::optional<ErrorCode> code) {
    const auto s = slot(transferId);
    std::vector<Event> events;

    {
        std::scoped_lock lock(s->mutex);
        auto& t = s->transfer;
        if (!t.isFolder()) throw InvalidState("Transfer " + transferId + " has no files; use updateStatus");

        auto& f = file(*s, fileId);
        const bool cancelled = t.status == TransferStatus::Cancelled;
        checkTransition(f.status, status, f.bytes_transferred, bytesTransferred, cancelled, f.name);

        const auto before = t.status;
        const auto progressBefore = t.progress();
        const auto bytesBefore = t.bytesTransferred();

        f.status = status;
        f.bytes_transferred = std::max(f.bytes_transferred, bytesTransferred);
        if (status == FileStatus::Error) {
            f.error = errorMessage(error);
            f.error_code = code;
            log::Registry::transfer()->warn("[TransferManager] {} failed in transfer {}: {}", f.name, transferId, *f.error);
        } else {
            f.error.reset();
            f.error_code.reset();
        }

        settle(*s, before, progressBefore, bytesBefore, events);
    }

    dispatch(*s, events);
}

void Manager::updateStatus(const std::string& transferId, const FileStatus status, const uintmax_t bytesTransferred,
                           const std::optional<std::string>& error, const std::optional<ErrorCode> code) {
    const auto s = slot(transferId);
    std::vector<Event> events;

    {
        std::scoped_lock lock(s->mutex);
        auto& t = s->transfer;
        if (t.isAggregated())
            throw InvalidState("Status of transfer " + transferId + " is derived from its files");

        const bool cancelled = t.status == TransferStatus::Cancelled;
        const auto from = ownFileStatus(t, s->owned);
        checkTransition(from, status, t.bytes_transferred, bytesTransferred, cancelled, t.name);

        const auto before = t.status;
        const auto progressBefore = t.progress();
        const auto bytesBefore = t.bytesTransferred();

        t.bytes_transferred = std::max(t.bytes_transferred, bytesTransferred);
        if (!cancelled) t.status = toTransferStatus(status);
        if (status == FileStatus::Error) {
            t.error = errorMessage(error);
            t.error_code = code;
            log::Registry::transfer()->warn("[TransferManager] Transfer {} failed: {}", transferId, *t.error);
        } else {
            t.error.reset();
            t.error_code.reset();
        }

        settle(*s, before, progressBefore, bytesBefore, events);
    }

    dispatch(*s, events);
}

void Manager::markDuplicateSkip(const std::string& transferId, const std::string& fileId) {
    const auto s = slot(transferId);
    std::vector<Event> events;

    {
        std::scoped_lock lock(s->mutex);
        auto& t = s->transfer;
        if (t.status == TransferStatus::Cancelled) throw InvalidState("Transfer " + transferId + " is cancelled");

        auto& f = file(*s, fileId);
        if (f.status != FileStatus::Pending)
            throw InvalidState("Only pending files can be skipped; " + f.name + " is " + to_string(f.status));

        const auto before = t.status;
        const auto progressBefore = t.progress();
        const auto bytesBefore = t.bytesTransferred();

        f.status = FileStatus::Skipped;
        log::Registry::transfer()->debug("[TransferManager] Skipped {}: already present at destination", f.name);

        settle(*s, before, progressBefore, bytesBefore, events);
    }

    dispatch(*s, events);
}

void Manager::markDuplicateSkip(const std::string& transferId) {
    const auto s = slot(transferId);
    std::vector<Event> events;

    {
        std::scoped_lock lock(s->mutex);
        auto& t = s->transfer;
        if (t.isFolder()) throw InvalidState("Folder transfer " + transferId + " is skipped per file");
        if (t.status != TransferStatus::Pending)
            throw InvalidState("Only pending transfers can be skipped; " + transferId + " is " + to_string(t.status));

        const auto before = t.status;
        const auto progressBefore = t.progress();
        const auto bytesBefore = t.bytesTransferred();

        t.status = TransferStatus::Completed;
        log::Registry::transfer()->debug("[TransferManager] Skipped {}: already present at destination", t.name);

        settle(*s, before, progressBefore, bytesBefore, events);
    }

    dispatch(*s, events);
}

void Manager::setFileResult(const std::string& transferId, const std::string& fileId, const std::string& resultId) {
    const auto s = slot(transferId);
    std::scoped_lock lock(s->mutex);
    file(*s, fileId).result_id = resultId;
}

void Manager::setResult(const std::string& transferId, const std::string& resultId) {
    const auto s = slot(transferId);
    std::scoped_lock lock(s->mutex);
    s->transfer.result_id = resultId;
}

std::vector<std::string> Manager::retryFailedFiles(const std::string& transferId,
                                                   const std::optional<std::vector<std::string>>& fileIds) {
    const auto s = slot(transferId);
    std::vector<Event> events;
    std::vector<std::string> retried;

    {
        std::scoped_lock lock(s->mutex);
        auto& t = s->transfer;
        if (t.status == TransferStatus::Cancelled)
            throw InvalidState("Transfer " + transferId + " was cancelled and cannot be retried");

        const auto before = t.status;
        const auto progressBefore = t.progress();
        const auto bytesBefore = t.bytesTransferred();

        if (!t.isAggregated()) {
            if (fileIds) {
                for (const auto& id : *fileIds)
                    if (id != transferId) throw NotFound("Unknown file " + id + " in transfer " + transferId);
            }
            if (t.status != TransferStatus::Error) {
                if (fileIds && !fileIds->empty())
                    throw InvalidState("Transfer " + transferId + " is not in error");
                return retried;
            }

            ++t.retry_count;
            t.status = TransferStatus::Pending;
            t.bytes_transferred = 0;
            t.error.reset();
            t.error_code.reset();
            retried.push_back(transferId);
        } else {
            std::vector<size_t> targets;
            if (fileIds) {
                for (const auto& id : *fileIds) {
                    const auto it = s->fileIndex.find(id);
                    if (it == s->fileIndex.end()) throw NotFound("Unknown file " + id + " in transfer " + transferId);
                    const auto& f = t.files[it->second];
                    if (f.status != FileStatus::Error)
                        throw InvalidState("File " + f.name + " is " + to_string(f.status) + ", not error");
                    if (std::ranges::find(targets, it->second) == targets.end()) targets.push_back(it->second);
                }
            } else {
                for (size_t i = 0; i < t.files.size(); ++i)
                    if (t.files[i].status == FileStatus::Error) targets.push_back(i);
            }

            for (const auto i : targets) {
                auto& f = t.files[i];
                ++f.retry_count;
                f.status = FileStatus::Pending;
                f.bytes_transferred = 0;
                f.error.reset();
                f.error_code.reset();
                retried.push_back(f.id);
            }
        }

        if (!retried.empty())
            log::Registry::transfer()->info("[TransferManager] Retrying {} file(s) in transfer {}", retried.size(), transferId);

        settle(*s, before, progressBefore, bytesBefore, events);
    }

    dispatch(*s, events);
    return retried;
}

void Manager::cancelTransfer(const std::string& transferId) {
    const auto s = slot(transferId);
    std::vector<Event> events;

    {
        std::scoped_lock lock(s->mutex);
        auto& t = s->transfer;
        if (t.isTerminal())
            throw InvalidState("Transfer " + transferId + " already finished as " + to_string(t.status));

        const auto before = t.status;
        const auto progressBefore = t.progress();
        const auto bytesBefore = t.bytesTransferred();

        t.status = TransferStatus::Cancelled;
        log::Registry::transfer()->info("[TransferManager] Cancelled transfer {}", transferId);

        settle(*s, before, progressBefore, bytesBefore, events);
    }

    dispatch(*s, events);
}

bool Manager::isCancelled(const std::string& transferId) const {
    const auto s = slot(transferId);
    std::scoped_lock lock(s->mutex);
    return s->transfer.status == TransferStatus::Cancelled;
}

std::vector<std::string> Manager::clearCompleted() {
    std::vector<std::string> removed;

    {
        std::unique_lock lock(mutex_);
        std::erase_if(order_, [&](const std::string& id) {
            const auto& s = slots_.at(id);
            std::scoped_lock slotLock(s->mutex);
            if (s->owned || !s->transfer.isTerminal()) return false;
            removed.push_back(id);
            return true;
        });
        for (const auto& id : removed) slots_.erase(id);
    }

    if (!removed.empty()) {
        log::Registry::transfer()->info("[TransferManager] Cleared {} finished transfer(s)", removed.size());
        dispatch({Event{[removed](Observer& o) { o.onTransfersCleared(removed); }}});
    }

    return removed;
}

void Manager::removeTransfer(const std::string& transferId) {
    {
        std::unique_lock lock(mutex_);
        const auto it = slots_.find(transferId);
        if (it == slots_.end()) throw NotFound("Unknown transfer: " + transferId);

        const auto s = it->second;
        std::scoped_lock slotLock(s->mutex);
        if (s->owned) throw InvalidState("Transfer " + transferId + " is still running");
        if (!s->transfer.isTerminal())
            throw InvalidState("Transfer " + transferId + " is " + to_string(s->transfer.status) + "; cancel it first");

        std::erase(order_, transferId);
        slots_.erase(it);
    }

    log::Registry::transfer()->info("[TransferManager] Removed transfer {}", transferId);
    dispatch({Event{[ids = std::vector<std::string>{transferId}](Observer& o) { o.onTransfersCleared(ids); }}});
}

bool Manager::acquire(const std::string& transferId) {
    const auto s = slot(transferId);
    std::scoped_lock lock(s->mutex);
    if (s->owned) return false;
    s->owned = true;
    s->started = Clock::now();
    s->bytes_at_start = s->transfer.bytesTransferred();
    return true;
}

void Manager::release(const std::string& transferId) {
    const auto s = slot(transferId);
    std::scoped_lock lock(s->mutex);
    s->owned = false;
}

bool Manager::isOwned(const std::string& transferId) const {
    const auto s = slot(transferId);
    std::scoped_lock lock(s->mutex);
    return s->owned;
}

std::vector<Transfer> Manager::listTransfers() const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::shared_lock lock(mutex_);
        slots.reserve(order_.size());
        for (const auto& id : order_) slots.push_back(slots_.at(id));
    }

    std::vector<Transfer> out;
    out.reserve(slots.size());
    for (const auto& s : slots) {
        std::scoped_lock lock(s->mutex);
        out.push_back(s->transfer);
    }
    return out;
}

std::vector<FailedFile> Manager::listErrors() const {
    std::vector<FailedFile> out;
    for (const auto& t : listTransfers()) {
        if (!t.isAggregated()) {
            if (t.status != TransferStatus::Error) continue;
            FileTransfer f;
            f.id = t.id;
            f.name = t.name;
            f.direction = t.direction;
            f.size = t.size;
            f.bytes_transferred = t.bytes_transferred;
            f.status = FileStatus::Error;
            f.error = t.error;
            f.error_code = t.error_code;
            f.retry_count = t.retry_count;
            f.destination = t.destination;
            out.push_back({t.id, std::move(f)});
            continue;
        }
        for (auto& f : t.failedFiles()) out.push_back({t.id, std::move(f)});
    }
    return out;
}

Transfer Manager::getTransfer(const std::string& transferId) const {
    const auto s = slot(transferId);
    std::scoped_lock lock(s->mutex);
    return s->transfer;
}

double Manager::throughput(const std::string& transferId) const {
    const auto s = slot(transferId);
    std::scoped_lock lock(s->mutex);
    return throughputLocked(*s);
}

TransferStats Manager::stats() const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::shared_lock lock(mutex_);
        slots.reserve(order_.size());
        for (const auto& id : order_) slots.push_back(slots_.at(id));
    }

    TransferStats out;
    double finished = 0.0;

    const auto count = [&out](const FileStatus status) {
        switch (status) {
            case FileStatus::Pending: ++out.pending; break;
            case FileStatus::InProgress: ++out.in_progress; break;
            case FileStatus::Completed: ++out.completed; break;
            case FileStatus::Skipped: ++out.skipped; break;
            case FileStatus::Error: ++out.failed; break;
        }
    };

    for (const auto& s : slots) {
        std::scoped_lock lock(s->mutex);
        const auto& t = s->transfer;
        ++out.transfers;

        if (s->owned) {
            ++out.active;
            out.bytes_per_second += throughputLocked(*s);
        }

        if (t.status == TransferStatus::Cancelled) ++out.cancelled;
        else if (t.isAggregated()) for (const auto& f : t.files) count(f.status);
        else if (!t.isFolder()) count(ownFileStatus(t, s->owned));

        const auto total = t.totalBytes();
        out.total_bytes += total;
        out.transferred_bytes += t.bytesTransferred();
        finished += t.progress() * static_cast<double>(total);
    }

    if (out.total_bytes > 0) out.progress = finished / static_cast<double>(out.total_bytes);
    return out;
}

size_t Manager::size() const {
    std::shared_lock lock(mutex_);
    return order_.size();
}

double Manager::throughputLocked(const Slot& s) {
    if (s.started == Clock::time_point{}) return 0.0;
    const auto elapsed = std::chrono::duration<double>(Clock::now() - s.started).count();
    if (elapsed <= 0.0) return 0.0;
    const auto bytes = s.transfer.bytesTransferred();
    if (bytes <= s.bytes_at_start) return 0.0;
    return static_cast<double>(bytes - s.bytes_at_start) / elapsed;
}

void Manager::settle(Slot& s, const TransferStatus before, const double progressBefore, const uintmax_t bytesBefore,
                     std::vector<Event>& events) const {
    auto& t = s.transfer;
    t.recompute();
    const auto sequence = ++s.sequence;

    if (t.status != before) {
        if (t.isTerminal() && !isTerminal(before)) t.completed = util::now();
        else if (!t.isTerminal()) t.completed.reset();

        const auto snapshot = t;
        events.push_back({[snapshot](Observer& o) { o.onStatusChanged(snapshot); }, true});

        if (t.isTerminal() && !isTerminal(before)) {
            log::Registry::transfer()->info("[TransferManager] Transfer {} finished: {}", t.id, to_string(t.status));
            events.push_back({[snapshot](Observer& o) { o.onTransferFinished(snapshot); }});
        }
    }

    const auto progress = t.progress();
    const auto bytes = t.bytesTransferred();
    if (progress != progressBefore || bytes != bytesBefore) {
        const auto rate = throughputLocked(s);
        events.push_back({[id = t.id, progress, rate](Observer& o) { o.onProgress(id, progress, rate); }, true});
    }

    for (auto& event : events) event.sequence = sequence;
}

std::vector<std::shared_ptr<Observer>> Manager::observers() const {
    std::scoped_lock lock(observersMutex_);
    return observers_;
}

void Manager::dispatch(Slot& s, const std::vector<Event>& events) const {
    if (events.empty()) return;

    const auto targets = observers();
    std::scoped_lock lock(s.dispatchMutex);

    for (const auto& event : events) {
        // a newer status or progress already reached the observers
        if (event.snapshot && event.sequence < s.delivered) continue;
        s.delivered = std::max(s.delivered, event.sequence);

        for (const auto& observer : targets) {
            try {
                event.fire(*observer);
            } catch (const std::exception& e) {
                log::Registry::transfer()->error("[TransferManager] Observer threw: {}", e.what());
            }
        }
    }
}

void Manager::dispatch(const std::vector<Event>& events) const {
    if (events.empty()) return;

    const auto targets = observers();
    for (const auto& event : events) {
        for (const auto& observer : targets) {
            try {
                event.fire(*observer);
            } catch (const std::exception& e) {
                log::Registry::transfer()->error("[TransferManager] Observer threw: {}", e.what());
            }
        }
    }
}
