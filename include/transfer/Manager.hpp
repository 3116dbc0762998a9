#pragma once

#include "transfer/model/Transfer.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace skiff::transfer {

class Observer;

struct FailedFile {
    std::string transfer_id;
    model::FileTransfer file;
};

void to_json(nlohmann::json& j, const FailedFile& f);

// Session-wide counts. File counts cover folder children and single-file
// transfers; cancelled transfers are only counted as such.
struct TransferStats {
    size_t transfers = 0;
    size_t active = 0;
    size_t cancelled = 0;
    size_t pending = 0;
    size_t in_progress = 0;
    size_t completed = 0;
    size_t skipped = 0;
    size_t failed = 0;
    uintmax_t total_bytes = 0;
    uintmax_t transferred_bytes = 0;
    double progress = 0.0;
    double bytes_per_second = 0.0;
};

void to_json(nlohmann::json& j, const TransferStats& s);

// Registry of every transfer in the session, in creation order. All state
// changes go through here; each transfer is serialized by its own lock and
// queries return copies.
class Manager {
public:
    using IdGenerator = std::function<std::string()>;

    explicit Manager(IdGenerator ids = {});
    ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    void addObserver(std::shared_ptr<Observer> observer);
    void removeObserver(const std::shared_ptr<Observer>& observer);

    model::Transfer createTransfer(const std::string& source, const std::string& destination,
                                   model::Direction direction, model::Kind kind,
                                   const std::string& name = {}, uintmax_t size = 0);

    model::FileTransfer addFileToTransfer(const std::string& transferId, const model::FileDescriptor& file);

    void updateFileStatus(const std::string& transferId, const std::string& fileId,
                          model::FileStatus status, uintmax_t bytesTransferred,
                          const std::optional<std::string>& error = std::nullopt,
                          std::optional<ErrorCode> code = std::nullopt);

    // Drives a single-file transfer, or a folder transfer that has no files yet
    void updateStatus(const std::string& transferId, model::FileStatus status, uintmax_t bytesTransferred,
                      const std::optional<std::string>& error = std::nullopt,
                      std::optional<ErrorCode> code = std::nullopt);

    void markDuplicateSkip(const std::string& transferId, const std::string& fileId);
    void markDuplicateSkip(const std::string& transferId);

    void setFileResult(const std::string& transferId, const std::string& fileId, const std::string& resultId);
    void setResult(const std::string& transferId, const std::string& resultId);

    // Returns the ids that were reset to pending. With explicit ids every one
    // must exist and be in error, or nothing changes.
    std::vector<std::string> retryFailedFiles(const std::string& transferId,
                                              const std::optional<std::vector<std::string>>& fileIds = std::nullopt);

    void cancelTransfer(const std::string& transferId);

    [[nodiscard]] bool isCancelled(const std::string& transferId) const;

    // Removes terminal transfers that no worker holds; returns the removed ids
    std::vector<std::string> clearCompleted();

    // Removes one finished transfer. Running or unfinished ones are InvalidState.
    void removeTransfer(const std::string& transferId);

    // Worker ownership: at most one holder per transfer
    [[nodiscard]] bool acquire(const std::string& transferId);
    void release(const std::string& transferId);
    [[nodiscard]] bool isOwned(const std::string& transferId) const;

    [[nodiscard]] std::vector<model::Transfer> listTransfers() const;
    [[nodiscard]] std::vector<FailedFile> listErrors() const;
    [[nodiscard]] model::Transfer getTransfer(const std::string& transferId) const;

    // Bytes per second since the current owner acquired the transfer
    [[nodiscard]] double throughput(const std::string& transferId) const;

    [[nodiscard]] TransferStats stats() const;

    [[nodiscard]] size_t size() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Event {
        std::function<void(Observer&)> fire;
        bool snapshot = false;      // status or progress; superseded by any later one
        uint64_t sequence = 0;
    };

    struct Slot {
        mutable std::mutex mutex;
        model::Transfer transfer;
        std::unordered_map<std::string, size_t> fileIndex;
        bool owned = false;
        Clock::time_point started{};
        uintmax_t bytes_at_start = 0;
        uint64_t sequence = 0;

        // Held while observers run; recursive so a handler may mutate the
        // transfer it is being told about
        std::recursive_mutex dispatchMutex;
        uint64_t delivered = 0;
    };

    IdGenerator nextId_;

    mutable std::shared_mutex mutex_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;

    mutable std::mutex observersMutex_;
    std::vector<std::shared_ptr<Observer>> observers_;

    [[nodiscard]] std::shared_ptr<Slot> slot(const std::string& transferId) const;
    [[nodiscard]] model::FileTransfer& file(Slot& s, const std::string& fileId) const;

    static double throughputLocked(const Slot& s);

    // Recomputes the aggregate after a mutation and queues the resulting events
    void settle(Slot& s, model::TransferStatus before, double progressBefore, uintmax_t bytesBefore,
                std::vector<Event>& events) const;

    [[nodiscard]] std::vector<std::shared_ptr<Observer>> observers() const;

    // Delivers one transfer's events in the order its mutations happened
    void dispatch(Slot& s, const std::vector<Event>& events) const;
    void dispatch(const std::vector<Event>& events) const;
};

}
