#pragma once

#include "transfer/model/FileTransfer.hpp"

#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace skiff::transfer::model {

// One user-initiated transfer. A folder transfer carries one FileTransfer per
// leaf file and its status is derived from them; a single-file transfer has no
// children and carries the file state on itself.
struct Transfer {
    std::string id;
    Kind kind = Kind::SingleFile;
    Direction direction = Direction::Upload;
    std::string name;
    std::string source;
    std::string destination;
    TransferStatus status = TransferStatus::Pending;
    std::vector<FileTransfer> files;
    std::time_t created = 0;
    std::optional<std::time_t> completed;

    // Single-file state, and the error of a folder that failed before any file was found
    uintmax_t size = 0;
    uintmax_t bytes_transferred = 0;
    std::optional<std::string> error;
    std::optional<ErrorCode> error_code;
    unsigned int retry_count = 0;
    std::optional<std::string> result_id;   // uploaded file/folder id or written local path

    [[nodiscard]] bool isFolder() const { return kind == Kind::Folder; }
    [[nodiscard]] bool isTerminal() const { return model::isTerminal(status); }

    // Aggregation only applies to folders that have children
    [[nodiscard]] bool isAggregated() const { return isFolder() && !files.empty(); }

    [[nodiscard]] uintmax_t totalBytes() const;
    [[nodiscard]] uintmax_t bytesTransferred() const;

    // Finished share of the work in [0, 1]; 0 when there is nothing to transfer
    [[nodiscard]] double progress() const;

    [[nodiscard]] FileTransfer* findFile(const std::string& fileId);
    [[nodiscard]] const FileTransfer* findFile(const std::string& fileId) const;

    [[nodiscard]] std::vector<FileTransfer> failedFiles() const;
    [[nodiscard]] std::vector<FileTransfer> pendingFiles() const;

    // Re-derives status from the children. Cancelled is never overwritten.
    void recompute();
};

// Pure aggregation rule over a non-empty child set
TransferStatus aggregate(const std::vector<FileTransfer>& files);

void to_json(nlohmann::json& j, const Transfer& t);

}
