#include "transfer/model/Status.hpp"

#include <stdexcept>

namespace skiff::transfer::model {

std::string to_string(const Direction direction) {
    switch (direction) {
        case Direction::Upload: return "upload";
        case Direction::Download: return "download";
        default: return "unknown";
    }
}

std::string to_string(const Kind kind) {
    switch (kind) {
        case Kind::SingleFile: return "single_file";
        case Kind::Folder: return "folder";
        default: return "unknown";
    }
}

std::string to_string(const FileStatus status) {
    switch (status) {
        case FileStatus::Pending: return "pending";
        case FileStatus::InProgress: return "in_progress";
        case FileStatus::Completed: return "completed";
        case FileStatus::Skipped: return "skipped";
        case FileStatus::Error: return "error";
        default: return "unknown";
    }
}

std::string to_string(const TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending: return "pending";
        case TransferStatus::InProgress: return "in_progress";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::CompletedWithErrors: return "completed_with_errors";
        case TransferStatus::Error: return "error";
        case TransferStatus::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

Direction to_direction(const std::string& str) {
    if (str == "upload") return Direction::Upload;
    if (str == "download") return Direction::Download;
    throw std::invalid_argument("Invalid transfer direction: " + str);
}

Kind to_kind(const std::string& str) {
    if (str == "single_file") return Kind::SingleFile;
    if (str == "folder") return Kind::Folder;
    throw std::invalid_argument("Invalid transfer kind: " + str);
}

FileStatus to_file_status(const std::string& str) {
    if (str == "pending") return FileStatus::Pending;
    if (str == "in_progress") return FileStatus::InProgress;
    if (str == "completed") return FileStatus::Completed;
    if (str == "skipped") return FileStatus::Skipped;
    if (str == "error") return FileStatus::Error;
    throw std::invalid_argument("Invalid file status: " + str);
}

TransferStatus to_transfer_status(const std::string& str) {
    if (str == "pending") return TransferStatus::Pending;
    if (str == "in_progress") return TransferStatus::InProgress;
    if (str == "completed") return TransferStatus::Completed;
    if (str == "completed_with_errors") return TransferStatus::CompletedWithErrors;
    if (str == "error") return TransferStatus::Error;
    if (str == "cancelled") return TransferStatus::Cancelled;
    throw std::invalid_argument("Invalid transfer status: " + str);
}

bool isTerminal(const FileStatus status) {
    return status == FileStatus::Completed || status == FileStatus::Skipped || status == FileStatus::Error;
}

bool isTerminal(const TransferStatus status) {
    return status == TransferStatus::Completed || status == TransferStatus::CompletedWithErrors ||
           status == TransferStatus::Error || status == TransferStatus::Cancelled;
}

}
