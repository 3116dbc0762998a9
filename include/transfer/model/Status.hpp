#pragma once

#include <string>

namespace skiff::transfer::model {

enum class Direction { Upload, Download };

enum class Kind { SingleFile, Folder };

enum class FileStatus { Pending, InProgress, Completed, Skipped, Error };

enum class TransferStatus { Pending, InProgress, Completed, CompletedWithErrors, Error, Cancelled };

std::string to_string(Direction direction);
std::string to_string(Kind kind);
std::string to_string(FileStatus status);
std::string to_string(TransferStatus status);

Direction to_direction(const std::string& str);
Kind to_kind(const std::string& str);
FileStatus to_file_status(const std::string& str);
TransferStatus to_transfer_status(const std::string& str);

[[nodiscard]] bool isTerminal(FileStatus status);
[[nodiscard]] bool isTerminal(TransferStatus status);

// Completed or skipped: counts toward the finished share of progress
[[nodiscard]] inline bool isDone(const FileStatus status) {
    return status == FileStatus::Completed || status == FileStatus::Skipped;
}

}
