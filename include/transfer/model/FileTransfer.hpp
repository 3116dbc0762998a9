#pragma once

#include "transfer/model/Status.hpp"
#include "error/Error.hpp"
#include "remote/Entry.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace skiff::transfer::model {

// What a worker knows about a file when it registers it with a folder transfer
struct FileDescriptor {
    std::string id;             // local path (upload) or remote id (download)
    std::string name;
    uintmax_t size = 0;
    std::string relative_dir;   // position below the transfer root, "" for top level
    std::string destination;    // remote folder id (upload) or local directory (download)
    remote::Kind kind = remote::Kind::File;
};

struct FileTransfer {
    std::string id;
    std::string name;
    // A Folder child stands for a subtree that could not be walked; retrying
    // it walks the subtree again and registers what it finds
    remote::Kind kind = remote::Kind::File;
    Direction direction = Direction::Upload;
    uintmax_t size = 0;
    uintmax_t bytes_transferred = 0;
    FileStatus status = FileStatus::Pending;
    std::optional<std::string> error;       // set iff status == Error
    std::optional<ErrorCode> error_code;
    unsigned int retry_count = 0;

    std::string relative_dir;
    std::string destination;
    std::optional<std::string> result_id;   // new remote id or written local path

    FileTransfer() = default;
    FileTransfer(const FileDescriptor& desc, Direction direction);

    [[nodiscard]] bool isTerminal() const { return model::isTerminal(status); }
    [[nodiscard]] bool isFolder() const { return kind == remote::Kind::Folder; }
};

void to_json(nlohmann::json& j, const FileTransfer& f);

}
