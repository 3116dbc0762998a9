#include "transfer/model/FileTransfer.hpp"

#include <nlohmann/json.hpp>

namespace skiff::transfer::model {

FileTransfer::FileTransfer(const FileDescriptor& desc, const Direction direction)
    : id(desc.id),
      name(desc.name),
      kind(desc.kind),
      direction(direction),
      size(desc.size),
      relative_dir(desc.relative_dir),
      destination(desc.destination) {}

void to_json(nlohmann::json& j, const FileTransfer& f) {
    j = {
        {"id", f.id},
        {"name", f.name},
        {"kind", remote::to_string(f.kind)},
        {"direction", to_string(f.direction)},
        {"size", f.size},
        {"bytes_transferred", f.bytes_transferred},
        {"status", to_string(f.status)},
        {"retry_count", f.retry_count},
        {"relative_dir", f.relative_dir},
        {"destination", f.destination}
    };

    if (f.error) j["error"] = *f.error;
    if (f.error_code) {
        j["error_code"] = skiff::to_string(*f.error_code);
        j["retryable"] = isRetryable(*f.error_code);
    }
    if (f.result_id) j["result_id"] = *f.result_id;
}

}
