#include "error/Error.hpp"

#include <filesystem>
#include <ios>

namespace skiff {

std::string to_string(const ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::InvalidState: return "invalid_state";
        case ErrorCode::RemoteUnavailable: return "remote_unavailable";
        case ErrorCode::PermissionDenied: return "permission_denied";
        case ErrorCode::QuotaExceeded: return "quota_exceeded";
        case ErrorCode::LocalIO: return "local_io";
        default: return "unknown";
    }
}

ErrorCode to_error_code(const std::string& str) {
    if (str == "not_found") return ErrorCode::NotFound;
    if (str == "invalid_state") return ErrorCode::InvalidState;
    if (str == "remote_unavailable") return ErrorCode::RemoteUnavailable;
    if (str == "permission_denied") return ErrorCode::PermissionDenied;
    if (str == "quota_exceeded") return ErrorCode::QuotaExceeded;
    if (str == "local_io") return ErrorCode::LocalIO;
    throw std::invalid_argument("Invalid error code string: " + str);
}

bool isRetryable(const ErrorCode code) {
    return code == ErrorCode::RemoteUnavailable || code == ErrorCode::LocalIO;
}

ErrorCode classify(const std::exception& e) {
    if (const auto* err = dynamic_cast<const Error*>(&e)) return err->code();
    if (dynamic_cast<const std::filesystem::filesystem_error*>(&e)) return ErrorCode::LocalIO;
    if (dynamic_cast<const std::ios_base::failure*>(&e)) return ErrorCode::LocalIO;
    return ErrorCode::RemoteUnavailable;
}

std::string describeFailure(const ErrorCode code, const std::string& reason) {
    switch (code) {
        case ErrorCode::PermissionDenied:
            return "Permission denied: " + reason + " (re-authenticate before retrying)";
        case ErrorCode::QuotaExceeded:
            return "Quota exceeded: " + reason + " (free space on the drive before retrying)";
        case ErrorCode::NotFound:
            return "Not found: " + reason;
        case ErrorCode::LocalIO:
            return "Local I/O error: " + reason;
        case ErrorCode::RemoteUnavailable:
            return "Remote unavailable: " + reason;
        default:
            return reason;
    }
}

}
