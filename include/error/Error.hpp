#pragma once

#include <stdexcept>
#include <string>

namespace skiff {

enum class ErrorCode {
    NotFound,           // id unknown to the cache, the manager or the remote store
    InvalidState,       // operation illegal for the current status
    RemoteUnavailable,  // network or API failure
    PermissionDenied,
    QuotaExceeded,
    LocalIO
};

std::string to_string(ErrorCode code);
ErrorCode to_error_code(const std::string& str);

// Only transient failures are worth a plain retry
[[nodiscard]] bool isRetryable(ErrorCode code);

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& what) : std::runtime_error(what), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

struct NotFound final : Error {
    explicit NotFound(const std::string& what) : Error(ErrorCode::NotFound, what) {}
};

struct InvalidState final : Error {
    explicit InvalidState(const std::string& what) : Error(ErrorCode::InvalidState, what) {}
};

struct RemoteUnavailable final : Error {
    explicit RemoteUnavailable(const std::string& what) : Error(ErrorCode::RemoteUnavailable, what) {}
};

struct PermissionDenied final : Error {
    explicit PermissionDenied(const std::string& what) : Error(ErrorCode::PermissionDenied, what) {}
};

struct QuotaExceeded final : Error {
    explicit QuotaExceeded(const std::string& what) : Error(ErrorCode::QuotaExceeded, what) {}
};

struct LocalIO final : Error {
    explicit LocalIO(const std::string& what) : Error(ErrorCode::LocalIO, what) {}
};

// Maps an exception caught at a worker boundary onto the taxonomy:
// skiff errors keep their code, filesystem and stream failures are LocalIO,
// anything else is treated as a remote failure.
ErrorCode classify(const std::exception& e);

// User-facing message for a failed file, with a hint when retrying alone cannot succeed
std::string describeFailure(ErrorCode code, const std::string& reason);

}
