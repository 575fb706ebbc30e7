#pragma once
#include <string>

enum class ErrorCode {
    None,
    MalformedChecksum,   // bad record from the checksum producer, skipped
    Cancelled,
    DeadlineExceeded,
    ReadFailed,          // source read failed, a fresh sync is required
    InvalidArgument,
    IoFailure
};

inline const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:              return "none";
        case ErrorCode::MalformedChecksum: return "malformed checksum";
        case ErrorCode::Cancelled:         return "cancelled";
        case ErrorCode::DeadlineExceeded:  return "deadline exceeded";
        case ErrorCode::ReadFailed:        return "read failed";
        case ErrorCode::InvalidArgument:   return "invalid argument";
        case ErrorCode::IoFailure:         return "i/o failure";
    }
    return "unknown";
}

struct SyncError {
    ErrorCode code = ErrorCode::None;
    std::string message;

    // Prefixes the cause with some context and keeps its code,
    // e.g. "failed reading block: stream is in a failed state".
    static SyncError wrap(const std::string& context, const SyncError& cause) {
        return { cause.code, context + ": " + cause.message };
    }

    bool isCancellation() const {
        return code == ErrorCode::Cancelled || code == ErrorCode::DeadlineExceeded;
    }
};
