#pragma once

#include <string>
#include <utility>

namespace paca {

enum class DownloadErrorCode : int {
    kOk = 0,
    kInvalidReference,
    kAmbiguousQuant,
    kQuantRequired,
    kIncompleteShardSet,
    kQuantNotFound,
    kRepositoryNotFound,
    kUnauthorized,
    kInvalidPath,
    kInsufficientDiskSpace,
    kNetworkTransient,
    kRangeUnsupported,
    kHashMismatch,
    kDiskIOError,
    kCancelled,
};

inline const char* to_string(DownloadErrorCode code) {
    switch (code) {
        case DownloadErrorCode::kOk:
            return "OK";
        case DownloadErrorCode::kInvalidReference:
            return "INVALID_REFERENCE";
        case DownloadErrorCode::kAmbiguousQuant:
            return "AMBIGUOUS_QUANT";
        case DownloadErrorCode::kQuantRequired:
            return "QUANT_REQUIRED";
        case DownloadErrorCode::kIncompleteShardSet:
            return "INCOMPLETE_SHARD_SET";
        case DownloadErrorCode::kQuantNotFound:
            return "QUANT_NOT_FOUND";
        case DownloadErrorCode::kRepositoryNotFound:
            return "REPOSITORY_NOT_FOUND";
        case DownloadErrorCode::kUnauthorized:
            return "UNAUTHORIZED";
        case DownloadErrorCode::kInvalidPath:
            return "INVALID_PATH";
        case DownloadErrorCode::kInsufficientDiskSpace:
            return "INSUFFICIENT_DISK_SPACE";
        case DownloadErrorCode::kNetworkTransient:
            return "NETWORK_TRANSIENT";
        case DownloadErrorCode::kRangeUnsupported:
            return "RANGE_UNSUPPORTED";
        case DownloadErrorCode::kHashMismatch:
            return "HASH_MISMATCH";
        case DownloadErrorCode::kDiskIOError:
            return "DISK_IO_ERROR";
        case DownloadErrorCode::kCancelled:
            return "CANCELLED";
    }
    return "UNKNOWN";
}

// Resolution-time failures are never retried.
inline bool is_resolution_error(DownloadErrorCode code) {
    switch (code) {
        case DownloadErrorCode::kInvalidReference:
        case DownloadErrorCode::kAmbiguousQuant:
        case DownloadErrorCode::kQuantRequired:
        case DownloadErrorCode::kIncompleteShardSet:
        case DownloadErrorCode::kQuantNotFound:
        case DownloadErrorCode::kRepositoryNotFound:
        case DownloadErrorCode::kUnauthorized:
            return true;
        default:
            return false;
    }
}

struct DownloadError {
    DownloadErrorCode code{DownloadErrorCode::kOk};
    std::string message;

    bool ok() const { return code == DownloadErrorCode::kOk; }

    std::string describe() const {
        if (message.empty()) return to_string(code);
        return std::string(to_string(code)) + ": " + message;
    }
};

inline DownloadError make_error(DownloadErrorCode code, std::string message) {
    return DownloadError{code, std::move(message)};
}

}  // namespace paca
