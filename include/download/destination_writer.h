#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "download/download_error.h"
#include "download/range_set.h"
#include "download/resume_state.h"
#include "download/transfer_planner.h"

namespace paca {

// Owns the temporary file and resume state of every file being transferred.
// Files are keyed by RemoteFile::path. All methods are thread-safe; writes to
// different ranges of one file may run concurrently.
class DestinationWriter {
public:
    DestinationWriter() = default;
    ~DestinationWriter();

    DestinationWriter(const DestinationWriter&) = delete;
    DestinationWriter& operator=(const DestinationWriter&) = delete;

    // Create (or reopen) <final>.part, preallocated to the full size.
    // Reopening keeps the bytes recorded in plan.resume.
    DownloadError open(const FilePlan& plan);

    // pwrite + fdatasync, then record the range and durably rewrite the sidecar.
    // Returns only after the range is recorded.
    DownloadError write(const std::string& path, ByteRange range, const char* data, size_t len);

    // Forget every recorded range and the etag. ranges_supported is persisted in the sidecar.
    DownloadError reset(const std::string& path, bool ranges_supported);

    // Entity tag of the remote bytes; saved with the next recorded range.
    void setEtag(const std::string& path, const std::string& etag);

    // fsync, rename onto the final path, delete the sidecar, fsync the directory.
    DownloadError finalize(const std::string& path);

    // Close the temporary file and keep it with its sidecar (cancellation, failure).
    void close(const std::string& path);

    bool isComplete(const std::string& path) const;
    std::optional<ResumeState> state(const std::string& path) const;
    std::filesystem::path tempPath(const std::string& path) const;

private:
    struct Entry {
        std::mutex mutex;
        int fd{-1};
        std::filesystem::path final_path;
        std::filesystem::path temp_path;
        std::filesystem::path sidecar_path;
        ResumeState state;
    };

    Entry* find(const std::string& path) const;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Entry>> entries_;
};

}  // namespace paca
