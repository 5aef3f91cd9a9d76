#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "download/download_error.h"
#include "download/progress_aggregator.h"
#include "download/range_fetcher.h"
#include "download/transfer_planner.h"

namespace paca {

struct DownloadConfig;

enum class FileStatus {
    kSucceeded,
    kFailedRetryable,
    kFailedFatal,
    kCancelled,
};

const char* to_string(FileStatus status);

struct FileOutcome {
    std::string path;
    std::filesystem::path final_path;
    FileStatus status{FileStatus::kCancelled};
    DownloadError error;
    uint64_t network_bytes{0};  // body bytes received, including discarded ones
};

struct DownloadResult {
    std::vector<FileOutcome> files;  // same order as the plan

    bool ok() const;
    bool cancelled() const;
    uint64_t networkBytes() const;
    // Error of the first file that did not succeed.
    DownloadError firstError() const;
};

struct SchedulerOptions {
    size_t max_concurrency{8};
    size_t max_per_file_concurrency{4};
    uint64_t chunk_size{32ull * 1024 * 1024};
    int max_retries{5};
    std::chrono::milliseconds backoff{500};
    std::chrono::milliseconds timeout{30000};

    static SchedulerOptions fromConfig(const DownloadConfig& cfg);
};

// Runs the chunk tasks of a plan on a pool of worker threads. Files complete
// independently; a failed file never stops its siblings.
class DownloadScheduler {
public:
    DownloadScheduler(std::shared_ptr<RangeFetcher> fetcher, SchedulerOptions options);

    DownloadResult run(const TransferPlan& plan, const CancellationToken& cancel,
                       const ProgressCallback& progress = nullptr);

    const SchedulerOptions& options() const { return options_; }

private:
    std::shared_ptr<RangeFetcher> fetcher_;
    SchedulerOptions options_;
};

}  // namespace paca
