#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "download/download_error.h"
#include "download/download_scheduler.h"
#include "download/progress_aggregator.h"
#include "download/range_fetcher.h"
#include "download/remote_manifest.h"
#include "utils/config.h"

namespace paca {

struct DownloadOutcome {
    DownloadError error;  // first failure, kOk when every file succeeded
    std::optional<RemoteManifest> manifest;
    std::filesystem::path dest_dir;
    DownloadResult result;

    bool ok() const { return error.ok(); }
    std::vector<std::filesystem::path> finalPaths() const;
};

// Runs one reference end to end: resolve, plan, lock the destination, transfer.
class ModelDownloader {
public:
    // A null fetcher selects the HTTP fetcher configured from cfg.
    explicit ModelDownloader(DownloadConfig cfg, std::shared_ptr<RangeFetcher> fetcher = nullptr);

    // An empty dest_dir selects <models_dir>/<owner>/<name>.
    DownloadOutcome download(const std::string& reference,
                             const std::filesystem::path& dest_dir,
                             const CancellationToken& cancel,
                             const ProgressCallback& progress = nullptr);

    const DownloadConfig& config() const { return cfg_; }

private:
    DownloadConfig cfg_;
    std::shared_ptr<RangeFetcher> fetcher_;
    ManifestResolver resolver_;
};

// "manifest=<owner>=<name>=<quant>.json"
std::string manifestRecordName(const RemoteManifest& manifest);

// JSON form of a resolved manifest, written next to the downloaded files.
std::string manifestRecordJson(const RemoteManifest& manifest);

}  // namespace paca
