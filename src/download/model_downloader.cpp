#include "download/model_downloader.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "download/model_reference.h"
#include "download/transfer_planner.h"
#include "utils/file_lock.h"
#include "utils/fs_utils.h"

namespace fs = std::filesystem;

namespace paca {

namespace {

constexpr const char* kLockFileName = ".paca.lock";

}  // namespace

std::vector<fs::path> DownloadOutcome::finalPaths() const {
    std::vector<fs::path> out;
    for (const auto& f : result.files) {
        if (f.status == FileStatus::kSucceeded) out.push_back(f.final_path);
    }
    return out;
}

std::string manifestRecordName(const RemoteManifest& manifest) {
    return "manifest=" + manifest.reference.owner() + "=" + manifest.reference.name() + "=" +
           manifest.quant_family + ".json";
}

std::string manifestRecordJson(const RemoteManifest& manifest) {
    nlohmann::json j;
    j["reference"] = manifest.reference.toString();
    j["quant"] = manifest.quant_family;
    j["files"] = nlohmann::json::array();
    for (const auto& f : manifest.files) {
        j["files"].push_back({{"path", f.path}, {"size", f.size_bytes}, {"hash", f.content_hash}, {"url", f.source_url}});
    }
    return j.dump(2);
}

ModelDownloader::ModelDownloader(DownloadConfig cfg, std::shared_ptr<RangeFetcher> fetcher)
    : cfg_(std::move(cfg)),
      fetcher_(std::move(fetcher)),
      resolver_(cfg_.endpoint, cfg_.token, cfg_.timeout, cfg_.max_retries, cfg_.backoff) {
    if (!fetcher_) {
        std::shared_ptr<HostRateLimiter> limiter;
        if (cfg_.max_bytes_per_sec_per_host > 0) {
            limiter = std::make_shared<HostRateLimiter>(cfg_.max_bytes_per_sec_per_host);
        }
        fetcher_ = std::make_shared<HttpRangeFetcher>(cfg_.endpoint, cfg_.token, limiter);
    }
}

DownloadOutcome ModelDownloader::download(const std::string& reference,
                                          const fs::path& dest_dir,
                                          const CancellationToken& cancel,
                                          const ProgressCallback& progress) {
    DownloadOutcome outcome;
    auto ref = parseModelReference(reference, outcome.error);
    if (!ref) return outcome;

    auto manifest = resolver_.resolve(*ref, outcome.error);
    if (!manifest) return outcome;
    outcome.manifest = manifest;

    outcome.dest_dir = dest_dir.empty() ? fs::path(cfg_.models_dir) / ref->owner() / ref->name() : dest_dir;
    std::error_code ec;
    fs::create_directories(outcome.dest_dir, ec);
    if (ec) {
        outcome.error = make_error(DownloadErrorCode::kDiskIOError,
                                   "create directory " + outcome.dest_dir.string() + ": " + ec.message());
        return outcome;
    }

    FileLock lock(outcome.dest_dir / kLockFileName, true);
    if (!lock.locked()) {
        outcome.error = make_error(DownloadErrorCode::kDiskIOError,
                                   "another download is using " + outcome.dest_dir.string());
        return outcome;
    }

    auto states = loadResumeStates(*manifest, outcome.dest_dir);
    auto present = scanPresentFiles(*manifest, outcome.dest_dir);
    auto plan = planTransfer(*manifest, outcome.dest_dir, states, outcome.error, present);
    if (!plan) return outcome;
    for (const auto& notice : plan->notices) {
        spdlog::info("ModelDownloader: {}", notice);
    }

    if (cfg_.preflight_disk_check && !checkDiskSpace(*plan, outcome.error)) {
        return outcome;
    }
    if (cancel.cancelled()) {
        outcome.error = make_error(DownloadErrorCode::kCancelled, "download cancelled");
        return outcome;
    }

    DownloadScheduler scheduler(fetcher_, SchedulerOptions::fromConfig(cfg_));
    outcome.result = scheduler.run(*plan, cancel, progress);
    outcome.error = outcome.result.firstError();
    if (!outcome.ok()) {
        spdlog::warn("ModelDownloader: download failed ref='{}' error='{}'", manifest->reference.toString(),
                     outcome.error.describe());
        return outcome;
    }

    std::string err;
    const fs::path record = outcome.dest_dir / manifestRecordName(*manifest);
    if (!writeFileDurably(record, manifestRecordJson(*manifest), err)) {
        // The model files are complete; a missing record only loses metadata.
        spdlog::warn("ModelDownloader: failed to write manifest record path='{}' error='{}'", record.string(), err);
    }
    spdlog::info("ModelDownloader: download complete ref='{}' files={} dir='{}'", manifest->reference.toString(),
                 manifest->files.size(), outcome.dest_dir.string());
    return outcome;
}

}  // namespace paca
