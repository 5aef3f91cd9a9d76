#include "download/download_scheduler.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include <spdlog/spdlog.h>

#include "download/chunk_task.h"
#include "download/destination_writer.h"
#include "download/integrity_verifier.h"
#include "utils/config.h"

namespace paca {

const char* to_string(FileStatus status) {
    switch (status) {
        case FileStatus::kSucceeded:
            return "succeeded";
        case FileStatus::kFailedRetryable:
            return "failed_retryable";
        case FileStatus::kFailedFatal:
            return "failed_fatal";
        case FileStatus::kCancelled:
            return "cancelled";
    }
    return "unknown";
}

bool DownloadResult::ok() const {
    return std::all_of(files.begin(), files.end(),
                       [](const FileOutcome& f) { return f.status == FileStatus::kSucceeded; });
}

bool DownloadResult::cancelled() const {
    return std::any_of(files.begin(), files.end(),
                       [](const FileOutcome& f) { return f.status == FileStatus::kCancelled; });
}

uint64_t DownloadResult::networkBytes() const {
    uint64_t total = 0;
    for (const auto& f : files) total += f.network_bytes;
    return total;
}

DownloadError DownloadResult::firstError() const {
    for (const auto& f : files) {
        if (f.status != FileStatus::kSucceeded) return f.error;
    }
    return {};
}

SchedulerOptions SchedulerOptions::fromConfig(const DownloadConfig& cfg) {
    SchedulerOptions opts;
    opts.max_concurrency = cfg.max_concurrency;
    opts.max_per_file_concurrency = cfg.max_per_file_concurrency;
    opts.chunk_size = cfg.chunk_size;
    opts.max_retries = cfg.max_retries;
    opts.backoff = cfg.backoff;
    opts.timeout = cfg.timeout;
    return opts;
}

namespace {

using Clock = std::chrono::steady_clock;

// Disk and integrity failures cannot be fixed by another attempt.
FileStatus failureStatus(const DownloadError& error) {
    switch (error.code) {
        case DownloadErrorCode::kDiskIOError:
        case DownloadErrorCode::kHashMismatch:
            return FileStatus::kFailedFatal;
        default:
            return FileStatus::kFailedRetryable;
    }
}

struct QueuedTask {
    ChunkTask task;
    Clock::time_point not_before;
};

struct FileRun {
    const FilePlan* plan{nullptr};
    std::atomic<size_t> in_flight{0};
    std::atomic<uint64_t> network_bytes{0};
    uint64_t generation{0};
    size_t outstanding{0};  // tasks of the current generation not yet succeeded
    bool started{false};
    bool done{false};
    bool verifying{false};  // queued for or running verification
    bool writer_open{false};
    bool single_stream{false};
    bool hash_retry_used{false};
    bool change_restart_used{false};
    std::string etag;  // entity tag the recorded bytes came from
    bool reset_pending{false};
    bool reset_ranges_supported{true};
    std::string reset_reason;
    FileOutcome outcome;
};

// State of one DownloadScheduler::run(). Members suffixed Locked expect mutex_ held.
class SchedulerRun {
public:
    SchedulerRun(RangeFetcher& fetcher, const SchedulerOptions& options, const TransferPlan& plan,
                 const CancellationToken& cancel, ProgressAggregator& progress)
        : fetcher_(fetcher), options_(options), plan_(plan), cancel_(cancel), progress_(progress) {
        options_.max_concurrency = std::max<size_t>(1, options_.max_concurrency);
        options_.max_per_file_concurrency = std::max<size_t>(1, options_.max_per_file_concurrency);
        options_.chunk_size = std::max<uint64_t>(1, options_.chunk_size);
    }

    DownloadResult execute() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& fp : plan_.files) {
                auto f = std::make_unique<FileRun>();
                f->plan = &fp;
                f->outcome.path = fp.file.path;
                f->outcome.final_path = fp.final_path;
                f->etag = fp.resume.etag;
                files_.push_back(std::move(f));
            }
            for (size_t i = 0; i < files_.size(); ++i) startFileLocked(i);
        }

        std::vector<std::thread> workers;
        workers.reserve(options_.max_concurrency);
        for (size_t i = 0; i < options_.max_concurrency; ++i) {
            workers.emplace_back([this]() { worker(); });
        }
        for (auto& t : workers) t.join();

        DownloadResult result;
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& f : files_) {
            if (f->writer_open) {
                writer_.close(f->plan->file.path);
                f->writer_open = false;
            }
            if (!f->done) {
                f->outcome.status = FileStatus::kCancelled;
                f->outcome.error = make_error(DownloadErrorCode::kCancelled, "download cancelled");
            }
            f->outcome.network_bytes = f->network_bytes.load();
            spdlog::info("DownloadScheduler: file='{}' status={} network_bytes={}", f->outcome.path,
                         to_string(f->outcome.status), f->outcome.network_bytes);
            result.files.push_back(f->outcome);
        }
        return result;
    }

private:
    void startFileLocked(size_t index) {
        FileRun& f = *files_[index];
        const FilePlan& fp = *f.plan;
        if (fp.state == FilePlanState::kAlreadyPresent) {
            f.verifying = true;
            verify_queue_.push_back(index);
            return;
        }
        auto err = writer_.open(fp);
        if (!err.ok()) {
            failFileLocked(index, failureStatus(err), err);
            return;
        }
        f.writer_open = true;
        enqueueTasksLocked(index, fp.missing);
    }

    void enqueueTasksLocked(size_t index, const std::vector<ByteRange>& missing) {
        FileRun& f = *files_[index];
        const uint64_t size = f.plan->file.size_bytes;
        std::vector<ChunkTask> tasks;
        if (f.single_stream && size > 0) {
            ChunkTask t;
            t.file_index = index;
            t.range = {0, size};
            t.full_stream = true;
            t.generation = f.generation;
            tasks.push_back(t);
        } else if (!f.single_stream) {
            for (const auto& r : splitRanges(missing, options_.chunk_size)) {
                ChunkTask t;
                t.file_index = index;
                t.range = r;
                t.generation = f.generation;
                tasks.push_back(t);
            }
        }
        f.outstanding = tasks.size();
        const auto now = Clock::now();
        for (auto& t : tasks) queue_.push_back({t, now});
        maybeVerifyLocked(index);
    }

    void dropQueuedLocked(size_t index) {
        queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                    [index](const QueuedTask& q) { return q.task.file_index == index; }),
                     queue_.end());
    }

    void scheduleResetLocked(size_t index, bool ranges_supported, std::string reason) {
        FileRun& f = *files_[index];
        f.generation++;
        dropQueuedLocked(index);
        f.outstanding = 0;
        f.reset_pending = true;
        f.reset_ranges_supported = ranges_supported;
        f.reset_reason = std::move(reason);
        spdlog::warn("DownloadScheduler: restarting file='{}' reason='{}'", f.plan->file.path, f.reset_reason);
        if (f.in_flight.load() == 0) applyResetLocked(index);
    }

    // Runs once no task of the file is in flight.
    void applyResetLocked(size_t index) {
        FileRun& f = *files_[index];
        const FilePlan& fp = *f.plan;
        f.reset_pending = false;
        f.etag.clear();

        DownloadError err;
        if (f.writer_open) {
            err = writer_.reset(fp.file.path, f.reset_ranges_supported);
        } else {
            FilePlan fresh = fp;
            fresh.state = FilePlanState::kFetch;
            fresh.resume.ranges.clear();
            fresh.resume.ranges_supported = f.reset_ranges_supported;
            err = writer_.open(fresh);
            if (err.ok()) f.writer_open = true;
        }
        if (!err.ok()) {
            failFileLocked(index, failureStatus(err), err);
            return;
        }
        progress_.resetFile(fp.file.path, f.reset_reason);
        enqueueTasksLocked(index, RangeSet().complement(fp.file.size_bytes));
    }

    void failFileLocked(size_t index, FileStatus status, DownloadError error) {
        FileRun& f = *files_[index];
        if (f.done) return;
        f.done = true;
        f.generation++;
        dropQueuedLocked(index);
        f.outstanding = 0;
        f.outcome.status = status;
        f.outcome.error = std::move(error);
        spdlog::warn("DownloadScheduler: file failed file='{}' status={} error='{}'", f.plan->file.path,
                     to_string(status), f.outcome.error.describe());
        progress_.post(ProgressKind::kFileFailed, f.plan->file.path, 0, f.outcome.error.describe());
    }

    void maybeVerifyLocked(size_t index) {
        FileRun& f = *files_[index];
        if (f.done || f.verifying || f.reset_pending || f.outstanding != 0 || f.in_flight.load() != 0) return;
        f.verifying = true;
        verify_queue_.push_back(index);
    }

    bool allDoneLocked() const {
        return std::all_of(files_.begin(), files_.end(), [](const std::unique_ptr<FileRun>& f) { return f->done; });
    }

    // Picks the ready task whose file has the fewest fetches in flight, so a
    // large file cannot hold every worker while a sibling waits.
    std::optional<ChunkTask> takeTaskLocked(Clock::time_point now, Clock::time_point& wake) {
        queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                    [this](const QueuedTask& q) {
                                        const FileRun& f = *files_[q.task.file_index];
                                        return f.done || q.task.generation != f.generation;
                                    }),
                     queue_.end());

        auto best = queue_.end();
        size_t best_in_flight = 0;
        for (auto it = queue_.begin(); it != queue_.end(); ++it) {
            const size_t in_flight = files_[it->task.file_index]->in_flight.load();
            if (in_flight >= options_.max_per_file_concurrency) continue;
            if (it->not_before > now) {
                wake = std::min(wake, it->not_before);
                continue;
            }
            if (best == queue_.end() || in_flight < best_in_flight) {
                best = it;
                best_in_flight = in_flight;
                if (in_flight == 0) break;
            }
        }
        if (best == queue_.end()) return std::nullopt;
        ChunkTask task = best->task;
        queue_.erase(best);
        return task;
    }

    void worker() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            if (cancel_.cancelled() || allDoneLocked()) break;
            if (!verify_queue_.empty()) {
                size_t index = verify_queue_.front();
                verify_queue_.pop_front();
                runVerify(index, lock);
                continue;
            }
            const auto now = Clock::now();
            auto wake = now + std::chrono::milliseconds(100);
            if (auto task = takeTaskLocked(now, wake)) {
                runFetch(*task, lock);
                continue;
            }
            cv_.wait_until(lock, wake);
        }
        cv_.notify_all();
    }

    void runFetch(ChunkTask task, std::unique_lock<std::mutex>& lock) {
        const size_t index = task.file_index;
        FileRun& f = *files_[index];
        const FilePlan& fp = *f.plan;
        const std::string& path = fp.file.path;
        task = onDispatched(task);
        f.in_flight++;
        if (!f.started) {
            f.started = true;
            progress_.post(ProgressKind::kFileStarted, path);
        }
        lock.unlock();

        FetchRequest req;
        req.url = fp.file.source_url;
        req.timeout = options_.timeout;
        DownloadError write_error;
        std::string buffer;
        FetchResult result;

        if (task.full_stream) {
            req.expected_size = fp.file.size_bytes;
            buffer.reserve(static_cast<size_t>(std::min(options_.chunk_size, fp.file.size_bytes)));
            uint64_t offset = 0;
            auto flush = [&]() -> bool {
                if (buffer.empty()) return true;
                write_error = writer_.write(path, {offset, offset + buffer.size()}, buffer.data(), buffer.size());
                if (!write_error.ok()) return false;
                progress_.post(ProgressKind::kProgress, path, buffer.size());
                offset += buffer.size();
                buffer.clear();
                return true;
            };
            result = fetcher_.fetch(
                req,
                [&](const char* data, size_t len) {
                    buffer.append(data, len);
                    return buffer.size() < options_.chunk_size || flush();
                },
                cancel_);
            if (result.ok() && !flush()) result.status = FetchStatus::kSinkError;
            if (result.ok()) {
                lock.lock();
                if (task.generation == f.generation) f.etag = result.etag;
                lock.unlock();
            }
        } else {
            req.range = task.range;
            req.total_size = fp.file.size_bytes;
            buffer.reserve(static_cast<size_t>(task.range.length()));
            result = fetcher_.fetch(
                req,
                [&](const char* data, size_t len) {
                    buffer.append(data, len);
                    return true;
                },
                cancel_);
            if (result.ok()) {
                bool current = false;
                bool adopt_etag = false;
                lock.lock();
                current = !f.done && task.generation == f.generation;
                if (current && !result.etag.empty()) {
                    if (f.etag.empty()) {
                        f.etag = result.etag;
                        adopt_etag = true;
                    } else if (f.etag != result.etag) {
                        // Bytes of two different revisions must never share a file.
                        current = false;
                        result.status = FetchStatus::kRemoteChanged;
                        result.message = "etag " + f.etag + " -> " + result.etag;
                    }
                }
                lock.unlock();
                if (adopt_etag) writer_.setEtag(path, result.etag);
                if (current) {
                    write_error = writer_.write(path, task.range, buffer.data(), buffer.size());
                    if (write_error.ok()) {
                        progress_.post(ProgressKind::kProgress, path, buffer.size());
                    } else {
                        result.status = FetchStatus::kSinkError;
                    }
                }
            }
        }
        f.network_bytes += result.bytes;

        lock.lock();
        f.in_flight--;
        handleResultLocked(task, result, write_error);
        if (f.reset_pending && f.in_flight.load() == 0) applyResetLocked(index);
        maybeVerifyLocked(index);
        cv_.notify_all();
    }

    void handleResultLocked(ChunkTask task, const FetchResult& result, const DownloadError& write_error) {
        const size_t index = task.file_index;
        FileRun& f = *files_[index];
        if (f.done || task.generation != f.generation) return;

        switch (result.status) {
            case FetchStatus::kOk:
                task = onSuccess(task);
                if (f.outstanding > 0) f.outstanding--;
                return;
            case FetchStatus::kRangeUnsupported:
                if (!f.single_stream) {
                    f.single_stream = true;
                    progress_.post(ProgressKind::kNotice, f.plan->file.path, 0,
                                   "server ignored range requests; switching to a single stream");
                    scheduleResetLocked(index, false, "range requests not supported");
                }
                return;
            case FetchStatus::kSinkError:
                failFileLocked(index, FileStatus::kFailedFatal,
                               write_error.ok() ? make_error(DownloadErrorCode::kDiskIOError, result.message)
                                                : write_error);
                return;
            case FetchStatus::kRemoteChanged:
                if (!f.change_restart_used) {
                    f.change_restart_used = true;
                    progress_.post(ProgressKind::kNotice, f.plan->file.path, 0,
                                   "remote file changed (" + result.message + "); downloading again");
                    scheduleResetLocked(index, !f.single_stream, "remote file changed");
                } else {
                    failFileLocked(index, FileStatus::kFailedRetryable,
                                   make_error(DownloadErrorCode::kNetworkTransient,
                                              f.plan->file.path + ": remote file keeps changing (" + result.message +
                                                  "); run again later"));
                }
                return;
            case FetchStatus::kCancelled:
                task.state = ChunkState::kRetrying;
                queue_.push_back({task, Clock::now()});
                return;
            case FetchStatus::kHttpError:
            case FetchStatus::kTransport:
            case FetchStatus::kTruncated:
                break;
        }

        task = onFailure(task, options_.max_retries);
        const std::string detail = std::string(to_string(result.status)) +
                                   (result.http_status ? " status=" + std::to_string(result.http_status) : "") +
                                   (result.message.empty() ? "" : " " + result.message);
        if (task.state == ChunkState::kRetrying) {
            const auto delay = backoffDelay(options_.backoff, task.attempt);
            spdlog::warn("DownloadScheduler: chunk failed file='{}' range={} attempt={} ({}), retrying in {}ms",
                         f.plan->file.path, task.range.toHttpHeader(), task.attempt, detail, delay.count());
            queue_.push_back({task, Clock::now() + delay});
            return;
        }
        failFileLocked(index, FileStatus::kFailedRetryable,
                       make_error(DownloadErrorCode::kNetworkTransient,
                                  f.plan->file.path + ": giving up after " + std::to_string(task.attempt) +
                                      " attempts (" + detail + ")"));
    }

    void runVerify(size_t index, std::unique_lock<std::mutex>& lock) {
        FileRun& f = *files_[index];
        const FilePlan& fp = *f.plan;
        const std::string& path = fp.file.path;
        const bool writer_open = f.writer_open;
        // Without a hash from the file tree, the registry's entity tag is the digest.
        const std::string expected_hash =
            fp.file.content_hash.empty() ? digestFromEtag(f.etag) : fp.file.content_hash;
        lock.unlock();

        progress_.post(ProgressKind::kFileVerifying, path);
        DownloadError err;
        std::filesystem::path target = fp.final_path;
        if (writer_open) {
            target = writer_.tempPath(path);
            if (!writer_.isComplete(path)) {
                err = make_error(DownloadErrorCode::kDiskIOError, path + ": written ranges do not cover the file");
            }
        }
        if (err.ok()) err = verifyFile(target, expected_hash);
        bool finalized = false;
        if (err.ok() && writer_open) {
            err = writer_.finalize(path);
            finalized = err.ok();
        }

        lock.lock();
        f.verifying = false;
        if (finalized) f.writer_open = false;
        if (err.ok()) {
            f.done = true;
            f.outcome.status = FileStatus::kSucceeded;
            f.outcome.error = {};
            progress_.post(ProgressKind::kFileCompleted, path);
            spdlog::info("DownloadScheduler: file complete file='{}' path='{}'", path, fp.final_path.string());
        } else if (err.code == DownloadErrorCode::kHashMismatch && !f.hash_retry_used) {
            f.hash_retry_used = true;
            progress_.post(ProgressKind::kNotice, path, 0, err.describe() + "; downloading again");
            scheduleResetLocked(index, !f.single_stream, "content hash mismatch");
        } else if (err.code == DownloadErrorCode::kHashMismatch) {
            if (f.writer_open) {
                auto reset_err = writer_.reset(path, !f.single_stream);
                if (!reset_err.ok()) {
                    spdlog::warn("DownloadScheduler: cannot discard resume state file='{}' error='{}'", path,
                                 reset_err.describe());
                }
            }
            failFileLocked(index, FileStatus::kFailedFatal, err);
        } else {
            failFileLocked(index, failureStatus(err), err);
        }
        maybeVerifyLocked(index);
        cv_.notify_all();
    }

    RangeFetcher& fetcher_;
    SchedulerOptions options_;
    const TransferPlan& plan_;
    const CancellationToken& cancel_;
    ProgressAggregator& progress_;
    DestinationWriter writer_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<QueuedTask> queue_;
    std::deque<size_t> verify_queue_;
    std::vector<std::unique_ptr<FileRun>> files_;
};

}  // namespace

DownloadScheduler::DownloadScheduler(std::shared_ptr<RangeFetcher> fetcher, SchedulerOptions options)
    : fetcher_(std::move(fetcher)), options_(options) {}

DownloadResult DownloadScheduler::run(const TransferPlan& plan, const CancellationToken& cancel,
                                      const ProgressCallback& progress) {
    ProgressAggregator aggregator(progress);
    for (const auto& fp : plan.files) {
        const uint64_t written = fp.state == FilePlanState::kAlreadyPresent
                                     ? fp.file.size_bytes
                                     : fp.file.size_bytes - fp.missingBytes();
        aggregator.addFile(fp.file.path, fp.file.size_bytes, written);
    }
    aggregator.start();
    for (const auto& notice : plan.notices) {
        aggregator.post(ProgressKind::kNotice, {}, 0, notice);
    }

    spdlog::info("DownloadScheduler: starting files={} bytes_missing={} concurrency={} per_file={} chunk={}",
                 plan.files.size(), plan.missingBytes(), options_.max_concurrency, options_.max_per_file_concurrency,
                 options_.chunk_size);
    SchedulerRun run(*fetcher_, options_, plan, cancel, aggregator);
    DownloadResult result = run.execute();
    aggregator.stop();
    return result;
}

}  // namespace paca
