#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace paca {

enum class ProgressKind {
    kProgress,
    kFileStarted,
    kFileVerifying,
    kFileCompleted,
    kFileFailed,
    kNotice,
};

const char* to_string(ProgressKind kind);

struct ProgressEvent {
    ProgressKind kind{ProgressKind::kProgress};
    std::string file;
    uint64_t bytes_written{0};
    uint64_t total_bytes{0};
    uint64_t aggregate_written{0};
    uint64_t aggregate_total{0};
    std::string message;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

// Folds progress messages from worker threads into per-file and aggregate
// counters on a single thread, so the callback is never invoked concurrently.
class ProgressAggregator {
public:
    explicit ProgressAggregator(ProgressCallback callback);
    ~ProgressAggregator();

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    // Register a file before start(). already_written counts resumed bytes.
    void addFile(const std::string& file, uint64_t total_bytes, uint64_t already_written);

    void start();

    void post(ProgressKind kind, const std::string& file, uint64_t delta_bytes = 0, std::string message = {});

    // The file's written counter drops back to zero (restart from scratch).
    void resetFile(const std::string& file, std::string message = {});

    // Deliver everything queued, then join the aggregator thread.
    void stop();

private:
    struct Message {
        ProgressKind kind;
        std::string file;
        uint64_t delta;
        std::string message;
        bool reset;
    };
    struct FileCounters {
        uint64_t written{0};
        uint64_t total{0};
    };

    void run();
    void enqueue(Message msg);

    ProgressCallback callback_;
    std::map<std::string, FileCounters> files_;
    uint64_t aggregate_written_{0};
    uint64_t aggregate_total_{0};

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Message> queue_;
    bool stopping_{false};
    std::thread thread_;
};

}  // namespace paca
