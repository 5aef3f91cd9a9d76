#include "download/progress_aggregator.h"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace paca {

const char* to_string(ProgressKind kind) {
    switch (kind) {
        case ProgressKind::kProgress:
            return "progress";
        case ProgressKind::kFileStarted:
            return "file_started";
        case ProgressKind::kFileVerifying:
            return "file_verifying";
        case ProgressKind::kFileCompleted:
            return "file_completed";
        case ProgressKind::kFileFailed:
            return "file_failed";
        case ProgressKind::kNotice:
            return "notice";
    }
    return "unknown";
}

ProgressAggregator::ProgressAggregator(ProgressCallback callback) : callback_(std::move(callback)) {}

ProgressAggregator::~ProgressAggregator() {
    stop();
}

void ProgressAggregator::addFile(const std::string& file, uint64_t total_bytes, uint64_t already_written) {
    auto& counters = files_[file];
    aggregate_total_ += total_bytes - counters.total;
    aggregate_written_ += already_written - counters.written;
    counters.total = total_bytes;
    counters.written = already_written;
}

void ProgressAggregator::start() {
    if (thread_.joinable()) return;
    stopping_ = false;
    thread_ = std::thread([this]() { run(); });
}

void ProgressAggregator::enqueue(Message msg) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(msg));
    }
    cv_.notify_one();
}

void ProgressAggregator::post(ProgressKind kind, const std::string& file, uint64_t delta_bytes, std::string message) {
    enqueue(Message{kind, file, delta_bytes, std::move(message), false});
}

void ProgressAggregator::resetFile(const std::string& file, std::string message) {
    enqueue(Message{ProgressKind::kNotice, file, 0, std::move(message), true});
}

void ProgressAggregator::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_one();
    if (thread_.joinable()) thread_.join();
}

void ProgressAggregator::run() {
    for (;;) {
        std::deque<Message> batch;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty() && stopping_) return;
            batch.swap(queue_);
        }
        for (auto& msg : batch) {
            ProgressEvent ev;
            ev.kind = msg.kind;
            ev.file = msg.file;
            ev.message = std::move(msg.message);
            auto it = files_.find(msg.file);
            if (it != files_.end()) {
                auto& counters = it->second;
                if (msg.reset) {
                    aggregate_written_ -= counters.written;
                    counters.written = 0;
                }
                const uint64_t room = counters.total > counters.written ? counters.total - counters.written : 0;
                const uint64_t delta = std::min(msg.delta, room);
                counters.written += delta;
                aggregate_written_ += delta;
                ev.bytes_written = counters.written;
                ev.total_bytes = counters.total;
            }
            ev.aggregate_written = aggregate_written_;
            ev.aggregate_total = aggregate_total_;
            if (callback_) {
                try {
                    callback_(ev);
                } catch (const std::exception& e) {
                    spdlog::warn("ProgressAggregator: progress callback threw: {}", e.what());
                }
            }
        }
    }
}

}  // namespace paca
