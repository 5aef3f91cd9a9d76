#include "download/chunk_task.h"

#include <algorithm>

namespace paca {

const char* to_string(ChunkState state) {
    switch (state) {
        case ChunkState::kPending:
            return "pending";
        case ChunkState::kDispatched:
            return "dispatched";
        case ChunkState::kSucceeded:
            return "succeeded";
        case ChunkState::kRetrying:
            return "retrying";
        case ChunkState::kFailed:
            return "failed";
    }
    return "unknown";
}

ChunkTask onDispatched(ChunkTask task) {
    if (task.state != ChunkState::kPending && task.state != ChunkState::kRetrying) return task;
    task.state = ChunkState::kDispatched;
    task.attempt += 1;
    return task;
}

ChunkTask onSuccess(ChunkTask task) {
    if (task.state != ChunkState::kDispatched) return task;
    task.state = ChunkState::kSucceeded;
    return task;
}

ChunkTask onFailure(ChunkTask task, int max_retries) {
    if (task.state != ChunkState::kDispatched) return task;
    task.state = task.attempt <= max_retries ? ChunkState::kRetrying : ChunkState::kFailed;
    return task;
}

std::chrono::milliseconds backoffDelay(std::chrono::milliseconds base, int attempt) {
    if (attempt < 1 || base.count() <= 0) return std::chrono::milliseconds(0);
    // Past 2^15 any sane base is over the cap already.
    const int shift = std::min(attempt - 1, 15);
    const auto delay = base * (int64_t{1} << shift);
    return std::min<std::chrono::milliseconds>(delay, kMaxBackoff);
}

}  // namespace paca
