#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "download/range_set.h"

namespace paca {

enum class ChunkState {
    kPending,
    kDispatched,
    kSucceeded,
    kRetrying,
    kFailed,
};

const char* to_string(ChunkState state);

// One unit of transfer work. attempt counts dispatches (1 on the first fetch).
struct ChunkTask {
    size_t file_index{0};
    ByteRange range;
    int attempt{0};
    ChunkState state{ChunkState::kPending};
    // Non-ranged GET of the whole file (server ignored Range).
    bool full_stream{false};
    // File generation the task was created for; bumped when the file is reset.
    uint64_t generation{0};
};

// Transition functions. A transition that is not allowed from the current
// state returns the task unchanged.

// Pending | Retrying -> Dispatched
ChunkTask onDispatched(ChunkTask task);
// Dispatched -> Succeeded
ChunkTask onSuccess(ChunkTask task);
// Dispatched -> Retrying while attempt <= max_retries, else Failed
ChunkTask onFailure(ChunkTask task, int max_retries);

// base * 2^(attempt-1), capped at kMaxBackoff.
std::chrono::milliseconds backoffDelay(std::chrono::milliseconds base, int attempt);

constexpr std::chrono::milliseconds kMaxBackoff{30000};

}  // namespace paca
