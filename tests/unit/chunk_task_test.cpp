#include <gtest/gtest.h>

#include "download/chunk_task.h"

using namespace paca;
using std::chrono::milliseconds;

TEST(ChunkTaskTest, DispatchIncrementsAttempt) {
    ChunkTask task;
    task = onDispatched(task);
    EXPECT_EQ(task.state, ChunkState::kDispatched);
    EXPECT_EQ(task.attempt, 1);
    // Dispatching twice without a result is not a transition.
    auto again = onDispatched(task);
    EXPECT_EQ(again.attempt, 1);
}

TEST(ChunkTaskTest, SuccessOnlyFromDispatched) {
    ChunkTask task;
    EXPECT_EQ(onSuccess(task).state, ChunkState::kPending);
    task = onSuccess(onDispatched(task));
    EXPECT_EQ(task.state, ChunkState::kSucceeded);
}

TEST(ChunkTaskTest, FailureRetriesUntilLimit) {
    const int max_retries = 2;
    ChunkTask task;
    task = onFailure(onDispatched(task), max_retries);
    EXPECT_EQ(task.state, ChunkState::kRetrying);
    task = onFailure(onDispatched(task), max_retries);
    EXPECT_EQ(task.state, ChunkState::kRetrying);
    task = onFailure(onDispatched(task), max_retries);
    EXPECT_EQ(task.state, ChunkState::kFailed);
    EXPECT_EQ(task.attempt, 3);
    // Failed is terminal.
    EXPECT_EQ(onDispatched(task).state, ChunkState::kFailed);
}

TEST(ChunkTaskTest, ZeroRetriesFailsImmediately) {
    ChunkTask task = onFailure(onDispatched(ChunkTask{}), 0);
    EXPECT_EQ(task.state, ChunkState::kFailed);
}

TEST(ChunkTaskTest, BackoffDoublesAndIsCapped) {
    EXPECT_EQ(backoffDelay(milliseconds(500), 1), milliseconds(500));
    EXPECT_EQ(backoffDelay(milliseconds(500), 2), milliseconds(1000));
    EXPECT_EQ(backoffDelay(milliseconds(500), 4), milliseconds(4000));
    EXPECT_EQ(backoffDelay(milliseconds(500), 7), kMaxBackoff);
    EXPECT_EQ(backoffDelay(milliseconds(500), 60), kMaxBackoff);
    EXPECT_EQ(backoffDelay(milliseconds(500), 0), milliseconds(0));
}

TEST(ChunkTaskTest, StateNames) {
    EXPECT_STREQ(to_string(ChunkState::kRetrying), "retrying");
    EXPECT_STREQ(to_string(ChunkState::kSucceeded), "succeeded");
}
