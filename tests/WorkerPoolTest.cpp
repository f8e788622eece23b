#include <gtest/gtest.h>

#include <atomic>
#include <vector>

#include "WorkerPool.hpp"

TEST(WorkerPoolTest, WorkerCountIsClampedToJobs) {
    EXPECT_EQ(resolveWorkerCount(8, 3), 3u);
    EXPECT_EQ(resolveWorkerCount(2, 100), 2u);
    EXPECT_EQ(resolveWorkerCount(4, 0), 1u);
    EXPECT_GE(resolveWorkerCount(0, 1000), 1u);
}

TEST(WorkerPoolTest, EveryIndexRunsExactlyOnce) {
    std::vector<int> hits(500, 0);
    std::atomic<int> calls{0};
    runBounded(hits.size(), 4, [&](std::size_t index) {
        ++hits[index];
        ++calls;
    });

    EXPECT_EQ(calls.load(), 500);
    for (int count : hits) {
        EXPECT_EQ(count, 1);
    }
}

TEST(WorkerPoolTest, NoJobsIsANoOp) {
    bool called = false;
    runBounded(0, 4, [&](std::size_t) { called = true; });
    EXPECT_FALSE(called);
}
