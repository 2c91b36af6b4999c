#include "core/WorkerPool.h"

#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using namespace DiceTune;

TEST(WorkerPoolTest, RunsEveryTaskExactlyOnce)
{
    WorkerPool pool(4);
    std::vector<int> hits(100, 0);

    pool.run(hits.size(), [&hits](size_t index) { hits[index]++; });

    for (const int count : hits) {
        EXPECT_EQ(count, 1);
    }
}

TEST(WorkerPoolTest, RunBlocksUntilBatchCompletes)
{
    WorkerPool pool(3);
    std::atomic<int> finished{ 0 };

    pool.run(50, [&finished](size_t) { finished.fetch_add(1); });

    EXPECT_EQ(finished.load(), 50);
}

TEST(WorkerPoolTest, LowestIndexedFailureIsRethrown)
{
    WorkerPool pool(4);

    try {
        pool.run(20, [](size_t index) {
            if (index == 7 || index == 3 || index == 15) {
                throw std::runtime_error("task " + std::to_string(index));
            }
        });
        FAIL() << "Expected exception";
    }
    catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "task 3");
    }
}

TEST(WorkerPoolTest, PoolStaysUsableAfterFailure)
{
    WorkerPool pool(2);
    EXPECT_THROW(pool.run(4, [](size_t) { throw std::runtime_error("boom"); }), std::runtime_error);

    std::vector<int> hits(8, 0);
    pool.run(hits.size(), [&hits](size_t index) { hits[index] = 1; });

    for (const int hit : hits) {
        EXPECT_EQ(hit, 1);
    }
}

TEST(WorkerPoolTest, EmptyBatchReturnsImmediately)
{
    WorkerPool pool(2);
    bool called = false;

    pool.run(0, [&called](size_t) { called = true; });

    EXPECT_FALSE(called);
}

TEST(WorkerPoolTest, ResolveWorkerCountHonorsRequestOrDetectsCores)
{
    EXPECT_EQ(resolveWorkerCount(4, 1), 4);
    EXPECT_GE(resolveWorkerCount(0, 1), 1);
    EXPECT_GE(resolveWorkerCount(0, 1000), 1);
    EXPECT_EQ(WorkerPool(0).workerCount(), 1);
}
