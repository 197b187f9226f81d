#include <gtest/gtest.h>

#include "thread_pool.hpp"

#include <atomic>
#include <vector>

TEST(ThreadPool, ClampsWorkerCount)
{
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1);
}

TEST(ThreadPool, RunsEveryIndexExactlyOnce)
{
    ThreadPool pool(4);
    std::vector<std::atomic<int>> hits(1000);
    for (auto& h : hits) h = 0;

    pool.run(static_cast<int>(hits.size()), [&](int i) { ++hits[static_cast<size_t>(i)]; });
    for (size_t i = 0; i < hits.size(); ++i)
        EXPECT_EQ(hits[i].load(), 1) << i;
}

TEST(ThreadPool, ZeroJobsReturnsImmediately)
{
    ThreadPool pool(2);
    bool called = false;
    pool.run(0, [&](int) { called = true; });
    EXPECT_FALSE(called);
}

TEST(ThreadPool, BatchesRunBackToBack)
{
    ThreadPool pool(3);
    std::atomic<long> sum{0};
    for (int batch = 1; batch <= 50; ++batch) {
        pool.run(batch, [&](int i) { sum += i + 1; });
        EXPECT_EQ(sum.load(), static_cast<long>(batch) * (batch + 1) / 2);
        sum = 0;
    }
}

TEST(ThreadPool, FewerJobsThanWorkers)
{
    ThreadPool pool(8);
    std::atomic<int> count{0};
    pool.run(2, [&](int) { ++count; });
    EXPECT_EQ(count.load(), 2);
}
