#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>
#include "infra/thread_pool/thread_pool.hpp"

using fxfer::infra::ThreadPool;

TEST(ThreadPoolTest, RunsEveryTaskBeforeWaitReturns)
{
    ThreadPool pool{4};
    std::atomic<int> counter{0};
    for (int i = 0; i < 1000; ++i) {
        pool.enqueue([&counter] { counter.fetch_add(1); });
    }
    pool.wait();
    EXPECT_EQ(counter.load(), 1000);
}

TEST(ThreadPoolTest, ZeroThreadsMeansOne)
{
    ThreadPool pool{0};
    EXPECT_EQ(pool.size(), 1u);
}

TEST(ThreadPoolTest, ConcurrencyIsBounded)
{
    ThreadPool pool{3};
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    for (int i = 0; i < 30; ++i) {
        pool.enqueue([&] {
            int now = running.fetch_add(1) + 1;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            running.fetch_sub(1);
        });
    }
    pool.wait();
    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
}

TEST(ThreadPoolTest, WaitOnIdlePoolReturnsImmediately)
{
    ThreadPool pool{2};
    pool.wait();
    SUCCEED();
}

TEST(ThreadPoolTest, DestructorDrainsQueuedTasks)
{
    std::atomic<int> counter{0};
    {
        ThreadPool pool{1};
        for (int i = 0; i < 50; ++i) {
            pool.enqueue([&counter] { counter.fetch_add(1); });
        }
    }
    EXPECT_EQ(counter.load(), 50);
}
