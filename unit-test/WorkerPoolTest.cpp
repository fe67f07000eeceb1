#include <atomic>
#include <chrono>
#include <set>
#include <stdexcept>
#include "gtest/gtest.h"
#include "judge/worker_pool.hpp"

using namespace std;
using namespace pocketjudge;

TEST(WorkerPoolTest, DefaultsToHardwareConcurrency) {
    worker_pool pool;
    EXPECT_EQ(max(1u, thread::hardware_concurrency()), pool.size());
}

TEST(WorkerPoolTest, ReturnsTaskResults) {
    worker_pool pool(3);
    vector<future<int>> futures;
    for (int i = 0; i < 20; ++i)
        futures.push_back(pool.submit([i] { return i * i; }));
    for (int i = 0; i < 20; ++i)
        EXPECT_EQ(i * i, futures[i].get());
}

TEST(WorkerPoolTest, RunsTasksConcurrently) {
    worker_pool pool(2);
    atomic<int> running{0};
    atomic<int> peak{0};
    auto task = [&] {
        int now = ++running;
        int expected = peak.load();
        while (now > expected && !peak.compare_exchange_weak(expected, now)) {}
        this_thread::sleep_for(chrono::milliseconds(100));
        --running;
    };
    auto a = pool.submit(task);
    auto b = pool.submit(task);
    a.get();
    b.get();
    EXPECT_EQ(2, peak.load());
}

TEST(WorkerPoolTest, PropagatesExceptions) {
    worker_pool pool(1);
    auto future = pool.submit([]() -> int { throw runtime_error("broken"); });
    EXPECT_THROW(future.get(), runtime_error);

    // 抛出异常后 worker 仍然可以继续执行任务
    EXPECT_EQ(42, pool.submit([] { return 42; }).get());
}

TEST(WorkerPoolTest, DrainsQueueOnDestruction) {
    atomic<int> finished{0};
    {
        worker_pool pool(2, true);
        for (int i = 0; i < 10; ++i)
            pool.submit([&] {
                this_thread::sleep_for(chrono::milliseconds(5));
                ++finished;
            });
    }
    EXPECT_EQ(10, finished.load());
}
