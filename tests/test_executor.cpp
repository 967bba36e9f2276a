#include "test_support.hpp"

#include "triple/runtime/executor.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>

using namespace triple::runtime;

TEST(ThreadPoolExecutorTest, ExecutesScheduledTasks)
{
    ThreadPoolExecutor exec(2, 2, nullptr);
    std::atomic<int> counter{0};
    std::promise<void> done;
    auto fut = done.get_future();

    for (int i = 0; i < 5; ++i) {
        exec.schedule([&] {
            if (counter.fetch_add(1, std::memory_order_relaxed) == 4) {
                done.set_value();
            }
        });
    }

    EXPECT_EQ(fut.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    exec.stop();
    EXPECT_EQ(counter.load(std::memory_order_relaxed), 5);
}

TEST(ThreadPoolExecutorTest, StopDrainsQueuedTasks)
{
    ThreadPoolExecutor exec(1, 1, nullptr);
    std::atomic<int> counter{0};
    for (int i = 0; i < 20; ++i) {
        exec.schedule([&] { counter.fetch_add(1, std::memory_order_relaxed); });
    }
    exec.stop();
    EXPECT_EQ(counter.load(std::memory_order_relaxed), 20);
}

TEST(ThreadPoolExecutorTest, LogsThrowingTaskAndKeepsRunning)
{
    triple::test::CapturingLogger log;
    ThreadPoolExecutor exec(1, 1, log.logger());
    std::promise<void> done;
    auto fut = done.get_future();

    exec.schedule([] { throw std::runtime_error("bad task"); });
    exec.schedule([&] { done.set_value(); });

    EXPECT_EQ(fut.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    exec.stop();
    EXPECT_EQ(log.count("executor task threw exception: bad task"), 1u);
}

TEST(ThreadPoolExecutorTest, ScheduleAfterStopIsDropped)
{
    triple::test::CapturingLogger log;
    ThreadPoolExecutor exec(1, 1, log.logger());
    exec.stop();
    bool ran = false;
    exec.schedule([&] { ran = true; });
    EXPECT_FALSE(ran);
    EXPECT_EQ(log.count("task dropped"), 1u);
}

TEST(ThreadPoolExecutorTest, GrowsWhileWorkersAreBusy)
{
    ThreadPoolExecutor exec(1, 3, nullptr);
    EXPECT_EQ(exec.worker_count(), 1u);

    std::promise<void> release;
    auto gate = release.get_future().share();
    std::atomic<int> started{0};
    for (int i = 0; i < 3; ++i) {
        exec.schedule([&, gate] {
            started.fetch_add(1);
            gate.wait();
        });
    }

    for (int i = 0; i < 100 && started.load() < 3; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(started.load(), 3);
    EXPECT_EQ(exec.worker_count(), 3u);

    release.set_value();
    exec.stop();
}

TEST(ThreadPoolExecutorTest, QueuesBeyondMaxThreads)
{
    ThreadPoolExecutor exec(1, 2, nullptr);

    std::promise<void> release;
    auto gate = release.get_future().share();
    std::atomic<int> started{0};
    for (int i = 0; i < 3; ++i) {
        exec.schedule([&, gate] {
            started.fetch_add(1);
            gate.wait();
        });
    }

    for (int i = 0; i < 100 && started.load() < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(started.load(), 2);
    EXPECT_EQ(exec.worker_count(), 2u);

    release.set_value();
    exec.stop();
    EXPECT_EQ(started.load(), 3);
}
