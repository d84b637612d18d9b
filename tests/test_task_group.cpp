#include <gtest/gtest.h>
#include "supervisor/stop_signal.hpp"
#include "supervisor/task_group.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

TEST(TaskGroupTest, WaitJoinsAllTasks) {
    TaskGroup tasks;
    std::atomic<int> done{0};
    for (int i = 0; i < 5; ++i) {
        tasks.spawn([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            done++;
        });
    }
    tasks.wait();
    EXPECT_EQ(done.load(), 5);
    EXPECT_EQ(tasks.pending(), 0u);
}

TEST(TaskGroupTest, WaitIncludesTasksSpawnedByTasks) {
    TaskGroup tasks;
    std::atomic<bool> inner_done{false};
    tasks.spawn([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        tasks.spawn([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            inner_done = true;
        });
    });
    tasks.wait();
    EXPECT_TRUE(inner_done.load());
}

TEST(TaskGroupTest, PendingCountsRunningTasks) {
    TaskGroup tasks;
    StopSignal release;
    tasks.spawn([&] { release.wait_for(std::chrono::seconds(5)); });
    EXPECT_EQ(tasks.pending(), 1u);
    release.request();
    tasks.wait();
    EXPECT_EQ(tasks.pending(), 0u);
}

TEST(TaskGroupTest, ThrowingTaskDoesNotEscape) {
    TaskGroup tasks;
    tasks.spawn([] { throw std::runtime_error("boom"); });
    tasks.wait();
    EXPECT_EQ(tasks.pending(), 0u);
}

TEST(StopSignalTest, WaitForTimesOut) {
    StopSignal stop;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(stop.wait_for(std::chrono::milliseconds(50)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
    EXPECT_FALSE(stop.requested());
}

TEST(StopSignalTest, RequestWakesWaiter) {
    StopSignal stop;
    std::thread waker([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        stop.request();
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(stop.wait_for(std::chrono::seconds(10)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_TRUE(stop.requested());
    waker.join();

    stop.reset();
    EXPECT_FALSE(stop.requested());
}
