#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

/// Runs tasks on their own threads and lets the owner wait for all of them.
class TaskGroup {
public:
    TaskGroup() = default;
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void spawn(std::function<void()> task);

    /// Join every task, including tasks spawned while waiting
    void wait();

    /// Number of tasks that have not finished yet
    size_t pending() const { return pending_.load(); }

private:
    std::mutex mutex_;
    std::vector<std::thread> threads_;
    std::atomic<size_t> pending_{0};
};
