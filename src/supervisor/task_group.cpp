#include "supervisor/task_group.hpp"

#include <spdlog/spdlog.h>

TaskGroup::~TaskGroup() {
    wait();
}

void TaskGroup::spawn(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.fetch_add(1);
    threads_.emplace_back([this, task = std::move(task)] {
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Supervisor task failed: {}", e.what());
        }
        pending_.fetch_sub(1);
    });
}

void TaskGroup::wait() {
    for (;;) {
        std::vector<std::thread> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (threads_.empty()) return;
            batch.swap(threads_);
        }
        for (auto& t : batch) {
            if (t.joinable()) t.join();
        }
    }
}
