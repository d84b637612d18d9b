#include "supervisor/stop_signal.hpp"

void StopSignal::request() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_.store(true);
    }
    cv_.notify_all();
}

bool StopSignal::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return stopped_.load(); });
}

void StopSignal::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_.store(false);
}
