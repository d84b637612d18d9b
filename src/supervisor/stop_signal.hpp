#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/// Cooperative cancellation flag shared by every supervisor task.
class StopSignal {
public:
    void request();
    bool requested() const { return stopped_.load(); }

    /// Sleep for up to `timeout`. Returns true if stop was requested.
    bool wait_for(std::chrono::milliseconds timeout);

    /// Clear the flag before a fresh start
    void reset();

private:
    std::atomic<bool> stopped_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};
