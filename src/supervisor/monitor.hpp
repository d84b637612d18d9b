#pragma once

#include "supervisor/launcher.hpp"
#include "supervisor/registry.hpp"
#include "supervisor/stop_signal.hpp"
#include "supervisor/task_group.hpp"

#include <chrono>

/// Periodic scan of no-wait processes: detects exits and applies the restart policy.
class Monitor {
public:
    static constexpr std::chrono::milliseconds kPollInterval{100};

    Monitor(Registry& registry, Launcher& launcher, TaskGroup& tasks, StopSignal& stop);

    /// Scan every kPollInterval until stop is requested
    void run();

    /// One pass over the registry. Returns the number of exits detected.
    int scan_once();

private:
    Registry& registry_;
    Launcher& launcher_;
    TaskGroup& tasks_;
    StopSignal& stop_;
};
