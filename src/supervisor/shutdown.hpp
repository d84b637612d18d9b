#pragma once

#include "supervisor/registry.hpp"
#include "supervisor/stop_signal.hpp"

class ShutdownCoordinator {
public:
    ShutdownCoordinator(Registry& registry, StopSignal& stop);

    struct Report {
        int terminated = 0;   // live processes the terminator was invoked on
        int failed = 0;       // termination failures
        int outputs_closed = 0;
    };

    /// Stop monitoring and terminate every process still active. A single pass
    /// under the registry lock; safe to call more than once.
    Report shutdown();

private:
    Registry& registry_;
    StopSignal& stop_;
};
