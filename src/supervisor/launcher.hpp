#pragma once

#include "core/logging.hpp"
#include "supervisor/process_control.hpp"
#include "supervisor/registry.hpp"
#include "supervisor/stop_signal.hpp"

#include <string>

class Launcher {
public:
    Launcher(Registry& registry, const ProcessLogFactory& logs, StopSignal& stop);

    /// Fire-and-forget: start the process and return once it is running.
    /// Returns false if it could not be started or shutdown is in progress.
    bool launch(const std::string& name);

    /// Run-and-wait: start the process and block until it exits or its
    /// timeout elapses. Returns true if it ran to completion.
    bool launch_and_wait(const std::string& name);

private:
    Registry& registry_;
    const ProcessLogFactory& logs_;
    StopSignal& stop_;

    /// Open a fresh output file and start the record's process. Caller holds the registry lock.
    bool start_locked(ProcessRecord& rec, bool waited);
};
