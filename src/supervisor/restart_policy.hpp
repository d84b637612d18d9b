#pragma once

#include "supervisor/process_record.hpp"

enum class RestartDecision {
    None,       // restarts not configured
    Restart,    // restart_count was incremented, launch again
    Exhausted   // budget used up, record is marked errored
};

class RestartPolicy {
public:
    /// Decide what to do with a no-wait record that was just seen exited.
    /// Caller holds the registry lock.
    static RestartDecision on_exit(ProcessRecord& rec);
};
