#pragma once

#include "core/config.hpp"
#include "core/logging.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <sys/types.h>

struct ProcessStatus {
    pid_t pid = -1;
    bool active = false;             // running as last observed
    bool has_error = false;
    bool timed_out = false;
    bool done = false;               // a run-and-wait launch has returned
    bool ran_to_completion = false;  // a run-and-wait launch exited before its deadline
    int restart_count = 0;
    int launch_count = 0;
    int exit_code = -1;              // -1 when unknown or ended by a signal

    std::chrono::steady_clock::time_point scheduled_at{};
    std::chrono::steady_clock::time_point launched_at{};
};

/// Handle of a started OS process
struct LaunchHandle {
    pid_t pid = -1;
    bool waited = false;             // reaped by its launcher, not by the monitor
};

/// State of one managed process. Owned by the Registry; mutate only under its lock.
struct ProcessRecord {
    explicit ProcessRecord(ProcessSpec s) : spec(std::move(s)) {}

    const ProcessSpec spec;
    std::optional<LaunchHandle> handle;
    std::unique_ptr<ProcessOutputLog> output;
    ProcessStatus status;

    bool is_wait_mode() const { return spec.wait_for_exit_timeout_s > 0; }

    /// Close and drop the output file. Returns true if one was open.
    bool close_output() {
        if (!output) return false;
        bool closed = output->close();
        output.reset();
        return closed;
    }
};
