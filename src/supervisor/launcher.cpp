#include "supervisor/launcher.hpp"

#include <spdlog/spdlog.h>

Launcher::Launcher(Registry& registry, const ProcessLogFactory& logs, StopSignal& stop)
    : registry_(registry), logs_(logs), stop_(stop) {}

bool Launcher::start_locked(ProcessRecord& rec, bool waited) {
    const std::string& name = rec.spec.name;

    // A restart must never inherit the previous launch's file
    rec.close_output();
    rec.output = logs_.open(name);
    if (!rec.output) {
        spdlog::error("Could not open log file for process <{}>, its output is discarded", name);
    }

    SpawnOptions options;
    options.path = rec.spec.start_path;
    options.args = rec.spec.start_args;
    options.output_fd = rec.output ? rec.output->fd() : -1;
    options.new_session = rec.spec.hide_window;
    spdlog::debug("Process <{}>, hide_window {}", name, rec.spec.hide_window ? "enabled" : "disabled");

    rec.status.launch_count++;
    auto result = ProcessControl::spawn(options);
    if (!result.success) {
        spdlog::error("Could not start process <{}> ({}): {}", name, rec.spec.start_path, result.error);
        rec.handle.reset();
        rec.status.pid = -1;
        rec.status.active = false;
        rec.status.has_error = true;
        rec.close_output();
        return false;
    }

    rec.handle = LaunchHandle{result.pid, waited};
    rec.status.pid = result.pid;
    rec.status.active = true;
    rec.status.has_error = false;
    rec.status.exit_code = -1;
    rec.status.launched_at = std::chrono::steady_clock::now();
    return true;
}

bool Launcher::launch(const std::string& name) {
    bool started = false;
    bool found = registry_.with_record(name, [&](ProcessRecord& rec) {
        if (stop_.requested()) {
            spdlog::info("Shutdown in progress, not launching process <{}>", name);
            return;
        }
        if (rec.is_wait_mode()) {
            spdlog::error("Process <{}> is configured to run and wait, not launching it as no-wait", name);
            return;
        }

        spdlog::info("Will now try to launch process <{}>", name);
        started = start_locked(rec, false);
        if (started) {
            spdlog::info("Starting process <{}> OK, pid {}", name, rec.status.pid);
        }
    });

    if (!found) {
        spdlog::error("Cannot launch unknown process <{}>", name);
    }
    return started;
}

bool Launcher::launch_and_wait(const std::string& name) {
    pid_t pid = -1;
    int timeout_s = 0;

    bool found = registry_.with_record(name, [&](ProcessRecord& rec) {
        if (stop_.requested()) {
            spdlog::info("Shutdown in progress, not launching process <{}>", name);
            return;
        }
        if (!rec.is_wait_mode()) {
            spdlog::error("Process <{}> has no wait timeout, not launching it as run-and-wait", name);
            return;
        }

        timeout_s = rec.spec.wait_for_exit_timeout_s;
        spdlog::info("Will now try to launch process <{}> with wait option, timeout is <{}>s", name, timeout_s);
        if (start_locked(rec, true)) {
            pid = rec.status.pid;
        }
    });

    if (!found) {
        spdlog::error("Cannot launch unknown process <{}>", name);
        return false;
    }
    if (pid < 0) return false;

    // The lock is not held while the process runs. The child stays a zombie
    // until it is collected below, so its pid cannot be reused while active.
    auto result = ProcessControl::wait_for_exit(pid, std::chrono::seconds(timeout_s));

    bool completed = false;
    registry_.with_record(name, [&](ProcessRecord& rec) {
        if (!ProcessControl::reap(pid)) {
            spdlog::debug("Process <{}>, PID=<{}> was already collected", name, pid);
        }

        // Shutdown marks the record inactive before killing the process
        bool ended_by_shutdown = !rec.status.active && !result.timed_out && result.signaled;

        rec.status.active = false;
        rec.status.done = true;
        rec.status.exit_code = result.exit_code;

        if (result.timed_out) {
            rec.status.timed_out = true;
            spdlog::warn("Process <{}> ran OK but was terminated after its timeout of <{}>s", name, timeout_s);
        } else if (ended_by_shutdown) {
            spdlog::info("Process <{}> was terminated during shutdown", name);
        } else {
            rec.status.ran_to_completion = true;
            completed = true;
            spdlog::info("Running process <{}> OK! Exit code was <{}>", name, result.exit_code);
        }

        rec.close_output();
    });
    return completed;
}
