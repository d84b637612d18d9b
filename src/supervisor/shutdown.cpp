#include "supervisor/shutdown.hpp"
#include "supervisor/process_control.hpp"

#include <spdlog/spdlog.h>

ShutdownCoordinator::ShutdownCoordinator(Registry& registry, StopSignal& stop)
    : registry_(registry), stop_(stop) {}

ShutdownCoordinator::Report ShutdownCoordinator::shutdown() {
    spdlog::debug("Shutting down all supervised processes");

    stop_.request();

    Report report;
    registry_.for_each([&](ProcessRecord& rec) {
        const std::string& name = rec.spec.name;

        if (rec.status.active && rec.handle) {
            pid_t pid = rec.handle->pid;
            if (ProcessControl::probe(pid) == ProbeResult::Alive) {
                spdlog::info("Will now try to kill process <{}>, PID=<{}>", name, pid);
                ++report.terminated;
                if (!ProcessControl::terminate(pid)) {
                    ++report.failed;
                    spdlog::error("Process <{}>, PID=<{}> could not be killed", name, pid);
                }
            } else {
                spdlog::debug("Process <{}>, PID=<{}> has exited. Nothing to do", name, pid);
            }

            // Run-and-wait children are collected by their launcher
            if (!rec.handle->waited) {
                int exit_code = -1;
                if (ProcessControl::reap(pid, &exit_code)) {
                    rec.status.exit_code = exit_code;
                }
            }
            rec.status.active = false;
        }

        if (rec.close_output()) {
            ++report.outputs_closed;
        }
    });

    spdlog::debug("Shutdown pass done: {} terminated, {} failed", report.terminated, report.failed);
    return report;
}
