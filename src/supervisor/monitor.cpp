#include "supervisor/monitor.hpp"
#include "supervisor/process_control.hpp"
#include "supervisor/restart_policy.hpp"

#include <spdlog/spdlog.h>

Monitor::Monitor(Registry& registry, Launcher& launcher, TaskGroup& tasks, StopSignal& stop)
    : registry_(registry), launcher_(launcher), tasks_(tasks), stop_(stop) {}

void Monitor::run() {
    spdlog::debug("Process monitor started");
    while (!stop_.requested()) {
        scan_once();
        if (stop_.wait_for(kPollInterval)) break;
    }
    spdlog::debug("Process monitor stopped");
}

int Monitor::scan_once() {
    int exits = 0;

    registry_.for_each([&](ProcessRecord& rec) {
        if (rec.is_wait_mode() || !rec.handle || !rec.status.active) return;

        const std::string& name = rec.spec.name;
        pid_t pid = rec.handle->pid;

        ProbeResult probe = ProcessControl::probe(pid);
        if (probe == ProbeResult::Alive) return;

        if (probe == ProbeResult::Unknown) {
            spdlog::warn("Process <{}>, PID=<{}> cannot be probed, treating it as exited", name, pid);
        }

        int exit_code = -1;
        if (ProcessControl::reap(pid, &exit_code)) {
            rec.status.exit_code = exit_code;
        }
        spdlog::warn("Process <{}>, PID=<{}> has exited with code {}", name, pid, rec.status.exit_code);
        ++exits;

        rec.status.active = false;
        rec.close_output();

        if (RestartPolicy::on_exit(rec) == RestartDecision::Restart) {
            std::string target = name;
            tasks_.spawn([this, target] { launcher_.launch(target); });
        }
    });

    return exits;
}
