#include "supervisor/restart_policy.hpp"

#include <spdlog/spdlog.h>

RestartDecision RestartPolicy::on_exit(ProcessRecord& rec) {
    const int max_restarts = rec.spec.max_restarts;
    if (max_restarts <= 0) {
        return RestartDecision::None;
    }

    if (rec.status.restart_count < max_restarts) {
        rec.status.restart_count++;
        spdlog::info("Will now try to restart no-wait process <{}>, attempt {} of {}",
                     rec.spec.name, rec.status.restart_count, max_restarts);
        return RestartDecision::Restart;
    }

    rec.status.has_error = true;
    spdlog::error("Process <{}> has reached the max restart count of <{}>. It will not be restarted",
                  rec.spec.name, max_restarts);
    return RestartDecision::Exhausted;
}
