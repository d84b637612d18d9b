#include "supervisor/supervisor.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>

Supervisor::Supervisor(std::vector<ProcessSpec> specs, const std::string& logs_folder)
    : specs_(std::move(specs)),
      logs_(logs_folder),
      launcher_(registry_, logs_, stop_),
      monitor_(registry_, launcher_, tasks_, stop_),
      coordinator_(registry_, stop_) {}

Supervisor::~Supervisor() {
    if (started_) {
        shutdown();
    }
    wait();
}

bool Supervisor::start() {
    if (started_) {
        spdlog::error("Supervisor is already started, ignoring second start");
        return false;
    }
    spdlog::debug("Starting {} configured processes", specs_.size());

    stop_.reset();
    registry_.initialize(specs_);
    started_ = true;

    tasks_.spawn([this] { monitor_.run(); });

    for (const auto& spec : specs_) {
        dispatch(spec);
    }
    return true;
}

void Supervisor::dispatch(const ProcessSpec& spec) {
    registry_.with_record(spec.name, [](ProcessRecord& rec) {
        rec.status.scheduled_at = std::chrono::steady_clock::now();
    });

    const std::string name = spec.name;
    const int delay_s = spec.start_delay_s;
    const bool wait_mode = spec.wait_for_exit_timeout_s > 0;

    tasks_.spawn([this, name, delay_s, wait_mode] {
        if (delay_s > 0) {
            spdlog::debug("Process <{}> is configured with a start delay of <{}>s", name, delay_s);
            if (stop_.wait_for(std::chrono::seconds(delay_s))) {
                spdlog::debug("Shutdown requested during start delay of <{}>", name);
                return;
            }
        }

        if (wait_mode) {
            launcher_.launch_and_wait(name);
        } else {
            launcher_.launch(name);
        }
    });
}

ShutdownCoordinator::Report Supervisor::shutdown() {
    return coordinator_.shutdown();
}

void Supervisor::wait() {
    tasks_.wait();
}

void Supervisor::request_stop() {
    stop_flag_.store(true);
}

int Supervisor::run() {
    if (!start()) {
        return 1;
    }
    spdlog::info("Supervisor running with {} processes", specs_.size());

    while (!stop_flag_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Supervisor shutting down...");
    auto report = shutdown();
    wait();

    if (report.failed > 0) {
        spdlog::error("{} processes could not be terminated", report.failed);
    }
    spdlog::info("Supervisor stopped");
    return 0;
}
