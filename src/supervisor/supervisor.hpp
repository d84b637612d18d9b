#pragma once

#include "core/config.hpp"
#include "core/logging.hpp"
#include "supervisor/launcher.hpp"
#include "supervisor/monitor.hpp"
#include "supervisor/registry.hpp"
#include "supervisor/shutdown.hpp"
#include "supervisor/stop_signal.hpp"
#include "supervisor/task_group.hpp"

#include <atomic>
#include <string>
#include <vector>

class Supervisor {
public:
    Supervisor(std::vector<ProcessSpec> specs, const std::string& logs_folder);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /// Populate the registry, start the monitor and dispatch every process
    /// after its start delay. Returns immediately. Only the first call
    /// starts anything; later calls return false.
    bool start();

    /// Stop monitoring and terminate every active process
    ShutdownCoordinator::Report shutdown();

    /// Block until every supervisor task has finished
    void wait();

    /// start(), block until request_stop(), shutdown(), wait()
    int run();

    /// Ask run() to return. Only stores an atomic flag, safe in a signal handler.
    void request_stop();

    Registry& registry() { return registry_; }
    size_t pending_tasks() const { return tasks_.pending(); }

private:
    std::vector<ProcessSpec> specs_;
    ProcessLogFactory logs_;
    Registry registry_;
    StopSignal stop_;
    TaskGroup tasks_;
    Launcher launcher_;
    Monitor monitor_;
    ShutdownCoordinator coordinator_;
    std::atomic<bool> stop_flag_{false};
    bool started_ = false;

    void dispatch(const ProcessSpec& spec);
};
