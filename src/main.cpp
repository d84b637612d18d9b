#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "supervisor/supervisor.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <signal.h>

static Supervisor* g_supervisor = nullptr;

static void signal_handler(int /*sig*/) {
    if (g_supervisor) {
        g_supervisor->request_stop();
    }
}

static int run_supervisor(const std::string& config_path) {
    Config config;
    auto loaded = config.load(config_path);
    if (!loaded.success) {
        std::cerr << "Cannot load configuration: " << loaded.error << "\n";
        return 1;
    }

    if (!Logging::init(config.data().logging)) {
        return 1;
    }
    spdlog::info("Application successfully initialised from {}. Starting up", config_path);

    Supervisor supervisor(config.data().tasks, config.data().logging.logs_folder);
    g_supervisor = &supervisor;

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    int ret = supervisor.run();
    g_supervisor = nullptr;
    spdlog::shutdown();
    return ret;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    int cli_result = CLI::run(argc, argv, config_path);

    if (cli_result == CLI::kRunSupervisor) {
        return run_supervisor(config_path);
    }
    // handled by CLI (help, version, check, default-config, or error)
    return cli_result;
}
