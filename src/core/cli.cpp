#include "core/cli.hpp"
#include "core/config.hpp"

#include <cstring>
#include <iomanip>
#include <iostream>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[], std::string& config_path) {
    config_path = Config::default_config_path();
    if (argc < 2) return kRunSupervisor;  // no subcommand → run with default config

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "run") == 0) {
        if (argc >= 3) config_path = argv[2];
        return kRunSupervisor;
    }
    if (std::strcmp(cmd, "-cf") == 0) {
        if (argc < 3) {
            std::cerr << "Usage: procsup-cpp -cf <config file>\n";
            return 1;
        }
        config_path = argv[2];
        return kRunSupervisor;
    }
    if (std::strcmp(cmd, "check") == 0) {
        if (argc >= 3) config_path = argv[2];
        return cmd_check(config_path);
    }
    if (std::strcmp(cmd, "default-config") == 0 || std::strcmp(cmd, "-dc") == 0) {
        return cmd_default_config(argc, argv);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'procsup-cpp help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "procsup-cpp: start, monitor and restart a fixed set of processes\n"
        "\n"
        "Usage:\n"
        "  procsup-cpp                        Run with " << Config::default_config_path() << "\n"
        "  procsup-cpp run [config]           Run with the given config file\n"
        "  procsup-cpp -cf <config>           Same as run\n"
        "  procsup-cpp check [config]         Validate a config file and list its tasks\n"
        "  procsup-cpp default-config <path>  Write a default config (.json or .yaml)\n"
        "  procsup-cpp -dc <path>             Same as default-config\n"
        "  procsup-cpp version                Show version\n"
        "  procsup-cpp help                   Show this help\n"
        "\n"
        "Send SIGINT or SIGTERM to stop: every running process is killed\n"
        "before the supervisor exits.\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "procsup-cpp " << APP_VERSION << "\n";
    return 0;
}

// ── check ───────────────────────────────────────────────────

int CLI::cmd_check(const std::string& path) {
    Config config;
    auto result = config.load(path);
    if (!result.success) {
        std::cerr << "Invalid configuration: " << result.error << "\n";
        return 1;
    }

    const auto& data = config.data();
    std::cout << "Configuration " << path << " is valid\n"
              << "Logs folder: " << data.logging.logs_folder
              << " (max " << data.logging.log_file_size_mb << " MB, debug "
              << (data.logging.log_debug_enabled ? "on" : "off") << ")\n\n";

    std::cout << std::left
              << std::setw(20) << "NAME"
              << std::setw(8) << "MODE"
              << std::setw(8) << "DELAY"
              << std::setw(10) << "RESTARTS"
              << "COMMAND\n";
    for (const auto& task : data.tasks) {
        std::string mode = task.wait_for_exit_timeout_s > 0
            ? "wait " + std::to_string(task.wait_for_exit_timeout_s) + "s"
            : "nowait";
        std::string command = task.start_path;
        for (const auto& arg : task.start_args) {
            command += " " + arg;
        }
        std::cout << std::setw(20) << task.name
                  << std::setw(8) << mode
                  << std::setw(8) << (std::to_string(task.start_delay_s) + "s")
                  << std::setw(10) << task.max_restarts
                  << command << "\n";
    }
    return 0;
}

// ── default-config ──────────────────────────────────────────

int CLI::cmd_default_config(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: procsup-cpp default-config <path>\n";
        return 1;
    }

    const char* path = argv[2];
    std::cout << "Creating default configuration file " << path << "...\n";
    if (!Config::write_default(path)) {
        std::cerr << "Cannot write default configuration to " << path << "\n";
        return 1;
    }
    return 0;
}
