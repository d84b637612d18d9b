#pragma once

#include <string>
#include <vector>

struct ProcessSpec {
    std::string name;                  // unique key
    std::string start_path;            // executable, resolved through PATH
    std::vector<std::string> start_args;
    int start_delay_s = 0;             // 0 = start immediately
    int max_restarts = 0;              // 0 = never restart automatically
    int wait_for_exit_timeout_s = 0;   // 0 = fire-and-forget, >0 = run and wait
    bool hide_window = false;          // detach from the controlling terminal

    // Reserved for a custom stop command, not executed by the supervisor
    std::string stop_path;
    std::vector<std::string> stop_args;
};

struct LoggingConfig {
    std::string logs_folder = "./logs";
    int log_file_size_mb = 20;         // 0 = unlimited
    bool log_debug_enabled = true;
};

struct AppConfig {
    LoggingConfig logging;
    std::vector<ProcessSpec> tasks;
};

class Config {
public:
    Config();
    ~Config();

    struct LoadResult { bool success; std::string error; };

    /// Load from a JSON (.json) or YAML file. On failure the previous data is kept.
    LoadResult load(const std::string& path);
    bool save(const std::string& path) const;

    /// Write a configuration with example tasks to the given path
    static bool write_default(const std::string& path);
    static AppConfig default_config();
    static std::string default_config_path();

    AppConfig& data();
    const AppConfig& data() const;

private:
    AppConfig config_;
};
