#pragma once

#include <string>

class CLI {
public:
    static constexpr int kRunSupervisor = -2;

    /// Parse argv and dispatch to subcommand.
    /// Returns an exit code, or kRunSupervisor when the caller should run the
    /// supervisor with the config file stored in config_path.
    static int run(int argc, char* argv[], std::string& config_path);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_check(const std::string& path);
    static int cmd_default_config(int argc, char* argv[]);
};
