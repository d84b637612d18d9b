#pragma once

#include "core/config.hpp"

#include <memory>
#include <string>

class Logging {
public:
    /// Install the supervisor's default spdlog logger: rotating file in
    /// logs_folder plus colored stdout. Returns false if the file cannot be created.
    static bool init(const LoggingConfig& config);

    /// Path of the supervisor's own log file inside the given folder
    static std::string supervisor_log_path(const std::string& logs_folder);

    static constexpr size_t kMaxFiles = 2;
};

/// Owned output file of one launched process (stdout and stderr).
class ProcessOutputLog {
public:
    ProcessOutputLog(int fd, std::string path);
    ~ProcessOutputLog();

    ProcessOutputLog(const ProcessOutputLog&) = delete;
    ProcessOutputLog& operator=(const ProcessOutputLog&) = delete;

    int fd() const { return fd_; }
    const std::string& path() const { return path_; }
    bool is_open() const { return fd_ >= 0; }

    /// Close the descriptor. Returns true only for the call that actually closed it.
    bool close();

private:
    int fd_;
    std::string path_;
};

class ProcessLogFactory {
public:
    explicit ProcessLogFactory(std::string logs_folder);

    /// Create <logs_folder>/<name>_<YYYYMMDDHHMMSS>.log, adding _<n> if that
    /// file already exists. Returns nullptr on failure.
    std::unique_ptr<ProcessOutputLog> open(const std::string& process_name) const;

    const std::string& logs_folder() const { return logs_folder_; }

private:
    std::string logs_folder_;
};
