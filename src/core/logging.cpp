#include "core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <limits>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

// ── Supervisor log ──────────────────────────────────────────

std::string Logging::supervisor_log_path(const std::string& logs_folder) {
    return (fs::path(logs_folder) / "procsup-cpp.log").string();
}

bool Logging::init(const LoggingConfig& config) {
    try {
        fs::create_directories(config.logs_folder);

        size_t max_size = config.log_file_size_mb > 0
            ? static_cast<size_t>(config.log_file_size_mb) * 1024 * 1024
            : std::numeric_limits<size_t>::max() / 2;

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            supervisor_log_path(config.logs_folder), max_size, kMaxFiles);
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

        auto logger = std::make_shared<spdlog::logger>(
            "procsup", spdlog::sinks_init_list{file_sink, console_sink});
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%L] %v");
        logger->set_level(config.log_debug_enabled ? spdlog::level::debug : spdlog::level::info);
        logger->flush_on(spdlog::level::debug);

        spdlog::set_default_logger(logger);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Cannot initialise logging in " << config.logs_folder << ": " << e.what() << "\n";
        return false;
    }
}

// ── Per-process output ──────────────────────────────────────

ProcessOutputLog::ProcessOutputLog(int fd, std::string path)
    : fd_(fd), path_(std::move(path)) {}

ProcessOutputLog::~ProcessOutputLog() {
    close();
}

bool ProcessOutputLog::close() {
    if (fd_ < 0) return false;
    ::close(fd_);
    fd_ = -1;
    return true;
}

ProcessLogFactory::ProcessLogFactory(std::string logs_folder)
    : logs_folder_(std::move(logs_folder)) {}

std::unique_ptr<ProcessOutputLog> ProcessLogFactory::open(const std::string& process_name) const {
    std::error_code ec;
    fs::create_directories(logs_folder_, ec);
    if (ec) {
        spdlog::error("Could not create log folder <{}>: {}", logs_folder_, ec.message());
        return nullptr;
    }

    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d%H%M%S", &tm_buf);

    std::string base = (fs::path(logs_folder_) / (process_name + "_" + stamp)).string();

    for (int attempt = 0; attempt < 1000; ++attempt) {
        std::string path = base + (attempt == 0 ? "" : "_" + std::to_string(attempt)) + ".log";
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_APPEND | O_CLOEXEC, 0644);
        if (fd >= 0) {
            return std::make_unique<ProcessOutputLog>(fd, path);
        }
        if (errno != EEXIST) {
            spdlog::error("Could not open log file <{}> for process <{}>: {}",
                          path, process_name, std::strerror(errno));
            return nullptr;
        }
    }

    spdlog::error("Could not find a free log file name for process <{}>", process_name);
    return nullptr;
}
