#include <gtest/gtest.h>
#include "core/logging.hpp"
#include "supervisor/process_control.hpp"

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <string>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Poll until the child has been collected, by us or by someone else
bool wait_gone(pid_t pid, int timeout_ms = 3000) {
    for (int waited = 0; waited < timeout_ms; waited += 10) {
        int status;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno == ECHILD)) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

// The grandchild is reparented, so it may stay a zombie until its new parent reaps it
bool dead_or_zombie(pid_t pid, int timeout_ms = 3000) {
    for (int waited = 0; waited < timeout_ms; waited += 10) {
        std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
        if (!stat.is_open()) return true;
        std::string line;
        std::getline(stat, line);
        auto pos = line.rfind(')');
        if (pos == std::string::npos || pos + 2 >= line.size()) return true;
        char state = line[pos + 2];
        if (state == 'Z' || state == 'X') return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

ProbeResult probe_until_exited(pid_t pid, int timeout_ms = 3000) {
    ProbeResult probe = ProcessControl::probe(pid);
    for (int waited = 0; probe == ProbeResult::Alive && waited < timeout_ms; waited += 10) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        probe = ProcessControl::probe(pid);
    }
    return probe;
}

} // namespace

TEST(ProcessControlTest, SpawnSleep) {
    SpawnOptions options;
    options.path = "/bin/sleep";
    options.args = {"60"};

    auto result = ProcessControl::spawn(options);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_GT(result.pid, 0);
    EXPECT_EQ(ProcessControl::probe(result.pid), ProbeResult::Alive);

    // Child leads its own process group
    EXPECT_EQ(getpgid(result.pid), result.pid);

    EXPECT_TRUE(ProcessControl::terminate(result.pid));
    EXPECT_TRUE(wait_gone(result.pid));
}

TEST(ProcessControlTest, SpawnInvalidBinaryFails) {
    SpawnOptions options;
    options.path = "/nonexistent/binary";

    auto result = ProcessControl::spawn(options);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.pid, -1);
    EXPECT_FALSE(result.error.empty());
}

TEST(ProcessControlTest, SpawnResolvesThroughPath) {
    SpawnOptions options;
    options.path = "true";

    auto result = ProcessControl::spawn(options);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_TRUE(wait_gone(result.pid));
}

TEST(ProcessControlTest, NewSessionWhenHidden) {
    SpawnOptions options;
    options.path = "/bin/sleep";
    options.args = {"60"};
    options.new_session = true;

    auto result = ProcessControl::spawn(options);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(getsid(result.pid), result.pid);

    EXPECT_TRUE(ProcessControl::terminate(result.pid));
    EXPECT_TRUE(wait_gone(result.pid));
}

TEST(ProcessControlTest, OutputRedirectedToFile) {
    fs::path file = fs::temp_directory_path() / ("procsup-test-redirect-" + std::to_string(::getpid()) + ".log");
    int fd = ::open(file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    ASSERT_GE(fd, 0);

    SpawnOptions options;
    options.path = "/bin/sh";
    options.args = {"-c", "echo out; echo err 1>&2"};
    options.output_fd = fd;

    auto result = ProcessControl::spawn(options);
    ASSERT_TRUE(result.success) << result.error;
    auto waited = ProcessControl::wait_for_exit(result.pid, std::chrono::seconds(5));
    ::close(fd);
    EXPECT_TRUE(ProcessControl::reap(result.pid));

    EXPECT_FALSE(waited.timed_out);
    EXPECT_EQ(waited.exit_code, 0);

    std::ifstream in(file);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("out"), std::string::npos);
    EXPECT_NE(content.find("err"), std::string::npos);
    fs::remove(file);
}

TEST(ProcessControlTest, ProbeDoesNotReap) {
    SpawnOptions options;
    options.path = "/bin/false";

    auto result = ProcessControl::spawn(options);
    ASSERT_TRUE(result.success) << result.error;

    EXPECT_EQ(probe_until_exited(result.pid), ProbeResult::Exited);
    // Still collectable after probing
    int code = -999;
    EXPECT_TRUE(ProcessControl::reap(result.pid, &code));
    EXPECT_EQ(code, 1);
    EXPECT_FALSE(ProcessControl::reap(result.pid, &code));
}

TEST(ProcessControlTest, ProbeInvalidPidIsExited) {
    EXPECT_EQ(ProcessControl::probe(0), ProbeResult::Exited);
    EXPECT_EQ(ProcessControl::probe(-1), ProbeResult::Exited);
}

TEST(ProcessControlTest, ProbeForeignProcessWithoutPermission) {
    if (kill(1, 0) == 0) GTEST_SKIP() << "Skipped: pid 1 can be signalled from this user";
    // pid 1 is not our child and belongs to root
    EXPECT_EQ(ProcessControl::probe(1), ProbeResult::Unknown);
}

TEST(ProcessControlTest, WaitForExitReturnsExitCode) {
    SpawnOptions options;
    options.path = "/bin/sh";
    options.args = {"-c", "exit 7"};

    auto result = ProcessControl::spawn(options);
    ASSERT_TRUE(result.success) << result.error;

    auto waited = ProcessControl::wait_for_exit(result.pid, std::chrono::seconds(5));
    EXPECT_FALSE(waited.timed_out);
    EXPECT_FALSE(waited.signaled);
    EXPECT_EQ(waited.exit_code, 7);

    // Left for the caller to collect
    EXPECT_EQ(ProcessControl::probe(result.pid), ProbeResult::Exited);
    int code = -999;
    EXPECT_TRUE(ProcessControl::reap(result.pid, &code));
    EXPECT_EQ(code, 7);
}

TEST(ProcessControlTest, WaitForExitKillsAtDeadline) {
    SpawnOptions options;
    options.path = "/bin/sleep";
    options.args = {"10"};

    auto started = std::chrono::steady_clock::now();
    auto result = ProcessControl::spawn(options);
    ASSERT_TRUE(result.success) << result.error;

    auto waited = ProcessControl::wait_for_exit(result.pid, std::chrono::milliseconds(300));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(waited.timed_out);
    EXPECT_TRUE(waited.signaled);
    EXPECT_GE(elapsed, std::chrono::milliseconds(300));
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_EQ(waited.exit_code, -1);
    // Killed but not yet collected
    EXPECT_EQ(ProcessControl::probe(result.pid), ProbeResult::Exited);
    EXPECT_TRUE(ProcessControl::reap(result.pid));
    EXPECT_FALSE(ProcessControl::reap(result.pid));
}

TEST(ProcessControlTest, TerminateKillsProcessTree) {
    fs::path pid_file = fs::temp_directory_path() / ("procsup-test-tree-" + std::to_string(::getpid()));
    fs::remove(pid_file);

    SpawnOptions options;
    options.path = "/bin/sh";
    // Grandchild in the same group, shell stays in the foreground
    options.args = {"-c", "sleep 60 & echo $! > " + pid_file.string() + "; wait"};

    auto result = ProcessControl::spawn(options);
    ASSERT_TRUE(result.success) << result.error;

    pid_t grandchild = -1;
    for (int i = 0; i < 300 && grandchild <= 0; ++i) {
        std::ifstream in(pid_file);
        if (!(in >> grandchild)) {
            grandchild = -1;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    ASSERT_GT(grandchild, 0);

    EXPECT_TRUE(ProcessControl::terminate(result.pid));
    EXPECT_TRUE(wait_gone(result.pid));
    EXPECT_TRUE(dead_or_zombie(grandchild));
    fs::remove(pid_file);
}

TEST(ProcessControlTest, TerminateRefusesInvalidPid) {
    EXPECT_FALSE(ProcessControl::terminate(0));
    EXPECT_FALSE(ProcessControl::terminate(1));
    EXPECT_FALSE(ProcessControl::terminate(-42));
}

TEST(ProcessControlTest, ChildInheritsOnlyStdio) {
    fs::path logs = fs::temp_directory_path() / ("procsup-test-fds-" + std::to_string(::getpid()));
    LoggingConfig config;
    config.logs_folder = logs.string();
    ASSERT_TRUE(Logging::init(config));

    // Descriptor without close-on-exec, like the one behind the rotating file sink
    int stray_fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(stray_fd, 0);

    SpawnOptions options;
    options.path = "/bin/sleep";
    options.args = {"5"};

    auto result = ProcessControl::spawn(options);
    ::close(stray_fd);
    ASSERT_TRUE(result.success) << result.error;

    std::set<int> fds;
    for (const auto& entry : fs::directory_iterator("/proc/" + std::to_string(result.pid) + "/fd")) {
        fds.insert(std::stoi(entry.path().filename().string()));
    }
    EXPECT_EQ(fds, (std::set<int>{0, 1, 2}));

    EXPECT_TRUE(ProcessControl::terminate(result.pid));
    EXPECT_TRUE(wait_gone(result.pid));

    std::error_code ec;
    fs::remove_all(logs, ec);
}
