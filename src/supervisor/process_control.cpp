#include "supervisor/process_control.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

int decode_status(int status, bool* signaled) {
    if (WIFEXITED(status)) {
        if (signaled) *signaled = false;
        return WEXITSTATUS(status);
    }
    if (signaled) *signaled = WIFSIGNALED(status);
    return -1;
}

int decode_siginfo(const siginfo_t& info, bool* signaled) {
    if (info.si_code == CLD_EXITED) {
        *signaled = false;
        return info.si_status;
    }
    *signaled = info.si_code == CLD_KILLED || info.si_code == CLD_DUMPED;
    return -1;
}

pid_t waitpid_blocking(pid_t pid, int* status) {
    pid_t r;
    do {
        r = waitpid(pid, status, 0);
    } while (r < 0 && errno == EINTR);
    return r;
}

// Exit state of a child, leaving it collectable. 1 = exited, 0 = running, -1 = not our child.
int peek_exit(pid_t pid, bool block, ProcessControl::WaitResult& result) {
    int options = WEXITED | WNOWAIT | (block ? 0 : WNOHANG);
    for (;;) {
        siginfo_t info;
        std::memset(&info, 0, sizeof(info));
        if (waitid(P_PID, static_cast<id_t>(pid), &info, options) == 0) {
            if (info.si_pid != pid) return 0;
            result.exit_code = decode_siginfo(info, &result.signaled);
            return 1;
        }
        if (errno != EINTR) return -1;
    }
}

// Close every descriptor above stderr except keep_fd (>= 3). Runs in the forked child.
void close_inherited_fds(int keep_fd) {
#ifdef SYS_close_range
    if ((keep_fd == 3 || syscall(SYS_close_range, 3u, static_cast<unsigned>(keep_fd - 1), 0u) == 0) &&
        syscall(SYS_close_range, static_cast<unsigned>(keep_fd + 1), ~0u, 0u) == 0) {
        return;
    }
#endif
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0) max_fd = 1024;
    for (int fd = 3; fd < max_fd; ++fd) {
        if (fd != keep_fd) ::close(fd);
    }
}

} // namespace

ProcessControl::SpawnResult ProcessControl::spawn(const SpawnOptions& options) {
    // Build argv before fork, the child only calls async-signal-safe functions
    std::vector<const char*> argv;
    argv.push_back(options.path.c_str());
    for (const auto& arg : options.args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    // Exec errors come back through a close-on-exec pipe
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        return {false, -1, std::string("pipe2: ") + std::strerror(errno)};
    }

    int null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd < 0) {
        int err = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        return {false, -1, std::string("/dev/null: ") + std::strerror(err)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        ::close(null_fd);
        return {false, -1, std::string("fork: ") + std::strerror(err)};
    }

    if (pid == 0) {
        // Child process
        ::close(err_pipe[0]);
        if (options.new_session) {
            setsid();
        } else {
            setpgid(0, 0);
        }

        int out_fd = options.output_fd >= 0 ? options.output_fd : null_fd;
        dup2(null_fd, STDIN_FILENO);
        dup2(out_fd, STDOUT_FILENO);
        dup2(out_fd, STDERR_FILENO);
        // Only stdio survives exec; the error pipe closes itself on success
        close_inherited_fds(err_pipe[1]);

        execvp(argv[0], const_cast<char* const*>(argv.data()));

        // If execvp returns, it failed
        int err = errno;
        ssize_t unused = write(err_pipe[1], &err, sizeof(err));
        (void)unused;
        _exit(127);
    }

    // Parent process
    ::close(err_pipe[1]);
    ::close(null_fd);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status;
        waitpid_blocking(pid, &status);
        return {false, -1, std::strerror(child_errno)};
    }

    return {true, pid, ""};
}

ProbeResult ProcessControl::probe(pid_t pid) {
    if (pid <= 0) return ProbeResult::Exited;

    // Our own children: look at their state without collecting it
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0) {
        return info.si_pid == pid ? ProbeResult::Exited : ProbeResult::Alive;
    }
    if (errno != ECHILD) {
        return ProbeResult::Unknown;
    }

    // Not our child (or already collected): fall back to signal 0
    if (kill(pid, 0) == 0) {
        return ProbeResult::Alive;
    }
    return errno == ESRCH ? ProbeResult::Exited : ProbeResult::Unknown;
}

bool ProcessControl::reap(pid_t pid, int* exit_code) {
    if (pid <= 0) return false;

    int status;
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r != pid) return false;

    int code = decode_status(status, nullptr);
    if (exit_code) *exit_code = code;
    return true;
}

ProcessControl::WaitResult ProcessControl::wait_for_exit(pid_t pid, std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;

    WaitResult result{false, false, -1};
    for (;;) {
        int state = peek_exit(pid, false, result);
        if (state != 0) {
            // Exited, or collected elsewhere and the status is lost
            return result;
        }

        auto now = clock::now();
        if (now >= deadline) break;

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining + std::chrono::milliseconds(1),
                                             std::chrono::milliseconds(10)));
    }

    // Deadline reached: end the whole group
    result.timed_out = true;
    if (kill(-pid, SIGKILL) < 0 && kill(pid, SIGKILL) < 0) {
        spdlog::warn("Could not kill process {} after timeout: {}", pid, std::strerror(errno));
    }

    if (peek_exit(pid, true, result) < 0) {
        spdlog::debug("Exit status of process {} is lost: {}", pid, std::strerror(errno));
    }
    return result;
}

bool ProcessControl::terminate(pid_t pid) {
    if (pid <= 1) {
        spdlog::error("Refusing to terminate invalid pid {}", pid);
        return false;
    }

    // Cooperative and forceful requests first, their results do not matter
    if (kill(pid, SIGTERM) < 0) {
        spdlog::debug("SIGTERM to {} failed: {}", pid, std::strerror(errno));
    }
    if (kill(pid, SIGKILL) < 0) {
        spdlog::debug("SIGKILL to {} failed: {}", pid, std::strerror(errno));
    }

    // Authoritative step: the whole tree
    if (kill(-pid, SIGKILL) == 0 || errno == ESRCH) {
        return true;
    }
    spdlog::debug("SIGKILL to process group {} failed: {}", pid, std::strerror(errno));
    return false;
}
