#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>

struct SpawnOptions {
    std::string path;                // resolved through PATH like execvp
    std::vector<std::string> args;   // arguments after argv[0]
    int output_fd = -1;              // stdout+stderr target, -1 = /dev/null
    bool new_session = false;        // setsid() instead of setpgid(0, 0)
};

enum class ProbeResult {
    Alive,
    Exited,
    Unknown   // cannot be queried (e.g. EPERM on a foreign pid)
};

class ProcessControl {
public:
    struct SpawnResult { bool success; pid_t pid; std::string error; };
    /// fork + execvp. Returns once exec has succeeded or failed in the child.
    /// The child leads its own process group.
    static SpawnResult spawn(const SpawnOptions& options);

    /// Liveness probe. Does not reap the child.
    static ProbeResult probe(pid_t pid);

    /// Collect an exited child without blocking. Returns true if it was collected now.
    static bool reap(pid_t pid, int* exit_code = nullptr);

    struct WaitResult { bool timed_out; bool signaled; int exit_code; };
    /// Wait until the child exits or the timeout elapses. On timeout the
    /// whole process group is killed. The child is left for reap(), so its
    /// pid stays reserved until the caller collects it.
    static WaitResult wait_for_exit(pid_t pid, std::chrono::milliseconds timeout);

    /// SIGTERM, then SIGKILL, then SIGKILL to the process group. Returns
    /// the result of the group kill; a group that is already gone counts as success.
    static bool terminate(pid_t pid);
};
