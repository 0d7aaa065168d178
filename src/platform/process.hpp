#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

struct SpawnOptions {
    std::vector<std::string> args;      // argv[1..]
    std::filesystem::path cwd;          // empty = inherit
    std::vector<std::string> env;       // "KEY=value"; empty = inherit
    bool new_process_group = false;     // child becomes leader of its own group
    int foreground_tty = -1;            // hand this terminal to the child's group
};

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Block until the process exits. Returns its exit code, 128 + signal
    // number if it was killed by a signal, or -1 if the handle is invalid.
    // Interrupted waits are resumed.
    int wait();

    // Block until the process has exited but leave it unreaped, so its pid
    // (and process group id) cannot be reused until wait() is called.
    void wait_exited();

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    friend ProcessHandle spawn(const std::string& program, const SpawnOptions& opts);
};

// Fork and exec a child process. Returns an invalid handle if fork fails.
// exec failures surface as exit code 127.
ProcessHandle spawn(const std::string& program, const SpawnOptions& opts);

// Send a signal to one process. A process that no longer exists counts as
// success; pids <= 1 are refused.
Result<void> send_signal(int pid, int sig);

// Send a signal to a whole process group. A vanished group counts as success.
Result<void> send_group_signal(int pgid, int sig);

} // namespace platform
