#include "process.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

extern char** environ;

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() = default;

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        other.pid_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return -1;

    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);

    pid_ = -1;  // reaped
    if (ret < 0) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void ProcessHandle::wait_exited() {
    if (pid_ <= 0) return;

    siginfo_t info;
    int ret;
    do {
        ret = waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT);
    } while (ret < 0 && errno == EINTR);
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program, const SpawnOptions& opts) {
    ProcessHandle handle;

    // Everything the child touches is built before fork
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : opts.args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (const auto& e : opts.env) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);

    std::string cwd = opts.cwd.string();

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        // Child process
        if (opts.new_process_group) {
            setpgid(0, 0);
            // Also done by the parent; whichever runs first wins the race
            if (opts.foreground_tty >= 0) tcsetpgrp(opts.foreground_tty, getpid());
        }

        // Job-control signals may be ignored by the parent; exec keeps that
        for (int sig : {SIGINT, SIGQUIT, SIGTSTP, SIGTTIN, SIGTTOU, SIGCHLD, SIGPIPE}) {
            signal(sig, SIG_DFL);
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(127);
        if (!opts.env.empty()) environ = envp.data();

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    if (opts.new_process_group) {
        setpgid(pid, pid);
        if (opts.foreground_tty >= 0) tcsetpgrp(opts.foreground_tty, pid);
    }
    handle.pid_ = pid;
    return handle;
}

// ── Signals ──────────────────────────────────────────────────

Result<void> send_signal(int pid, int sig) {
    // kill(0) and kill(-1) would hit our own group or every process
    if (pid <= 1) {
        return Result<void>::Err(fmt::format("refusing to signal pid {}", pid));
    }
    if (kill(pid, sig) == 0 || errno == ESRCH) {
        return Result<void>::Ok();
    }
    return Result<void>::Err(fmt::format("kill {}: {}", pid, std::strerror(errno)));
}

Result<void> send_group_signal(int pgid, int sig) {
    if (pgid <= 1) {
        return Result<void>::Err(fmt::format("refusing to signal process group {}", pgid));
    }
    if (killpg(pgid, sig) == 0 || errno == ESRCH) {
        return Result<void>::Ok();
    }
    return Result<void>::Err(fmt::format("killpg {}: {}", pgid, std::strerror(errno)));
}

} // namespace platform
