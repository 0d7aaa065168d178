#include "process_supervisor.hpp"
#include <environments/environment.hpp>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <map>
#include <signal.h>
#include <unistd.h>

extern char** environ;

ProcessSupervisor::ProcessSupervisor(const Environment& env, std::ostream& out,
                                     StatusCallback warn)
    : alias_(env.alias()),
      root_(env.workspace().root()),
      env_file_(env.env_file()),
      killpids_(env.killpids_file()),
      out_(out),
      warn_(std::move(warn)) {}

void ProcessSupervisor::warn(const std::string& msg) const {
    if (warn_) warn_(msg);
}

fs::path ProcessSupervisor::resolve_shell() const {
    std::string shell = shell_override_;
    if (shell.empty()) shell = platform::env_or("SHELL", DEFAULT_SHELL);

    auto resolved = platform::find_executable(shell);
    if (!resolved) {
        throw ProcessLaunchError(fmt::format(
            "shell '{}' not found or not executable; set $SHELL or 'shell:' in {}",
            shell, get_global_config_path().string()));
    }
    return *resolved;
}

std::vector<std::string> ProcessSupervisor::build_environment(const fs::path& shell) const {
    std::map<std::string, std::string> vars;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        vars[entry.substr(0, eq)] = entry.substr(eq + 1);
    }

    std::ifstream in(env_file_);
    if (in) {
        std::stringstream buf;
        buf << in.rdbuf();
        for (const auto& [key, value] : parse_env_lines(buf.str())) {
            vars[key] = value;
        }
    }

    // zsh picks up the workspace .zshenv, which hands ZDOTDIR back to $HOME
    if (shell.filename() == "zsh") {
        vars["ZDOTDIR"] = root_.string();
    }

    std::vector<std::string> env;
    env.reserve(vars.size());
    for (const auto& [key, value] : vars) {
        env.push_back(key + "=" + value);
    }
    return env;
}

int ProcessSupervisor::start() {
    fs::path shell = resolve_shell();
    std::vector<std::string> env = build_environment(shell);

    out_ << fmt::format(ENTER_BANNER, alias_) << "\n";
    out_.flush();

    int exit_code;
    {
        platform::ForegroundGuard terminal;

        platform::SpawnOptions opts;
        opts.cwd = root_;
        opts.env = std::move(env);
        opts.new_process_group = true;
        opts.foreground_tty = terminal.tty();

        auto proc = platform::spawn(shell.string(), opts);
        if (!proc.valid()) {
            throw ProcessLaunchError(fmt::format("failed to start {}", shell.string()));
        }
        proc.wait_exited();
        terminal.reclaim();

        // Leftovers in the shell's own group (background work without job
        // control). The unreaped shell keeps the group id from being reused.
        auto group = platform::send_group_signal(proc.native_handle(), SIGTERM);
        if (group.is_err()) warn(group.error);

        exit_code = proc.wait();
    }

    out_ << EXIT_BANNER << "\n";
    out_.flush();

    kill_children();
    return exit_code;
}

void ProcessSupervisor::kill_children() {
    std::error_code ec;
    if (!fs::exists(killpids_, ec)) return;

    {
        std::ifstream in(killpids_);
        std::string line;
        while (std::getline(in, line)) {
            trim(line);
            if (line.empty()) continue;

            auto pid = parse_pid(line);
            if (!pid) {
                warn(fmt::format("ignoring malformed entry '{}' in {}", line, killpids_.string()));
                continue;
            }
            if (*pid == getpid()) continue;

            auto sent = platform::send_signal(*pid, SIGTERM);
            if (sent.is_err()) warn(sent.error);
        }
    }

    fs::remove(killpids_, ec);
    if (ec) {
        warn(fmt::format("failed to remove {}: {}", killpids_.string(), ec.message()));
    }
}
