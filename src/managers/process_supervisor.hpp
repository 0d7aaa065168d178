#pragma once

#include <string>
#include <vector>
#include <iostream>
#include <filesystem>
#include <core/types.hpp>

class Environment;

namespace fs = std::filesystem;

// Runs one interactive shell inside an environment's workspace and cleans
// up after it. One instance per session; start() blocks until the shell
// exits.
//
// The shell is started as the leader of its own process group and given
// the terminal. When it exits, the terminal is taken back, the group is
// sent SIGTERM, and every PID the session recorded in .killpids is sent
// SIGTERM as well (jobs started with job control live in other groups).
class ProcessSupervisor {
public:
    // Banners go to out; cleanup warnings go to warn (if set).
    ProcessSupervisor(const Environment& env, std::ostream& out = std::cout,
                      StatusCallback warn = nullptr);

    // Shell to run instead of $SHELL (e.g. from config). "" = no override.
    void set_shell(const std::string& shell) { shell_override_ = shell; }

    // Launch the shell and wait for it. Returns the shell's exit code.
    // Throws ProcessLaunchError if the shell cannot be found or started.
    int start();

    // Signal every PID in .killpids and remove the file. Missing file is a
    // no-op; dead processes are not an error.
    void kill_children();

    // Shell binary that start() would run. Throws ProcessLaunchError.
    fs::path resolve_shell() const;

    // Inherited environment overlaid with the workspace's .ocenv.
    std::vector<std::string> build_environment(const fs::path& shell) const;

private:
    void warn(const std::string& msg) const;

    std::string alias_;
    fs::path root_;
    fs::path env_file_;
    fs::path killpids_;
    std::string shell_override_;
    std::ostream& out_;
    StatusCallback warn_;
};
