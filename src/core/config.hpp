#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

// External commands the generated helpers and login command invoke
struct ToolCommands {
    std::string ocm = DEFAULT_OCM;
    std::string oc = DEFAULT_OC;
    std::string login_script;       // replaces "ocm cluster login --token" when set
};

// Target of the metrics browser helper (ocb)
struct PrometheusConfig {
    std::string ns = PROM_NAMESPACE;
    std::string service = PROM_SERVICE;
    int port = PROM_REMOTE_PORT;
    int local_port = PROM_LOCAL_PORT;
};

class Config {
public:
    // Load ~/.config/ocenv/config.yaml. A missing file yields defaults.
    static Result<Config> load_global();

    // Load an explicit config file. A missing file yields defaults.
    static Result<Config> load_file(const fs::path& path);

    // Accessors
    const fs::path& envs_root() const { return envs_root_; }
    const std::string& shell() const { return shell_; }
    const std::string& browser() const { return browser_; }
    const ToolCommands& tools() const { return tools_; }
    const PrometheusConfig& prometheus() const { return prometheus_; }
    bool verbose() const { return verbose_; }

    void set_envs_root(const fs::path& root) { envs_root_ = root; }
    void set_shell(const std::string& shell) { shell_ = shell; }
    void set_verbose(bool v) { verbose_ = v; }

public:
    Config();

private:
    fs::path envs_root_;
    std::string shell_;             // "" -> $SHELL -> DEFAULT_SHELL
    std::string browser_;           // "" -> $BROWSER -> DEFAULT_BROWSER
    ToolCommands tools_;
    PrometheusConfig prometheus_;
    bool verbose_ = false;
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Expand a leading "~" to the home directory.
fs::path expand_home(const std::string& path);
