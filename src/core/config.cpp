#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <cstdlib>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / ".config" / "ocenv";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir();
    if (path.rfind("~/", 0) == 0) return platform::home_dir() / path.substr(2);
    return fs::path(path);
}

// $OCENV_ROOT wins over the config file so one-off runs can point elsewhere
static fs::path default_envs_root() {
    const char* root = std::getenv("OCENV_ROOT");
    if (root && *root) return expand_home(root);
    return platform::home_dir() / DEFAULT_ENVS_DIR;
}

Config::Config() : envs_root_(default_envs_root()) {}

static ToolCommands parse_tools(const YAML::Node& root) {
    ToolCommands tools;
    tools.ocm = root["ocm_binary"].as<std::string>(DEFAULT_OCM);
    tools.oc = root["oc_binary"].as<std::string>(DEFAULT_OC);
    tools.login_script = root["login_script"].as<std::string>("");
    return tools;
}

static PrometheusConfig parse_prometheus(const YAML::Node& node) {
    PrometheusConfig prom;
    prom.ns = node["namespace"].as<std::string>(PROM_NAMESPACE);
    prom.service = node["service"].as<std::string>(PROM_SERVICE);
    prom.port = node["port"].as<int>(PROM_REMOTE_PORT);
    prom.local_port = node["local_port"].as<int>(PROM_LOCAL_PORT);
    return prom;
}

Result<Config> Config::load_file(const fs::path& path) {
    Config config;
    if (!fs::exists(path)) {
        return Result<Config>::Ok(config);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        if (root["envs_root"] && !std::getenv("OCENV_ROOT")) {
            config.envs_root_ = expand_home(root["envs_root"].as<std::string>());
        }
        config.shell_ = root["shell"].as<std::string>("");
        config.browser_ = root["browser"].as<std::string>("");
        config.tools_ = parse_tools(root);
        config.prometheus_ = parse_prometheus(root["prometheus"] ? root["prometheus"] : YAML::Node());
        config.verbose_ = root["verbose"].as<bool>(false);

        if (!config.tools_.login_script.empty()) {
            config.tools_.login_script = expand_home(config.tools_.login_script).string();
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config ") + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load_global() {
    return load_file(get_global_config_path());
}
