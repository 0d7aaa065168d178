#pragma once

#include <string>
#include <optional>
#include <vector>
#include <iostream>
#include <core/config.hpp>
#include <core/credentials.hpp>
#include <managers/workspace_store.hpp>

// One cluster environment: an alias, its workspace directory and the
// credentials used to reach the cluster.
class Environment {
public:
    Environment(std::string alias, fs::path root,
                std::optional<Credentials> credentials = std::nullopt,
                bool reset_requested = false);

    // Alias defaults to the cluster id; temporary environments without
    // either get "tmp-<pid>". Throws SetupError for an unusable alias and
    // ContractViolation for incomplete login data.
    static Environment from_options(const EnvOptions& opts, const Config& config);

    // Take external command names, Prometheus target and browser from config.
    void apply_config(const Config& config);

    const std::string& alias() const { return alias_; }
    const WorkspaceStore& workspace() const { return workspace_; }
    const std::optional<Credentials>& credentials() const { return credentials_; }
    std::string cluster_id() const { return cluster_id_of(credentials_); }
    bool reset_requested() const { return reset_requested_; }

    fs::path kubeconfig_path() const;
    fs::path env_file() const;
    fs::path shell_init_file() const;
    fs::path killpids_file() const;

    // Build the workspace: reset if requested, directories, variables,
    // helper scripts, kubeconfig. Throws SetupError.
    void setup(StatusCallback cb = nullptr);

    // Delete the workspace tree. Best-effort; failures are returned.
    Result<void> remove() const;

    // Copy the external kubeconfig into the workspace (mode 0600). No-op
    // without a kubeconfig source or when the workspace already has one.
    void create_kubeconfig(StatusCallback cb = nullptr);

    // Write .ocenv and .zshenv unless they already exist.
    void ensure_env_variables();

    // Variables written to .ocenv, in file order.
    std::vector<std::pair<std::string, std::string>> env_variables() const;

    // (Re)write the helper scripts in bin/ with mode 0700.
    void create_bins();

    // "export KUBECONFIG=<root>/kubeconfig.json\n"
    void print_kubeconfig_export(std::ostream& out = std::cout) const;

private:
    std::string alias_;
    WorkspaceStore workspace_;
    std::optional<Credentials> credentials_;
    bool reset_requested_ = false;

    ToolCommands tools_;
    PrometheusConfig prometheus_;
    std::string browser_;
};
