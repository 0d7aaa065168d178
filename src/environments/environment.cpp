#include "environment.hpp"
#include "login_command.hpp"
#include "scripts.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>

Environment::Environment(std::string alias, fs::path root,
                         std::optional<Credentials> credentials,
                         bool reset_requested)
    : alias_(std::move(alias)),
      workspace_(std::move(root)),
      credentials_(std::move(credentials)),
      reset_requested_(reset_requested) {}

Environment Environment::from_options(const EnvOptions& opts, const Config& config) {
    for (const auto* value : {&opts.cluster_id, &opts.external_id, &opts.base_domain}) {
        if (has_control_chars(*value)) {
            throw SetupError("cluster identifiers must not contain control characters");
        }
    }
    auto credentials = resolve_credentials(opts);

    std::string alias = opts.alias;
    if (alias.empty()) alias = opts.cluster_id;
    if (alias.empty() && opts.temporary) alias = fmt::format("tmp-{}", getpid());
    if (alias.empty()) {
        throw SetupError("no environment alias given; pass an alias or --cluster-id");
    }

    auto valid = validate_alias(alias);
    if (valid.is_err()) throw SetupError(valid.error);

    fs::path root = fs::absolute(config.envs_root()) / alias;
    Environment env(alias, root, std::move(credentials), opts.reset);
    env.apply_config(config);
    return env;
}

void Environment::apply_config(const Config& config) {
    tools_ = config.tools();
    prometheus_ = config.prometheus();
    browser_ = config.browser();
}

fs::path Environment::kubeconfig_path() const { return workspace_.file(KUBECONFIG_FILE); }
fs::path Environment::env_file() const { return workspace_.file(ENV_VARS_FILE); }
fs::path Environment::shell_init_file() const { return workspace_.file(SHELL_INIT_FILE); }
fs::path Environment::killpids_file() const { return workspace_.file(KILLPIDS_FILE); }

// ── Setup / teardown ───────────────────────────────────────

void Environment::setup(StatusCallback cb) {
    if (reset_requested_) {
        if (cb) cb(fmt::format("Resetting {}", workspace_.root().string()));
        auto removed = remove();
        if (removed.is_err()) throw SetupError(removed.error);
    }

    workspace_.ensure_directory(workspace_.root());
    workspace_.ensure_directory(workspace_.bin_dir());
    if (cb) cb(fmt::format("Workspace {}", workspace_.root().string()));

    ensure_env_variables();
    create_bins();
    if (cb) cb(fmt::format("Helper scripts in {}", workspace_.bin_dir().string()));

    create_kubeconfig(cb);
}

Result<void> Environment::remove() const {
    return workspace_.remove();
}

// ── Credentials ────────────────────────────────────────────

void Environment::create_kubeconfig(StatusCallback cb) {
    if (!credentials_) return;
    const auto* kc = std::get_if<KubeconfigLogin>(&*credentials_);
    if (!kc) return;

    fs::path dest = kubeconfig_path();
    std::error_code ec;
    if (fs::exists(dest, ec)) {
        // oc login writes into this file; only a reset replaces it
        if (cb) cb("Keeping existing kubeconfig.json");
        return;
    }

    std::ifstream in(kc->source, std::ios::binary);
    if (!in) {
        throw SetupError(fmt::format("cannot read kubeconfig {}", kc->source.string()));
    }

    // Created 0600 so the credentials are never readable by others
    int fd = ::open(dest.c_str(), O_WRONLY | O_CREAT | O_EXCL, KUBECONFIG_MODE);
    if (fd < 0) {
        throw SetupError(fmt::format("cannot create {}: {}", dest.string(), std::strerror(errno)));
    }
    ::close(fd);

    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw SetupError(fmt::format("cannot write {}", dest.string()));
    }
    // Streaming an empty buffer sets failbit on out
    if (in.peek() != std::ifstream::traits_type::eof()) out << in.rdbuf();
    out.close();
    if (!out) {
        throw SetupError(fmt::format("failed to copy kubeconfig to {}", dest.string()));
    }

    if (chmod(dest.c_str(), KUBECONFIG_MODE) != 0) {
        throw SetupError(fmt::format("cannot set permissions on {}", dest.string()));
    }
    if (cb) cb(fmt::format("Copied kubeconfig from {}", kc->source.string()));
}

std::vector<std::pair<std::string, std::string>> Environment::env_variables() const {
    std::vector<std::pair<std::string, std::string>> vars;
    vars.emplace_back("KUBECONFIG", kubeconfig_path().string());
    vars.emplace_back("OCM_CONFIG", workspace_.file(OCM_CONFIG_FILE).string());
    vars.emplace_back("PS1", fmt::format("$(kube_ps1)[ocenv:{}] \\W \\$ ", alias_));
    vars.emplace_back("PATH", workspace_.bin_dir().string() + ":" + platform::env_or("PATH", "/usr/bin:/bin"));

    if (credentials_) {
        if (const auto* token = std::get_if<TokenLogin>(&*credentials_)) {
            if (!token->cluster_id.empty()) vars.emplace_back("CLUSTERID", token->cluster_id);
            if (!token->external_id.empty()) vars.emplace_back("EXTERNAL_ID", token->external_id);
            if (!token->base_domain.empty()) vars.emplace_back("BASE_DOMAIN", token->base_domain);
        }
    }
    return vars;
}

void Environment::ensure_env_variables() {
    if (auto out = workspace_.ensure_file(env_file())) {
        for (const auto& [key, value] : env_variables()) {
            *out << key << "=" << shell_quote(value) << "\n";
        }
        out->close();
        if (!*out) throw SetupError(fmt::format("failed to write {}", env_file().string()));
    }

    // zsh reads .zshenv from $ZDOTDIR; pointing ZDOTDIR back at $HOME
    // afterwards lets the user's own startup files load as usual.
    if (auto out = workspace_.ensure_file(shell_init_file())) {
        *out << "source .ocenv\n"
             << "setopt PROMPT_SUBST\n"
             << "PS1=" << shell_quote(fmt::format("$(kube_ps1)[ocenv:{}] %1~ %# ", alias_)) << "\n"
             << "ZDOTDIR=\"$HOME\"\n"
             << "[ -f \"$ZDOTDIR/.zshenv\" ] && source \"$ZDOTDIR/.zshenv\"\n";
        out->close();
        if (!*out) throw SetupError(fmt::format("failed to write {}", shell_init_file().string()));
    }
}

void Environment::print_kubeconfig_export(std::ostream& out) const {
    out << "export KUBECONFIG=" << kubeconfig_path().string() << "\n";
}

// ── Helper scripts ─────────────────────────────────────────

void Environment::create_bins() {
    ScriptContext ctx;
    ctx.bin_dir = workspace_.bin_dir().string();
    ctx.killpids = killpids_file().string();
    if (credentials_) {
        ctx.login_command = generate_login_command(*credentials_, tools_);
    }
    ctx.tools = tools_;
    ctx.prometheus = prometheus_;
    ctx.browser = browser_;

    for (const auto& script : helper_scripts(ctx)) {
        fs::path path = workspace_.bin_dir() / script.name;
        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            throw SetupError(fmt::format("cannot write {}", path.string()));
        }
        out << script.content;
        out.close();
        if (!out) {
            throw SetupError(fmt::format("failed to write {}", path.string()));
        }
        if (chmod(path.c_str(), SCRIPT_MODE) != 0) {
            throw SetupError(fmt::format("cannot make {} executable", path.string()));
        }
    }
}
