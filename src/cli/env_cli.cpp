#include "env_cli.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <environments/environment.hpp>
#include <managers/process_supervisor.hpp>
#include <iostream>
#include <fmt/format.h>

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::ACCENT << "    ocenv " << theme::color::RESET
              << "[flags] [alias]" << "\n\n";
    std::cout << theme::dim("    Creates ~/ocenv/<alias> with a kubeconfig, helper scripts") << "\n"
              << theme::dim("    (ocl, ocb, ocd, kube_ps1) and a shell scoped to it.") << "\n";

    std::cout << theme::section("Flags");
    const std::vector<std::pair<std::string, std::string>> flags = {
        {"-c, --cluster-id ID", "Log in with a cluster token (alias defaults to ID)"},
        {"-k, --kubeconfig FILE", "Copy an existing kubeconfig into the environment"},
        {"-u, --username USER", "Log in to an individual cluster as USER"},
        {"-p, --password PASS", "Password for --username (prompted when omitted)"},
        {"-a, --api URL", "API server URL for --username"},
        {"    --external-id ID", "External cluster id"},
        {"    --base-domain DOMAIN", "Cluster base domain"},
        {"-r, --reset", "Wipe and regenerate the environment"},
        {"-d, --delete", "Delete the environment and exit"},
        {"-t, --temp", "Delete the environment when the shell exits"},
        {"-e, --export-kubeconfig", "Print the KUBECONFIG export line and exit"},
        {"-v, --verbose", "Show internal status lines"},
        {"    --version", "Show version"},
        {"    --help", "Show this help"},
    };
    for (const auto& [flag, help] : flags) {
        std::cout << theme::color::ACCENT << fmt::format("    {:<26}", flag)
                  << theme::color::RESET << theme::dim(help) << "\n";
    }
    std::cout << "\n";
}

// ── Argument parsing ───────────────────────────────────────

EnvOptions EnvCLI::parse_args(const std::vector<std::string>& args) {
    EnvOptions opts;

    std::vector<std::pair<std::vector<std::string>, std::string*>> valued = {
        {{"-c", "--cluster-id"}, &opts.cluster_id},
        {{"-k", "--kubeconfig"}, &opts.kubeconfig},
        {{"-u", "--username"}, &opts.username},
        {{"-p", "--password"}, &opts.password},
        {{"-a", "--api"}, &opts.url},
        {{"--external-id"}, &opts.external_id},
        {{"--base-domain"}, &opts.base_domain},
    };
    std::vector<std::pair<std::vector<std::string>, bool*>> switches = {
        {{"-r", "--reset"}, &opts.reset},
        {{"-d", "--delete"}, &opts.remove},
        {{"-t", "--temp"}, &opts.temporary},
        {{"-e", "--export-kubeconfig"}, &opts.export_kubeconfig},
        {{"-v", "--verbose"}, &opts.verbose},
    };

    auto matches = [](const std::vector<std::string>& names, const std::string& arg) {
        for (const auto& n : names) if (n == arg) return true;
        return false;
    };

    for (size_t i = 0; i < args.size(); i++) {
        std::string arg = args[i];
        std::string inline_value;
        bool has_inline = false;
        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                has_inline = true;
            }
        }

        bool handled = false;
        for (auto& [names, target] : valued) {
            if (!matches(names, arg)) continue;
            if (has_inline) {
                *target = inline_value;
            } else if (i + 1 < args.size()) {
                *target = args[++i];
            } else {
                throw UsageError(fmt::format("{} requires a value", arg));
            }
            handled = true;
            break;
        }
        if (handled) continue;

        for (auto& [names, target] : switches) {
            if (!matches(names, arg)) continue;
            if (has_inline) throw UsageError(fmt::format("{} does not take a value", arg));
            *target = true;
            handled = true;
            break;
        }
        if (handled) continue;

        if (!arg.empty() && arg[0] == '-') {
            throw UsageError("Unknown flag: " + arg);
        }
        if (!opts.alias.empty()) {
            throw UsageError(fmt::format("Unexpected argument: {} (alias is already '{}')", arg, opts.alias));
        }
        opts.alias = arg;
    }
    return opts;
}

// ── Run ────────────────────────────────────────────────────

int EnvCLI::run(const EnvOptions& opts) {
    auto config_result = Config::load_global();
    if (config_result.is_err()) {
        std::cerr << theme::fail(config_result.error);
        return 1;
    }
    Config config = config_result.value;
    if (opts.verbose) config.set_verbose(true);

    auto log = [&config](const std::string& msg) {
        if (config.verbose()) std::cout << theme::log(msg);
    };
    auto warn = [](const std::string& msg) {
        std::cerr << theme::warn(msg);
    };

    Environment env = Environment::from_options(opts, config);

    if (opts.remove) {
        auto removed = env.remove();
        if (removed.is_err()) {
            warn(removed.error);
        } else {
            std::cout << theme::ok(fmt::format("Deleted environment {}", env.alias()));
        }
        return 0;
    }

    log(fmt::format("Credential mode: {}", mode_name(env.credentials())));

    // A temporary workspace is removed on any failure once it may exist
    try {
        env.setup(log);

        if (opts.export_kubeconfig) {
            env.print_kubeconfig_export(std::cout);
            return 0;
        }

        ProcessSupervisor supervisor(env, std::cout, warn);
        supervisor.set_shell(config.shell());
        int code = supervisor.start();
        log(fmt::format("Shell exited with status {}", code));
    } catch (const std::exception&) {
        if (opts.temporary) {
            auto removed = env.remove();
            if (removed.is_err()) warn(removed.error);
        }
        throw;
    }

    if (opts.temporary) {
        auto removed = env.remove();
        if (removed.is_err()) {
            warn(removed.error);
        } else {
            log(fmt::format("Deleted temporary environment {}", env.alias()));
        }
    }
    return 0;
}
