#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/config.hpp>

struct HelperScript {
    std::string name;       // file name under bin/, e.g. "ocl"
    std::string content;
};

// Values substituted into the script templates
struct ScriptContext {
    std::string bin_dir;                        // <root>/bin
    std::string killpids;                       // <root>/.killpids
    std::optional<std::string> login_command;   // no login helper when absent
    ToolCommands tools;
    PrometheusConfig prometheus;
    std::string browser;                        // "" -> $BROWSER -> DEFAULT_BROWSER
};

// Helper scripts for one workspace, placeholders already substituted.
// The login helper (ocl) is included only when a login command exists.
std::vector<HelperScript> helper_scripts(const ScriptContext& ctx);
