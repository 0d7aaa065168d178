#include "scripts.hpp"
#include <core/utils.hpp>

// ── Templates ──────────────────────────────────────────────

static const char* LOGIN_TEMPLATE =
    "#!/bin/bash\n"
    "# Log in to the cluster bound to this environment\n"
    "set -euo pipefail\n"
    "{{LOGIN_COMMAND}} \"$@\"\n";

static const char* BROWSER_TEMPLATE =
    "#!/bin/bash\n"
    "# Open Prometheus through a local port-forward. The forwarder is\n"
    "# recorded so it is killed when the environment exits.\n"
    "set -euo pipefail\n"
    "LOCAL_PORT=\"${1:-{{LOCAL_PORT}}}\"\n"
    "{{OC}} -n {{PROM_NAMESPACE}} port-forward \"svc/{{PROM_SERVICE}}\" \"${LOCAL_PORT}:{{PROM_PORT}}\" >/dev/null 2>&1 &\n"
    "echo $! >> {{KILLPIDS}}\n"
    "sleep 2\n"
    "URL=\"http://localhost:${LOCAL_PORT}\"\n"
    "if ! {{BROWSER}} \"$URL\" >/dev/null 2>&1; then\n"
    "    echo \"Prometheus is available at $URL\"\n"
    "fi\n";

static const char* DESCRIBE_TEMPLATE =
    "#!/bin/bash\n"
    "# Describe the cluster bound to this environment\n"
    "set -euo pipefail\n"
    "if [ -n \"${CLUSTERID:-}\" ]; then\n"
    "    exec {{OCM}} describe cluster \"$CLUSTERID\" \"$@\"\n"
    "fi\n"
    "exec {{OC}} get clusterversion version -o yaml \"$@\"\n";

static const char* PROMPT_TEMPLATE =
    "#!/bin/bash\n"
    "# Print the prompt segment for the current kube context\n"
    "source {{BIN}}/kube-ps1.sh\n"
    "kube_ps1\n";

static const char* PROMPT_FUNCTIONS_TEMPLATE =
    "# Prompt functions sourced by kube_ps1\n"
    "KUBE_PS1_SYMBOL=\"${KUBE_PS1_SYMBOL:-k8s}\"\n"
    "\n"
    "kube_ps1_context() {\n"
    "    {{OC}} config current-context 2>/dev/null\n"
    "}\n"
    "\n"
    "kube_ps1_namespace() {\n"
    "    local ns\n"
    "    ns=$({{OC}} config view --minify --output 'jsonpath={..namespace}' 2>/dev/null)\n"
    "    echo \"${ns:-default}\"\n"
    "}\n"
    "\n"
    "kube_ps1() {\n"
    "    local ctx cluster\n"
    "    ctx=$(kube_ps1_context) || ctx=\"\"\n"
    "    if [ -z \"$ctx\" ]; then\n"
    "        printf '(%s|logged out) ' \"$KUBE_PS1_SYMBOL\"\n"
    "        return 0\n"
    "    fi\n"
    "    # oc contexts look like <namespace>/<server>/<user>\n"
    "    cluster=\"${ctx#*/}\"\n"
    "    cluster=\"${cluster%%/*}\"\n"
    "    printf '(%s|%s:%s) ' \"$KUBE_PS1_SYMBOL\" \"$cluster\" \"$(kube_ps1_namespace)\"\n"
    "}\n";

// ── Rendering ──────────────────────────────────────────────

static std::string render(const std::string& text, const ScriptContext& ctx) {
    std::string out = text;
    out = substitute(out, "OC", ctx.tools.oc);
    out = substitute(out, "OCM", ctx.tools.ocm);
    out = substitute(out, "BIN", shell_quote(ctx.bin_dir));
    out = substitute(out, "KILLPIDS", shell_quote(ctx.killpids));
    out = substitute(out, "PROM_NAMESPACE", shell_quote(ctx.prometheus.ns));
    out = substitute(out, "PROM_SERVICE", ctx.prometheus.service);
    out = substitute(out, "PROM_PORT", std::to_string(ctx.prometheus.port));
    out = substitute(out, "LOCAL_PORT", std::to_string(ctx.prometheus.local_port));
    // Configured browser first, then $BROWSER at run time
    std::string browser = ctx.browser.empty()
        ? std::string("${BROWSER:-") + DEFAULT_BROWSER + "}"
        : ctx.browser;
    out = substitute(out, "BROWSER", browser);
    if (ctx.login_command) {
        out = substitute(out, "LOGIN_COMMAND", *ctx.login_command);
    }
    return out;
}

std::vector<HelperScript> helper_scripts(const ScriptContext& ctx) {
    std::vector<HelperScript> scripts;
    if (ctx.login_command) {
        scripts.push_back({"ocl", render(LOGIN_TEMPLATE, ctx)});
    }
    scripts.push_back({"ocb", render(BROWSER_TEMPLATE, ctx)});
    scripts.push_back({"ocd", render(DESCRIBE_TEMPLATE, ctx)});
    scripts.push_back({"kube_ps1", render(PROMPT_TEMPLATE, ctx)});
    scripts.push_back({"kube-ps1.sh", render(PROMPT_FUNCTIONS_TEMPLATE, ctx)});
    return scripts;
}
