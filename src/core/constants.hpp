#pragma once

// ── Workspace layout ────────────────────────────────────────
constexpr const char* ENV_VARS_FILE     = ".ocenv";
constexpr const char* SHELL_INIT_FILE   = ".zshenv";
constexpr const char* KUBECONFIG_FILE   = "kubeconfig.json";
constexpr const char* OCM_CONFIG_FILE   = "ocm.json";
constexpr const char* KILLPIDS_FILE     = ".killpids";
constexpr const char* BIN_DIR           = "bin";

// ── Permissions ─────────────────────────────────────────────
constexpr unsigned KUBECONFIG_MODE      = 0600;
constexpr unsigned SCRIPT_MODE          = 0700;

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_ENVS_DIR  = "ocenv";          // under $HOME
constexpr const char* DEFAULT_SHELL     = "/bin/bash";
constexpr const char* DEFAULT_OCM       = "ocm";
constexpr const char* DEFAULT_OC        = "oc";
constexpr const char* DEFAULT_BROWSER   = "xdg-open";

constexpr const char* PROM_NAMESPACE    = "openshift-monitoring";
constexpr const char* PROM_SERVICE      = "prometheus-k8s";
constexpr int PROM_REMOTE_PORT          = 9091;
constexpr int PROM_LOCAL_PORT           = 9090;

// ── Banners ─────────────────────────────────────────────────
// Use fmt::format with ENTER_BANNER: fmt::format(ENTER_BANNER, alias)
constexpr const char* ENTER_BANNER      = "Switching to OpenShift environment {}";
constexpr const char* EXIT_BANNER       = "Exited OpenShift environment";

constexpr const char* OCENV_VERSION     = "0.4.0";
