#include "credentials.hpp"
#include "errors.hpp"

UserLogin::UserLogin(std::string url, std::string username,
                     std::optional<std::string> password)
    : url_(std::move(url)), username_(std::move(username)), password_(std::move(password)) {
    if (url_.empty()) {
        throw ContractViolation("individual cluster login requires an API URL (--api)");
    }
    if (password_ && password_->empty()) password_.reset();
}

std::optional<Credentials> resolve_credentials(const EnvOptions& opts) {
    if (!opts.cluster_id.empty()) {
        return Credentials{TokenLogin{opts.cluster_id, opts.external_id, opts.base_domain}};
    }
    if (!opts.kubeconfig.empty()) {
        return Credentials{KubeconfigLogin{opts.kubeconfig}};
    }
    if (!opts.username.empty() || !opts.password.empty() || !opts.url.empty()) {
        std::optional<std::string> password;
        if (!opts.password.empty()) password = opts.password;
        return Credentials{UserLogin(opts.url, opts.username, password)};
    }
    return std::nullopt;
}

std::string cluster_id_of(const std::optional<Credentials>& creds) {
    if (!creds) return "";
    if (const auto* token = std::get_if<TokenLogin>(&*creds)) return token->cluster_id;
    return "";
}

std::string mode_name(const std::optional<Credentials>& creds) {
    if (!creds) return "none";
    switch (creds->index()) {
        case 0: return "token";
        case 1: return "user";
        default: return "kubeconfig";
    }
}
