#pragma once

#include <string>
#include <optional>
#include <variant>
#include <filesystem>
#include "types.hpp"

// Login via a cluster-scoped token, keyed by cluster id
struct TokenLogin {
    std::string cluster_id;
    std::string external_id;
    std::string base_domain;
};

// Login directly against an API server. A URL is mandatory; constructing
// one without it throws ContractViolation.
class UserLogin {
public:
    UserLogin(std::string url, std::string username,
              std::optional<std::string> password = std::nullopt);

    const std::string& url() const { return url_; }
    const std::string& username() const { return username_; }
    const std::optional<std::string>& password() const { return password_; }

private:
    std::string url_;
    std::string username_;
    std::optional<std::string> password_;
};

// An existing kubeconfig is copied into the workspace; no login needed
struct KubeconfigLogin {
    std::filesystem::path source;
};

using Credentials = std::variant<TokenLogin, UserLogin, KubeconfigLogin>;

// Pick the credential mode from raw options.
// Precedence: cluster id, then kubeconfig source, then username/url.
// Returns nothing when no login data was given at all.
std::optional<Credentials> resolve_credentials(const EnvOptions& opts);

// Cluster id in token mode, "" otherwise.
std::string cluster_id_of(const std::optional<Credentials>& creds);

// Short mode name for status output ("token", "user", "kubeconfig", "none").
std::string mode_name(const std::optional<Credentials>& creds);
