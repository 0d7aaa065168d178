#include "login_command.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

static std::string token_login(const TokenLogin& login, const ToolCommands& tools) {
    if (!tools.login_script.empty()) {
        return fmt::format("{} {}", shell_quote(tools.login_script), shell_quote(login.cluster_id));
    }
    return fmt::format("{} cluster login --token {}", tools.ocm, shell_quote(login.cluster_id));
}

static std::string user_login(const UserLogin& login, const ToolCommands& tools) {
    std::string cmd = tools.oc + " login";
    if (!login.username().empty()) {
        cmd += fmt::format(" -u {}", shell_quote(login.username()));
    }
    if (login.password()) {
        cmd += fmt::format(" -p {}", shell_quote(*login.password()));
    }
    cmd += " " + shell_quote(login.url());
    return cmd;
}

std::optional<std::string> generate_login_command(const Credentials& creds,
                                                  const ToolCommands& tools) {
    if (const auto* token = std::get_if<TokenLogin>(&creds)) {
        return token_login(*token, tools);
    }
    if (const auto* user = std::get_if<UserLogin>(&creds)) {
        return user_login(*user, tools);
    }
    return std::nullopt;
}
