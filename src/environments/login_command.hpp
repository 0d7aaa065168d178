#pragma once

#include <string>
#include <optional>
#include <core/credentials.hpp>
#include <core/config.hpp>

// Build the shell command that logs in to the environment's cluster.
//
//   TokenLogin      -> "ocm cluster login --token <cluster-id>"
//                      ("<login_script> <cluster-id>" when configured)
//   UserLogin       -> "oc login -u <user> [-p <password>] <url>"
//   KubeconfigLogin -> nothing; the copied kubeconfig is already logged in
//
// Token retrieval happens when the command runs, not here.
std::optional<std::string> generate_login_command(const Credentials& creds,
                                                  const ToolCommands& tools = ToolCommands{});
