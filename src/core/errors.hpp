#pragma once

#include <stdexcept>
#include <string>

// Directory, file or copy failure while building a workspace.
// Raised before any shell is launched.
class SetupError : public std::runtime_error {
public:
    explicit SetupError(const std::string& msg) : std::runtime_error(msg) {}
};

// Login data is incomplete (e.g. username mode without an API URL).
// This is a programming error in the caller, never degraded silently.
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& msg) : std::logic_error(msg) {}
};

// The interactive shell could not be resolved or started.
class ProcessLaunchError : public std::runtime_error {
public:
    explicit ProcessLaunchError(const std::string& msg) : std::runtime_error(msg) {}
};
