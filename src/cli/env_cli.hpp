#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include <core/types.hpp>

// Raised for unknown flags, missing flag values and extra arguments
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

class EnvCLI {
public:
    // Parse argv[1..] into options. Throws UsageError.
    static EnvOptions parse_args(const std::vector<std::string>& args);

    // Create (or reuse) the environment and run a shell in it, or delete /
    // export it depending on the options. Returns the process exit code.
    int run(const EnvOptions& opts);
};

void print_usage();
