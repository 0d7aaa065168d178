#pragma once

#include <string>
#include <filesystem>
#include <optional>

namespace platform {

// Returns the user's home directory (HOME, falling back to the passwd entry).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Value of an environment variable, or fallback when unset or empty.
std::string env_or(const char* name, const std::string& fallback);

// Resolve a program name the way execvp would: names containing '/' are
// checked directly, anything else is searched on PATH. Returns the path of
// an executable regular file, or nothing.
std::optional<std::filesystem::path> find_executable(const std::string& program);

} // namespace platform
