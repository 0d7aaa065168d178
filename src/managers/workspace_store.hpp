#pragma once

#include <string>
#include <memory>
#include <fstream>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Owns one workspace directory tree: <envs-root>/<alias>
class WorkspaceStore {
public:
    explicit WorkspaceStore(fs::path root);

    const fs::path& root() const { return root_; }

    // <root>/<name>. An empty root maps to "/<name>".
    fs::path file(const std::string& name) const;
    fs::path bin_dir() const;

    bool exists() const;

    // Create path and its parents if absent. Throws SetupError.
    void ensure_directory(const fs::path& path) const;

    // Create the file and return a stream open for append at EOF. If the
    // file already exists, nothing is written and nullptr is returned so
    // callers never duplicate generated content. Throws SetupError if the
    // file cannot be created.
    std::unique_ptr<std::ofstream> ensure_file(const fs::path& path) const;

    // Recursively delete the tree. A missing tree is success; any other
    // failure is returned, never thrown.
    Result<void> remove() const;

private:
    fs::path root_;
};

// An alias names a directory directly under the envs root.
Result<void> validate_alias(const std::string& alias);
