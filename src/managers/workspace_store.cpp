#include "workspace_store.hpp"
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

WorkspaceStore::WorkspaceStore(fs::path root) : root_(std::move(root)) {}

fs::path WorkspaceStore::file(const std::string& name) const {
    return fs::path(root_.string() + "/" + name);
}

fs::path WorkspaceStore::bin_dir() const {
    return file("bin");
}

bool WorkspaceStore::exists() const {
    std::error_code ec;
    return fs::is_directory(root_, ec);
}

void WorkspaceStore::ensure_directory(const fs::path& path) const {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        throw SetupError(fmt::format("cannot create directory {}: {}", path.string(), ec.message()));
    }
}

std::unique_ptr<std::ofstream> WorkspaceStore::ensure_file(const fs::path& path) const {
    // O_EXCL makes "create if absent" a single step
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_APPEND, 0644);
    if (fd < 0) {
        if (errno == EEXIST) return nullptr;
        throw SetupError(fmt::format("cannot create {}: {}", path.string(), std::strerror(errno)));
    }
    ::close(fd);

    auto out = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!*out) {
        throw SetupError(fmt::format("cannot open {} for writing", path.string()));
    }
    return out;
}

Result<void> WorkspaceStore::remove() const {
    if (root_.empty() || root_ == root_.root_path()) {
        return Result<void>::Err(fmt::format("refusing to delete '{}'", root_.string()));
    }

    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Result<void>::Err(fmt::format("failed to delete {}: {}", root_.string(), ec.message()));
    }
    return Result<void>::Ok();
}

Result<void> validate_alias(const std::string& alias) {
    if (alias.empty()) {
        return Result<void>::Err("environment alias is empty");
    }
    // Each .ocenv variable must stay on one line
    if (has_control_chars(alias)) {
        return Result<void>::Err("environment alias contains control characters");
    }
    if (alias == "." || alias == ".." || alias.find('/') != std::string::npos) {
        return Result<void>::Err(fmt::format("invalid environment alias '{}'", alias));
    }
    return Result<void>::Ok();
}
