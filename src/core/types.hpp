#pragma once

#include <string>
#include <functional>

// Result type for operations that can fail without aborting the command
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

// Resolved command-line options for one invocation
struct EnvOptions {
    std::string alias;
    std::string cluster_id;
    std::string external_id;
    std::string base_domain;
    std::string username;
    std::string password;
    std::string url;               // API server when logging in with a username
    std::string kubeconfig;        // externally supplied kubeconfig to copy in
    bool reset = false;            // wipe and regenerate the workspace
    bool remove = false;           // delete the workspace and exit
    bool temporary = false;        // delete the workspace after the session
    bool export_kubeconfig = false;
    bool verbose = false;
};
