#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include "errors.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorCode code = ErrorCode::None;
    std::vector<std::string> candidates;   // colliding names for Ambiguous

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorCode::None, {}};
    }

    static Result<T> Err(ErrorCode code, const std::string& err,
                         std::vector<std::string> candidates = {}) {
        return {false, T{}, err, code, std::move(candidates)};
    }

    // Re-wrap a failure of another Result type
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.code, other.candidates};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorCode code = ErrorCode::None;
    std::vector<std::string> candidates;

    static Result<void> Ok() {
        return {true, "", ErrorCode::None, {}};
    }

    static Result<void> Err(ErrorCode code, const std::string& err,
                            std::vector<std::string> candidates = {}) {
        return {false, err, code, std::move(candidates)};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.code, other.candidates};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// External command execution result
struct ProcessResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Configuration structures

// Shared defaults from the "common" section of zenv.json
struct CommonConfig {
    std::string base_dir;                         // venv parent dir (relative to project or absolute)
    std::string requirements_file;                // default requirements/pyproject file
    std::optional<std::string> python_executable;
    std::vector<std::string> modules;
    std::vector<std::string> dependencies;
    std::map<std::string, std::string> custom_activate_vars;
    std::vector<std::string> setup_commands;
};

// One named environment section, exactly as written in zenv.json
struct EnvironmentSpec {
    std::string name;
    std::optional<std::vector<std::string>> target_machines;  // absent = auto-target cluster
    std::optional<std::string> python_executable;
    std::vector<std::string> modules;
    std::optional<std::string> modules_file;
    std::vector<std::string> dependencies;
    std::optional<std::string> requirements_file;
    std::optional<std::string> description;
    std::map<std::string, std::string> custom_activate_vars;
    std::vector<std::string> setup_commands;
};

// Common + environment merged into the settings actually used for setup
struct EffectiveConfig {
    std::string name;
    std::vector<std::string> target_machines;     // empty = any machine
    std::string python_executable;
    std::vector<std::string> modules;
    std::optional<std::string> modules_file;
    std::vector<std::string> dependencies;
    std::string requirements_file;
    std::optional<std::string> description;
    std::map<std::string, std::string> custom_activate_vars;
    std::vector<std::string> setup_commands;
    std::string base_dir;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
