#include "validator.hpp"
#include "host_match.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <cctype>

static Result<void> schema_error(const std::string& env, const std::string& what) {
    return Result<void>::Err(ErrorCode::ConfigSchemaInvalid,
        fmt::format("Environment '{}': {}", env, what));
}

static bool is_shell_identifier(const std::string& s) {
    if (s.empty() || std::isdigit(static_cast<unsigned char>(s[0]))) return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

Result<void> validate_environment(const EffectiveConfig& eff) {
    if (trimmed(eff.name).empty()) {
        return Result<void>::Err(ErrorCode::ConfigSchemaInvalid, "Environment name is empty");
    }
    if (trimmed(eff.python_executable).empty()) {
        return schema_error(eff.name, "python_executable is empty");
    }
    if (trimmed(eff.base_dir).empty()) {
        return schema_error(eff.name, "base_dir is empty");
    }
    for (size_t i = 0; i < eff.target_machines.size(); i++) {
        if (trimmed(eff.target_machines[i]).empty()) {
            return schema_error(eff.name, fmt::format("target_machines[{}] is empty", i));
        }
    }
    for (size_t i = 0; i < eff.modules.size(); i++) {
        if (trimmed(eff.modules[i]).empty()) {
            return schema_error(eff.name, fmt::format("modules[{}] is empty", i));
        }
    }
    for (size_t i = 0; i < eff.dependencies.size(); i++) {
        if (trimmed(eff.dependencies[i]).empty()) {
            return schema_error(eff.name, fmt::format("dependencies[{}] is empty", i));
        }
    }
    for (const auto& [key, value] : eff.custom_activate_vars) {
        if (!is_shell_identifier(key)) {
            return schema_error(eff.name,
                fmt::format("custom_activate_vars key '{}' is not a valid variable name", key));
        }
    }
    return Result<void>::Ok();
}

bool is_eligible(const EffectiveConfig& eff, const std::string& hostname) {
    return host_matches_any(hostname, eff.target_machines);
}

Result<void> check_machine(const EffectiveConfig& eff, const HostCheckPolicy& policy,
                           const std::vector<HostnameSource>& sources) {
    if (policy.skip_hostname_check) {
        zenv_log(fmt::format("host check skipped for '{}' (--no-host)", eff.name));
        return Result<void>::Ok();
    }

    auto host = resolve_hostname(sources);
    if (host.is_err()) return Result<void>::Err(host);

    if (is_eligible(eff, host.value)) {
        zenv_log(fmt::format("host '{}' eligible for '{}'", host.value, eff.name));
        return Result<void>::Ok();
    }

    return Result<void>::Err(ErrorCode::TargetMachineMismatch,
        fmt::format("Environment '{}' targets [{}] but this machine is '{}'",
                    eff.name, join(eff.target_machines, ", "), host.value));
}
