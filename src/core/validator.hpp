#pragma once

#include <string>
#include <vector>
#include "types.hpp"
#include "hostname.hpp"

// How strictly the current machine is checked against an environment's
// target patterns.
struct HostCheckPolicy {
    bool skip_hostname_check = false;   // --no-host
};

// Structural checks on a merged config (ConfigSchemaInvalid on failure):
// non-empty name, python and base_dir; no empty targets, modules or deps;
// custom variable names must be shell identifiers.
Result<void> validate_environment(const EffectiveConfig& eff);

// True if `hostname` matches any of the environment's targets
// (an empty target list matches every host).
bool is_eligible(const EffectiveConfig& eff, const std::string& hostname);

// Verify this machine may use the environment. Fails with MissingHostname or
// TargetMachineMismatch unless the policy skips the check.
Result<void> check_machine(const EffectiveConfig& eff, const HostCheckPolicy& policy,
                           const std::vector<HostnameSource>& sources = default_hostname_sources());
