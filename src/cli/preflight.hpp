#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>

struct PreflightIssue {
    std::string environment;   // "" for file-level issues
    std::string message;
    std::string fix;
    bool is_hint = false;      // true = friendly nudge, false = error
    ErrorCode code = ErrorCode::ConfigSchemaInvalid;
};

// Merge and validate every environment of a parsed zenv.json.
// Returns an empty vector if everything is good.
std::vector<PreflightIssue> check_project_config(const ZenvConfig& config,
                                                 const std::string& fallback_cluster);

// Checks on one merged environment
std::vector<PreflightIssue> check_environment(const EffectiveConfig& eff,
                                              const fs::path& project_dir);
