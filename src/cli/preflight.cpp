#include "preflight.hpp"
#include <core/validator.hpp>
#include <filesystem>
#include <fmt/format.h>

std::vector<PreflightIssue> check_environment(const EffectiveConfig& eff,
                                              const fs::path& project_dir) {
    std::vector<PreflightIssue> issues;

    auto valid = validate_environment(eff);
    if (valid.is_err()) {
        issues.push_back({eff.name, valid.error, "Fix the entry in zenv.json", false, valid.code});
    }

    if (!eff.requirements_file.empty()) {
        fs::path req = eff.requirements_file;
        if (req.is_relative()) req = project_dir / req;
        if (!fs::exists(req)) {
            issues.push_back({
                eff.name,
                fmt::format("Requirements file '{}' not found", eff.requirements_file),
                "Only the dependencies listed in zenv.json will be installed",
                true
            });
        }
    }

    if (eff.target_machines.empty()) {
        issues.push_back({
            eff.name,
            "No target machines; the environment is eligible everywhere",
            "Set target_machines to restrict it",
            true
        });
    }

    return issues;
}

std::vector<PreflightIssue> check_project_config(const ZenvConfig& config,
                                                 const std::string& fallback_cluster) {
    std::vector<PreflightIssue> issues;

    if (config.environments().empty()) {
        issues.push_back({"", "zenv.json defines no environments",
                          "Add an environment section next to 'common'", true});
        return issues;
    }

    for (const auto& env : config.environments()) {
        auto eff = config.effective(env.name, fallback_cluster);
        if (eff.is_err()) {
            issues.push_back({env.name, eff.error, "Fix the entry in zenv.json", false, eff.code});
            continue;
        }
        auto env_issues = check_environment(eff.value, config.project_dir());
        issues.insert(issues.end(), env_issues.begin(), env_issues.end());
    }

    return issues;
}
