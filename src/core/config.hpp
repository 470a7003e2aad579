#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Parsed zenv.json: one "common" section plus named environment sections.
// Owns every string it parsed; merged configs are independent copies.
class ZenvConfig {
public:
    // Load ./zenv.json (or <dir>/zenv.json)
    static Result<ZenvConfig> load(const fs::path& project_dir = fs::current_path());

    // Parse document text. `origin` is only used in messages.
    static Result<ZenvConfig> parse(const std::string& text,
                                    const std::string& origin = "zenv.json");

    // Accessors
    const CommonConfig& common() const { return common_; }
    const std::string& base_dir() const { return common_.base_dir; }
    const std::vector<EnvironmentSpec>& environments() const { return environments_; }
    const fs::path& project_dir() const { return project_dir_; }

    const EnvironmentSpec* find(const std::string& name) const;
    std::vector<std::string> environment_names() const;

    // The single environment whose explicit target_machines name this
    // machine (its cluster label, or a non-universal pattern matching the
    // hostname). None or several is EnvironmentNotFound.
    Result<std::string> detect_environment(const std::string& hostname) const;

    // Merge common + the named environment. `fallback_cluster` becomes the
    // target when the environment names none. Applies modules_file.
    Result<EffectiveConfig> effective(const std::string& name,
                                      const std::string& fallback_cluster) const;

public:
    ZenvConfig() = default;

private:
    CommonConfig common_;
    std::vector<EnvironmentSpec> environments_;   // file order
    fs::path project_dir_;
};

// Pure merge: env wins field-by-field, lists are common ++ env, maps are
// common overwritten by env. Python falls back to "python3".
EffectiveConfig merge(const CommonConfig& common,
                      const EnvironmentSpec& env,
                      const std::string& fallback_cluster);

// Module names from a modules file: one or more per line, '#' comments and
// blank lines skipped.
Result<std::vector<std::string>> read_modules_file(const fs::path& path);

// Starter zenv.json with one environment targeting every machine.
std::string config_template(const std::string& env_name,
                            const std::string& description,
                            const std::string& requirements_file);

// Write config_template() to <dir>/zenv.json. The requirements file is
// requirements.txt, else pyproject.toml, whichever exists in `dir`. An
// existing zenv.json is never overwritten (IoError).
Result<fs::path> write_config_template(const fs::path& dir,
                                       const std::string& env_name,
                                       const std::string& description);

// Helper to check if a project config exists
bool project_config_exists(const fs::path& dir = fs::current_path());

fs::path get_project_config_path(const fs::path& dir = fs::current_path());
