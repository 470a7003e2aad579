#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Text of <venv>/activate.sh: module loads, venv activation, custom exports
// (sorted by name) and a zenv_deactivate helper.
std::string activation_script(const EffectiveConfig& eff, const std::string& venv_path);

Result<fs::path> write_activation_script(const EffectiveConfig& eff, const std::string& venv_path);

// Shell script for `zenv run`: sources <venv>/activate.sh, then runs
// `command` as written followed by the quoted `args`.
std::string run_script(const std::string& venv_path,
                       const std::string& command,
                       const std::vector<std::string>& args);
