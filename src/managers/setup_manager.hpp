#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include <environments/module_system.hpp>
#include <environments/python_toolchain.hpp>

namespace fs = std::filesystem;

struct SetupFlags {
    bool force = false;     // remove an existing venv and build it again
};

// Builds one environment: modules, venv, dependencies, setup commands and
// activate.sh. Registration is left to the caller. Every status line of a
// run is written to <venv>/zenv_setup.log when it ends, failed or not.
class SetupManager {
public:
    SetupManager(ModuleSystem& modules, PythonToolchain& python);

    // Returns the absolute venv path on success.
    Result<std::string> setup(const EffectiveConfig& eff,
                              const fs::path& project_dir,
                              const SetupFlags& flags,
                              StatusCallback cb = nullptr);

    // Config dependencies followed by those of the requirements file (a
    // pyproject.toml or requirements.txt, when present), deduplicated.
    static Result<std::vector<std::string>> collect_dependencies(const EffectiveConfig& eff,
                                                                 const fs::path& project_dir);

    static fs::path setup_log_path(const fs::path& venv);

    // Contents of the last setup log; IoError if there is none.
    static Result<std::string> read_setup_log(const fs::path& venv);

private:
    ModuleSystem& modules_;
    PythonToolchain& python_;
};
