#pragma once

#include <string>
#include <vector>
#include <functional>
#include <core/types.hpp>

// HPC environment-modules front end ("module load ...").
class ModuleSystem {
public:
    virtual ~ModuleSystem() = default;

    // Load one module. Fails with ModuleLoadError naming the module.
    virtual Result<void> load(const std::string& name) = 0;
};

// Runs `module load` in a bash login shell so the site's module function
// is defined. Each load is checked on its own.
class ShellModuleSystem : public ModuleSystem {
public:
    using Runner = std::function<ProcessResult(const std::string&)>;

    ShellModuleSystem();
    explicit ShellModuleSystem(Runner runner);

    Result<void> load(const std::string& name) override;

private:
    Runner run_;
};

// "module load a && module load b && " (empty for no modules). Prefixed to
// commands that must see the loaded modules.
std::string module_load_chain(const std::vector<std::string>& modules);

// Wrap a script for a bash login shell.
std::string login_shell_command(const std::string& script);
