#include "module_system.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <sstream>

std::string module_load_chain(const std::vector<std::string>& modules) {
    std::string chain;
    for (const auto& m : modules) {
        chain += "module load " + shell_quote(m) + " && ";
    }
    return chain;
}

std::string login_shell_command(const std::string& script) {
    return "bash -lc " + shell_quote(script);
}

ShellModuleSystem::ShellModuleSystem() : run_(platform::run_capture) {}

ShellModuleSystem::ShellModuleSystem(Runner runner) : run_(std::move(runner)) {}

// Lmod and Tcl modules both report failures on stderr, sometimes with exit 0
static bool output_reports_error(const std::string& output) {
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (to_lower(line).find("error") != std::string::npos) return true;
    }
    return false;
}

Result<void> ShellModuleSystem::load(const std::string& name) {
    zenv_log("module load " + name);
    auto result = run_(login_shell_command("module load " + shell_quote(name)));

    if (result.failed() || output_reports_error(result.get_output())) {
        std::string detail = trimmed(result.get_output());
        zenv_log(fmt::format("module load {} failed (exit {}): {}", name,
                             result.exit_code, detail));
        std::string msg = fmt::format("Failed to load module '{}'", name);
        if (!detail.empty()) msg += ": " + detail;
        return Result<void>::Err(ErrorCode::ModuleLoadError, msg);
    }
    return Result<void>::Ok();
}
