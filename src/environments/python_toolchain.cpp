#include "python_toolchain.hpp"
#include "module_system.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

ShellPythonToolchain::ShellPythonToolchain(std::vector<std::string> modules)
    : modules_(std::move(modules)), run_(platform::run_passthrough) {}

ShellPythonToolchain::ShellPythonToolchain(std::vector<std::string> modules, Runner runner)
    : modules_(std::move(modules)), run_(std::move(runner)) {}

Result<void> ShellPythonToolchain::exec(const std::string& what, const std::string& script) {
    std::string full = module_load_chain(modules_) + script;
    zenv_log("exec: " + full);

    int rc = run_(login_shell_command(full));
    if (rc != 0) {
        return Result<void>::Err(ErrorCode::ProcessError,
            fmt::format("{} failed (exit {}): {}", what, rc, script));
    }
    return Result<void>::Ok();
}

Result<void> ShellPythonToolchain::create_venv(const std::string& python,
                                               const fs::path& venv_dir) {
    return exec("Creating virtual environment",
                fmt::format("{} -m venv {}", shell_quote(python), shell_quote(venv_dir.string())));
}

Result<void> ShellPythonToolchain::install(const fs::path& venv_dir,
                                           const std::vector<std::string>& packages) {
    if (packages.empty()) return Result<void>::Ok();

    std::string pip = shell_quote((venv_dir / "bin" / "python").string()) + " -m pip";
    auto upgraded = exec("Upgrading pip", pip + " install --upgrade pip");
    if (upgraded.is_err()) return upgraded;

    std::string args;
    for (const auto& p : packages) args += " " + shell_quote(p);
    return exec("Installing dependencies", pip + " install" + args);
}

Result<void> ShellPythonToolchain::run(const fs::path& venv_dir, const std::string& command) {
    std::string activate = ". " + shell_quote((venv_dir / "bin" / "activate").string());
    return exec("Setup command", activate + " && " + command);
}
