#include "activation_script.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>

std::string activation_script(const EffectiveConfig& eff, const std::string& venv_path) {
    std::string s;
    s += "#!/bin/bash\n";
    s += fmt::format("# zenv environment '{}'. Use: source {}/{}\n\n",
                     eff.name, venv_path, ACTIVATE_SCRIPT_NAME);

    if (!eff.modules.empty()) {
        s += fmt::format("echo 'Loading modules: {}'\n", join(eff.modules, ", "));
        for (const auto& m : eff.modules) {
            s += fmt::format("module load {} || {{ echo 'zenv: failed to load module {}' >&2; return 1; }}\n",
                             shell_quote(m), m);
        }
        s += "\n";
    }

    s += fmt::format(". {}\n", shell_quote(venv_path + "/bin/activate"));
    s += fmt::format("export ZENV_ENV_DIR={}\n", shell_quote(venv_path));
    s += fmt::format("export ZENV_ENV_NAME={}\n", shell_quote(eff.name));

    // std::map iterates in key order
    for (const auto& [key, value] : eff.custom_activate_vars) {
        s += fmt::format("export {}={}\n", key, shell_quote(value));
    }

    s += "\nzenv_deactivate() {\n";
    for (const auto& var : eff.custom_activate_vars) {
        s += fmt::format("    unset {}\n", var.first);
    }
    s += "    unset ZENV_ENV_DIR ZENV_ENV_NAME\n";
    s += "    deactivate\n";
    s += "    unset -f zenv_deactivate\n";
    s += "}\n";
    return s;
}

Result<fs::path> write_activation_script(const EffectiveConfig& eff, const std::string& venv_path) {
    fs::path path = fs::path(venv_path) / ACTIVATE_SCRIPT_NAME;
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Result<fs::path>::Err(ErrorCode::IoError, "Cannot write " + path.string());
    }
    out << activation_script(eff, venv_path);
    if (!out) {
        return Result<fs::path>::Err(ErrorCode::IoError, "Failed writing " + path.string());
    }
    out.close();

    std::error_code ec;
    fs::permissions(path, fs::perms::owner_exec | fs::perms::group_exec,
                    fs::perm_options::add, ec);
    if (ec) zenv_log("activate.sh: chmod failed: " + ec.message());

    zenv_log("wrote " + path.string());
    return Result<fs::path>::Ok(path);
}

std::string run_script(const std::string& venv_path,
                       const std::string& command,
                       const std::vector<std::string>& args) {
    std::string s = "set -e\n";
    s += fmt::format(". {}\n", shell_quote(venv_path + "/" + ACTIVATE_SCRIPT_NAME));
    s += command;
    for (const auto& arg : args) s += " " + shell_quote(arg);
    s += "\n";
    return s;
}
