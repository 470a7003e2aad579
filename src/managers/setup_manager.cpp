#include "setup_manager.hpp"
#include "registry_store.hpp"
#include <core/constants.hpp>
#include <core/dependencies.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <environments/activation_script.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace {

// Status lines of one setup run, flushed to the venv when the run ends
class SetupLog {
public:
    explicit SetupLog(fs::path venv) : venv_(std::move(venv)) {}
    ~SetupLog() { flush(); }

    SetupLog(const SetupLog&) = delete;
    SetupLog& operator=(const SetupLog&) = delete;

    void add(const std::string& line) { lines_.push_back(line); }

private:
    void flush() {
        std::error_code ec;
        fs::create_directories(venv_, ec);
        if (ec) {
            zenv_log(fmt::format("setup: cannot create {} for the setup log: {}",
                                 venv_.string(), ec.message()));
            return;
        }
        fs::path path = SetupManager::setup_log_path(venv_);
        std::ofstream out(path, std::ios::trunc);
        for (const auto& line : lines_) out << line << "\n";
        if (!out) zenv_log("setup: failed writing " + path.string());
    }

    fs::path venv_;
    std::vector<std::string> lines_;
};

}

SetupManager::SetupManager(ModuleSystem& modules, PythonToolchain& python)
    : modules_(modules), python_(python) {}

Result<std::vector<std::string>> SetupManager::collect_dependencies(const EffectiveConfig& eff,
                                                                    const fs::path& project_dir) {
    std::vector<std::string> raw = eff.dependencies;

    if (!eff.requirements_file.empty()) {
        fs::path req = eff.requirements_file;
        if (req.is_relative()) req = project_dir / req;

        if (fs::exists(req)) {
            std::ifstream in(req);
            if (!in) {
                return Result<std::vector<std::string>>::Err(ErrorCode::IoError,
                    "Cannot read " + req.string());
            }
            std::stringstream buf;
            buf << in.rdbuf();

            std::vector<std::string> from_file;
            if (ends_with(req.filename().string(), ".toml")) {
                auto parsed = parse_pyproject_dependencies(buf.str(), req.string());
                if (parsed.is_err()) return Result<std::vector<std::string>>::Err(parsed);
                from_file = std::move(parsed.value);
            } else {
                from_file = parse_requirements(buf.str());
            }
            zenv_log(fmt::format("setup: {} dependencies from {}", from_file.size(), req.string()));
            raw.insert(raw.end(), from_file.begin(), from_file.end());
        } else {
            zenv_log("setup: requirements file " + req.string() + " not found, skipping");
        }
    }

    return Result<std::vector<std::string>>::Ok(validate_dependencies(raw));
}

Result<std::string> SetupManager::setup(const EffectiveConfig& eff,
                                        const fs::path& project_dir,
                                        const SetupFlags& flags,
                                        StatusCallback cb) {
    fs::path venv = venv_path_for(project_dir.string(), eff.base_dir, eff.name);
    fs::path base = venv.parent_path();

    SetupLog log(venv);
    auto status = [&](const std::string& msg) {
        zenv_log("setup: " + msg);
        log.add(msg);
        if (cb) cb(msg);
    };
    status(fmt::format("Setting up '{}' in {} (targets: {})", eff.name, project_dir.string(),
                       eff.target_machines.empty() ? ANY_TARGET : join(eff.target_machines, ",")));

    for (const auto& m : eff.modules) {
        status("Loading module " + m);
        auto loaded = modules_.load(m);
        if (loaded.is_err()) return Result<std::string>::Err(loaded);
    }

    std::error_code ec;
    if (flags.force && fs::exists(venv)) {
        status("Removing existing environment " + venv.string());
        fs::remove_all(venv, ec);
        if (ec) {
            return Result<std::string>::Err(ErrorCode::IoError,
                fmt::format("Cannot remove {}: {}", venv.string(), ec.message()));
        }
    }

    fs::create_directories(base, ec);
    if (ec) {
        return Result<std::string>::Err(ErrorCode::IoError,
            fmt::format("Cannot create {}: {}", base.string(), ec.message()));
    }

    if (fs::exists(venv / "bin" / "activate")) {
        status("Reusing virtual environment " + venv.string());
    } else {
        status(fmt::format("Creating virtual environment with {}", eff.python_executable));
        auto created = python_.create_venv(eff.python_executable, venv);
        if (created.is_err()) return Result<std::string>::Err(created);
    }

    auto deps = collect_dependencies(eff, project_dir);
    if (deps.is_err()) return Result<std::string>::Err(deps);

    if (deps.value.empty()) {
        status("No dependencies to install");
    } else {
        status(fmt::format("Installing {} dependencies", deps.value.size()));
        auto installed = python_.install(venv, deps.value);
        if (installed.is_err()) return Result<std::string>::Err(installed);
    }

    for (const auto& cmd : eff.setup_commands) {
        status("Running " + cmd);
        auto ran = python_.run(venv, cmd);
        if (ran.is_err()) return Result<std::string>::Err(ran);
    }

    auto script = write_activation_script(eff, venv.string());
    if (script.is_err()) return Result<std::string>::Err(script);
    status("Wrote " + script.value.string());

    return Result<std::string>::Ok(venv.string());
}

fs::path SetupManager::setup_log_path(const fs::path& venv) {
    return venv / SETUP_LOG_NAME;
}

Result<std::string> SetupManager::read_setup_log(const fs::path& venv) {
    fs::path path = setup_log_path(venv);
    if (!fs::exists(path)) {
        return Result<std::string>::Err(ErrorCode::IoError,
            "No setup log at " + path.string());
    }
    std::ifstream in(path);
    if (!in) {
        return Result<std::string>::Err(ErrorCode::IoError, "Cannot read " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();
    return Result<std::string>::Ok(buf.str());
}
