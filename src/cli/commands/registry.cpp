#include "env_helpers.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <core/host_match.hpp>
#include <core/hostname.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <environments/activation_script.hpp>
#include <managers/resolver.hpp>
#include <managers/setup_manager.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <iostream>

// Resolve an identifier against the loaded registry
static Result<RegistryEntry> find_entry(BaseCLI& cli, const std::string& identifier) {
    auto registry = cli.require_registry();
    if (registry.is_err()) return Result<RegistryEntry>::Err(registry);

    auto found = resolve(*registry.value, identifier, cli.cwd);
    if (found.is_err()) return Result<RegistryEntry>::Err(found);
    return Result<RegistryEntry>::Ok(*found.value);
}

static Result<RegistryEntry> remove_entry(BaseCLI& cli, const std::string& identifier) {
    auto registry = cli.require_registry();
    if (registry.is_err()) return Result<RegistryEntry>::Err(registry);

    auto removed = registry.value->deregister(identifier, cli.cwd);
    if (removed.is_err()) return removed;

    auto saved = registry.value->save();
    if (saved.is_err()) return Result<RegistryEntry>::Err(saved);
    return removed;
}

static Result<void> do_deregister(BaseCLI& cli, const CommandArgs& args) {
    auto id = single_positional(args, "zenv deregister <name|id>");
    if (id.is_err()) return Result<void>::Err(id);

    auto removed = remove_entry(cli, id.value);
    if (removed.is_err()) return Result<void>::Err(removed);

    std::cout << theme::ok(fmt::format("Deregistered '{}' ({})", removed.value.env_name,
                                       removed.value.short_id()));
    std::cout << theme::step("The virtual environment was left in place: " + removed.value.venv_path);
    return Result<void>::Ok();
}

// Only directories that look like a venv zenv built are deleted
static bool looks_like_venv(const fs::path& dir) {
    return fs::exists(dir / "pyvenv.cfg") || fs::exists(dir / ACTIVATE_SCRIPT_NAME) ||
           fs::exists(dir / SETUP_LOG_NAME);
}

static Result<void> do_rm(BaseCLI& cli, const CommandArgs& args) {
    auto id = single_positional(args, "zenv rm <name|id>");
    if (id.is_err()) return Result<void>::Err(id);

    auto removed = remove_entry(cli, id.value);
    if (removed.is_err()) return Result<void>::Err(removed);
    const auto& e = removed.value;

    std::cout << theme::ok(fmt::format("Deregistered '{}' ({})", e.env_name, e.short_id()));

    fs::path venv = e.venv_path;
    if (!fs::exists(venv)) {
        std::cout << theme::info(venv.string() + " does not exist");
        return Result<void>::Ok();
    }
    if (!looks_like_venv(venv)) {
        std::cout << theme::info(venv.string() + " does not look like a virtual environment; left in place");
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::remove_all(venv, ec);
    if (ec) {
        return Result<void>::Err(ErrorCode::IoError,
            fmt::format("Cannot remove {}: {}", venv.string(), ec.message()));
    }
    std::cout << theme::ok("Removed " + venv.string());
    return Result<void>::Ok();
}

static Result<void> do_list(BaseCLI& cli, const CommandArgs& args) {
    if (!args.positional.empty()) {
        return Result<void>::Err(ErrorCode::ArgsError, "Usage: zenv list [--all]");
    }

    auto registry = cli.require_registry();
    if (registry.is_err()) return Result<void>::Err(registry);

    std::string host;
    if (!args.all) {
        auto h = current_hostname();
        if (h.is_ok()) {
            host = h.value;
        } else {
            std::cout << theme::info("Hostname unknown; listing every environment");
        }
    }

    const auto& entries = registry.value->entries();
    size_t shown = 0;
    std::cout << theme::section(host.empty() ? "Environments"
                                             : fmt::format("Environments for {}", host));
    for (const auto& e : entries) {
        if (!host.empty() && !host_matches_any(host, e.targets())) continue;
        print_entry(e);
        shown++;
    }

    if (shown == 0) {
        std::cout << theme::info(entries.empty() ? "No environments registered"
                                                 : "No environments for this machine");
    }
    if (shown < entries.size()) {
        std::cout << "\n" << theme::dim(fmt::format("    {} more on other machines (zenv list --all)",
                                                    entries.size() - shown)) << "\n";
    }
    return Result<void>::Ok();
}

static Result<void> do_activate(BaseCLI& cli, const CommandArgs& args) {
    // Without an identifier, the environment zenv.json targets at this machine
    auto id = environment_name(cli, args, "zenv activate [name|id]");
    if (id.is_err()) return Result<void>::Err(id);

    auto e = find_entry(cli, id.value);
    if (e.is_err()) return Result<void>::Err(e);

    fs::path script = fs::path(e.value.venv_path) / ACTIVATE_SCRIPT_NAME;
    if (!fs::exists(script)) {
        zenv_log("activate: " + script.string() + " missing");
    }
    std::cout << script.string() << "\n";
    return Result<void>::Ok();
}

static Result<void> do_cd(BaseCLI& cli, const CommandArgs& args) {
    auto id = single_positional(args, "zenv cd <name|id>");
    if (id.is_err()) return Result<void>::Err(id);

    auto e = find_entry(cli, id.value);
    if (e.is_err()) return Result<void>::Err(e);

    std::cout << e.value.project_dir << "\n";
    return Result<void>::Ok();
}

static Result<void> do_run(BaseCLI& cli, const CommandArgs& args) {
    if (args.positional.size() < 2) {
        return Result<void>::Err(ErrorCode::ArgsError,
            "Usage: zenv run <name|id> <command> [args...]");
    }

    auto e = find_entry(cli, args.positional[0]);
    if (e.is_err()) return Result<void>::Err(e);

    fs::path activate = fs::path(e.value.venv_path) / ACTIVATE_SCRIPT_NAME;
    if (!fs::exists(activate)) {
        return Result<void>::Err(ErrorCode::IoError,
            fmt::format("{} is missing; run 'zenv setup {}' first", activate.string(),
                        e.value.env_name));
    }

    std::vector<std::string> rest(args.positional.begin() + 2, args.positional.end());
    std::string script = run_script(e.value.venv_path, args.positional[1], rest);
    zenv_log(fmt::format("run: '{}' in {}", args.positional[1], e.value.venv_path));

    int status = platform::run_passthrough("bash -c " + shell_quote(script));
    if (status != 0) {
        return Result<void>::Err(ErrorCode::ProcessError,
            fmt::format("Command exited with status {}", status));
    }
    return Result<void>::Ok();
}

static Result<void> do_log(BaseCLI& cli, const CommandArgs& args) {
    auto id = single_positional(args, "zenv log <name|id>");
    if (id.is_err()) return Result<void>::Err(id);

    auto e = find_entry(cli, id.value);
    if (e.is_err()) return Result<void>::Err(e);

    auto text = SetupManager::read_setup_log(e.value.venv_path);
    if (text.is_err()) return Result<void>::Err(text);
    std::cout << text.value;
    return Result<void>::Ok();
}

void register_registry_commands(BaseCLI& cli) {
    cli.add_command("list", do_list, "list [--all]",
                    "Registered environments for this machine");
    cli.add_command("activate", do_activate, "activate [name|id]",
                    "Print the path of the activation script");
    cli.add_command("cd", do_cd, "cd <name|id>",
                    "Print the project directory");
    cli.add_command("deregister", do_deregister, "deregister <name|id>",
                    "Remove an environment from the registry");
    cli.add_command("rm", do_rm, "rm <name|id>",
                    "Deregister and delete the virtual environment");
    cli.add_command("run", do_run, "run <id> <cmd> [args]",
                    "Run a command inside an environment");
    cli.add_command("log", do_log, "log <name|id>",
                    "Show the log of the last setup");
}
