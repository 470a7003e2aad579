#include "env_helpers.hpp"
#include "../preflight.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <environments/module_system.hpp>
#include <environments/python_toolchain.hpp>
#include <managers/setup_manager.hpp>
#include <fmt/format.h>
#include <iostream>

// Record the environment for this project and write the registry.
static Result<RegistryEntry> register_effective(BaseCLI& cli, const EffectiveConfig& eff) {
    auto registry = cli.require_registry();
    if (registry.is_err()) return Result<RegistryEntry>::Err(registry);

    auto entry = registry.value->register_env(eff.name, cli.cwd, eff.base_dir,
                                              eff.description, eff.target_machines);
    auto saved = registry.value->save();
    if (saved.is_err()) return Result<RegistryEntry>::Err(saved);
    return Result<RegistryEntry>::Ok(entry);
}

static void print_registered(const RegistryEntry& e) {
    std::cout << theme::ok(fmt::format("Registered '{}'", e.env_name));
    std::cout << theme::kv("ID", e.id);
    std::cout << theme::kv("venv", e.venv_path);
    std::cout << theme::kv("targets", e.target_machines);
    std::cout << theme::step(fmt::format("Activate with: source $(zenv activate {})", e.short_id()));
}

static Result<void> do_setup(BaseCLI& cli, const CommandArgs& args) {
    auto name = environment_name(cli, args, "zenv setup [env] [--no-host] [--force]");
    if (name.is_err()) return Result<void>::Err(name);

    auto eff = prepare_environment(cli, name.value, args);
    if (eff.is_err()) return Result<void>::Err(eff);

    std::cout << theme::section(fmt::format("Setting up '{}'", eff.value.name));

    ShellModuleSystem modules;
    ShellPythonToolchain python(eff.value.modules);
    SetupManager setup(modules, python);

    auto venv = setup.setup(eff.value, cli.cwd, SetupFlags{args.force},
                            [](const std::string& msg) { std::cout << theme::step(msg); });
    if (venv.is_err()) return Result<void>::Err(venv);

    auto entry = register_effective(cli, eff.value);
    if (entry.is_err()) return Result<void>::Err(entry);

    print_registered(entry.value);
    return Result<void>::Ok();
}

static Result<void> do_register(BaseCLI& cli, const CommandArgs& args) {
    auto name = single_positional(args, "zenv register <env> [--no-host]");
    if (name.is_err()) return Result<void>::Err(name);

    auto eff = prepare_environment(cli, name.value, args);
    if (eff.is_err()) return Result<void>::Err(eff);

    auto entry = register_effective(cli, eff.value);
    if (entry.is_err()) return Result<void>::Err(entry);

    print_registered(entry.value);
    if (!fs::exists(entry.value.venv_path)) {
        std::cout << theme::info(fmt::format("{} does not exist yet; run 'zenv setup {}'",
                                             entry.value.venv_path, entry.value.env_name));
    }
    return Result<void>::Ok();
}

static Result<void> do_init(BaseCLI& cli, const CommandArgs& args) {
    if (args.positional.size() > 2) {
        return Result<void>::Err(ErrorCode::ArgsError, "Usage: zenv init [env] [description]");
    }
    std::string name = args.positional.size() > 0 ? args.positional[0] : "test";
    std::string description = args.positional.size() > 1 ? args.positional[1]
                                                         : "Env config created by zenv";

    auto written = write_config_template(cli.cwd, name, description);
    if (written.is_err()) return Result<void>::Err(written);

    std::cout << theme::ok("Created " + written.value.string());
    std::cout << theme::step(fmt::format("Edit it, then run: zenv setup {}", name));
    return Result<void>::Ok();
}

static Result<void> do_validate(BaseCLI& cli, const CommandArgs& args) {
    if (!args.positional.empty()) {
        return Result<void>::Err(ErrorCode::ArgsError, "Usage: zenv validate");
    }

    auto config = cli.require_config();
    if (config.is_err()) return Result<void>::Err(config);

    auto cluster = fallback_cluster(args);
    if (cluster.is_err()) return Result<void>::Err(cluster);

    auto issues = check_project_config(*config.value, cluster.value);

    std::cout << theme::section(CONFIG_FILENAME);
    const PreflightIssue* first_error = nullptr;
    for (const auto& env : config.value->environments()) {
        bool failed = false;
        for (const auto& issue : issues) {
            if (issue.environment == env.name && !issue.is_hint) failed = true;
        }
        std::cout << (failed ? theme::fail(env.name) : theme::ok(env.name));
    }
    for (const auto& issue : issues) {
        std::string where = issue.environment.empty() ? "" : issue.environment + ": ";
        if (issue.is_hint) {
            std::cout << theme::info(where + issue.message);
        } else {
            std::cout << theme::fail(where + issue.message);
            if (!first_error) first_error = &issue;
        }
        if (!issue.fix.empty()) std::cout << theme::step(issue.fix);
    }

    if (first_error) {
        return Result<void>::Err(first_error->code,
            fmt::format("{} is not valid", CONFIG_FILENAME));
    }
    std::cout << "\n" << theme::ok(fmt::format("{} environments valid",
                                               config.value->environments().size()));
    return Result<void>::Ok();
}

void register_environment_commands(BaseCLI& cli) {
    cli.add_command("init", do_init, "init [env] [desc]",
                    "Write a starter zenv.json in the current directory");
    cli.add_command("setup", do_setup, "setup [env]",
                    "Create the environment, install dependencies and register it");
    cli.add_command("register", do_register, "register <env>",
                    "Register an environment without building it");
    cli.add_command("validate", do_validate, "validate",
                    "Check zenv.json in the current directory");
}
