#include "env_helpers.hpp"
#include "../theme.hpp"
#include <core/host_match.hpp>
#include <core/hostname.hpp>
#include <core/log.hpp>
#include <core/validator.hpp>
#include <fmt/format.h>
#include <iostream>

Result<std::string> single_positional(const CommandArgs& args, const std::string& usage) {
    if (args.positional.size() != 1) {
        return Result<std::string>::Err(ErrorCode::ArgsError, "Usage: " + usage);
    }
    return Result<std::string>::Ok(args.positional.front());
}

Result<std::string> environment_name(BaseCLI& cli, const CommandArgs& args,
                                     const std::string& usage) {
    if (args.positional.size() > 1) {
        return Result<std::string>::Err(ErrorCode::ArgsError, "Usage: " + usage);
    }
    if (args.positional.size() == 1) return Result<std::string>::Ok(args.positional.front());

    auto config = cli.require_config();
    if (config.is_err()) return Result<std::string>::Err(config);

    auto host = current_hostname();
    if (host.is_err()) return Result<std::string>::Err(host);

    auto name = config.value->detect_environment(host.value);
    if (name.is_err()) return name;

    // stderr keeps `zenv activate` output usable in $(...)
    std::cerr << theme::info(fmt::format("Using '{}', the environment for {}",
                                         name.value, host.value));
    return name;
}

Result<std::string> fallback_cluster(const CommandArgs& args) {
    auto host = current_hostname();
    if (host.is_err()) {
        if (args.no_host) {
            zenv_log("no hostname available; environments without targets match any host");
            return Result<std::string>::Ok("");
        }
        return Result<std::string>::Err(host);
    }
    return Result<std::string>::Ok(cluster_from_hostname(host.value));
}

Result<EffectiveConfig> prepare_environment(BaseCLI& cli, const std::string& name,
                                            const CommandArgs& args) {
    auto config = cli.require_config();
    if (config.is_err()) return Result<EffectiveConfig>::Err(config);

    auto cluster = fallback_cluster(args);
    if (cluster.is_err()) return Result<EffectiveConfig>::Err(cluster);

    auto eff = config.value->effective(name, cluster.value);
    if (eff.is_err()) return eff;

    auto valid = validate_environment(eff.value);
    if (valid.is_err()) return Result<EffectiveConfig>::Err(valid);

    auto machine = check_machine(eff.value, HostCheckPolicy{args.no_host});
    if (machine.is_err()) return Result<EffectiveConfig>::Err(machine);
    if (args.no_host) {
        std::cout << theme::info("Skipping target machine check (--no-host)");
    }
    return eff;
}

void print_entry(const RegistryEntry& e) {
    std::cout << "    " << theme::amber(e.short_id()) << "  " << theme::bold(e.env_name)
              << "  " << theme::dim(e.project_dir) << "\n";
    std::cout << "             " << theme::dim("targets: " + e.target_machines);
    if (e.description) std::cout << theme::dim("  " + *e.description);
    std::cout << "\n";
}
