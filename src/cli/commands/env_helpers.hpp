#pragma once

#include "../base_cli.hpp"
#include <core/types.hpp>
#include <string>

// Shared helpers used by environments.cpp and registry.cpp

// Exactly one positional argument, else ArgsError with the usage line.
Result<std::string> single_positional(const CommandArgs& args, const std::string& usage);

// Environment named on the command line, or, with no positional, the one
// zenv.json targets at this machine (ZenvConfig::detect_environment).
Result<std::string> environment_name(BaseCLI& cli, const CommandArgs& args,
                                     const std::string& usage);

// Cluster label for environments without target_machines. With --no-host a
// missing hostname is tolerated and gives "".
Result<std::string> fallback_cluster(const CommandArgs& args);

// Load zenv.json, merge and validate the named environment, then check that
// this machine is one of its targets.
Result<EffectiveConfig> prepare_environment(BaseCLI& cli, const std::string& name,
                                            const CommandArgs& args);

void print_entry(const RegistryEntry& e);
