#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <core/types.hpp>
#include <managers/registry_store.hpp>

// Positional arguments plus the global flags
struct CommandArgs {
    std::vector<std::string> positional;
    bool no_host = false;   // --no-host
    bool all = false;       // --all
    bool force = false;     // --force
};

// Parse argv[start..]. Unknown "--" flags are an ArgsError. "--" ends option
// parsing, as does collecting `passthrough_after` positionals (when >= 0):
// everything after that is positional as written.
Result<CommandArgs> parse_args(int argc, char** argv, int start, int passthrough_after = -1);

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<Result<void>(BaseCLI&, const CommandArgs&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& usage,
                     const std::string& help);

    // zenv.json of the current directory, loaded on first use
    Result<ZenvConfig*> require_config();

    // The global registry, loaded once per invocation
    Result<EnvironmentRegistry*> require_registry();

    // Run a command, report any failure, return the process exit status.
    int execute_command(const std::string& command, const CommandArgs& args);

    void print_help() const;

    // Public state
    std::string cwd;
    std::optional<ZenvConfig> config;
    std::optional<EnvironmentRegistry> registry;

protected:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;
    std::vector<std::string> order_;   // registration order for help
};

// Print a failed Result (message, candidates, hint) to stderr and return the
// exit status for its error code.
int report_failure(ErrorCode code, const std::string& error,
                   const std::vector<std::string>& candidates = {});
