#include "base_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <iostream>
#include <fmt/format.h>

Result<CommandArgs> parse_args(int argc, char** argv, int start, int passthrough_after) {
    CommandArgs args;
    bool options_done = false;
    for (int i = start; i < argc; i++) {
        std::string arg = argv[i];
        if (!options_done && passthrough_after >= 0 &&
            static_cast<int>(args.positional.size()) > passthrough_after) {
            options_done = true;
        }
        if (options_done) {
            args.positional.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg == "--no-host") {
            args.no_host = true;
        } else if (arg == "--all") {
            args.all = true;
        } else if (arg == "--force") {
            args.force = true;
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            return Result<CommandArgs>::Err(ErrorCode::ArgsError, "Unknown option: " + arg);
        } else {
            args.positional.push_back(arg);
        }
    }
    return Result<CommandArgs>::Ok(args);
}

BaseCLI::BaseCLI() : cwd(platform::current_dir().string()) {}

void BaseCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& usage,
                          const std::string& help) {
    if (!commands_.count(name)) order_.push_back(name);
    commands_[name] = {std::move(handler), usage, help};
}

Result<ZenvConfig*> BaseCLI::require_config() {
    if (!config) {
        auto loaded = ZenvConfig::load(cwd);
        if (loaded.is_err()) return Result<ZenvConfig*>::Err(loaded);
        config = std::move(loaded.value);
    }
    return Result<ZenvConfig*>::Ok(&*config);
}

Result<EnvironmentRegistry*> BaseCLI::require_registry() {
    if (!registry) {
        auto loaded = EnvironmentRegistry::load(get_registry_path());
        if (loaded.is_err()) return Result<EnvironmentRegistry*>::Err(loaded);
        registry = std::move(loaded.value);
    }
    return Result<EnvironmentRegistry*>::Ok(&*registry);
}

int report_failure(ErrorCode code, const std::string& error,
                   const std::vector<std::string>& candidates) {
    std::cerr << theme::fail(error);
    if (code == ErrorCode::Ambiguous) {
        for (const auto& c : candidates) std::cerr << theme::step(c);
    }
    std::string hint = error_hint(code);
    if (!hint.empty()) std::cerr << theme::step(hint);

    if (!is_expected_failure(code)) {
        zenv_log(fmt::format("{}: {}", error_name(code), error));
    }
    return exit_status(code);
}

int BaseCLI::execute_command(const std::string& command, const CommandArgs& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        return report_failure(ErrorCode::ArgsError, "Unknown command: " + command);
    }

    zenv_log(fmt::format("command: {} ({} args) in {}", command, args.positional.size(), cwd));
    try {
        auto result = it->second.handler(*this, args);
        if (result.is_err()) {
            return report_failure(result.code, result.error, result.candidates);
        }
    } catch (const std::exception& e) {
        zenv_log(fmt::format("unhandled exception in '{}': {}", command, e.what()));
        return report_failure(ErrorCode::Internal, std::string(e.what()));
    }
    return 0;
}

void BaseCLI::print_help() const {
    std::cout << theme::section("Commands");
    for (const auto& name : order_) {
        const auto& cmd = commands_.at(name);
        std::cout << "    " << theme::color::TEAL << fmt::format("{:<22}", cmd.usage)
                  << theme::color::RESET << theme::dim(cmd.help) << "\n";
    }
    std::cout << theme::section("Options");
    std::cout << "    " << theme::color::TEAL << fmt::format("{:<22}", "--no-host")
              << theme::color::RESET << theme::dim("Skip the target machine check") << "\n";
    std::cout << "    " << theme::color::TEAL << fmt::format("{:<22}", "--all")
              << theme::color::RESET << theme::dim("List environments for every machine") << "\n";
    std::cout << "    " << theme::color::TEAL << fmt::format("{:<22}", "--force")
              << theme::color::RESET << theme::dim("Rebuild an existing virtual environment") << "\n";
    std::cout << "\n";
}
