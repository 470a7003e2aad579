#include "zenv_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <iostream>

ZenvCLI::ZenvCLI() : BaseCLI() {
    register_all_commands();
}

void ZenvCLI::register_all_commands() {
    register_environment_commands(*this);
    register_registry_commands(*this);

    add_command("version", [](BaseCLI&, const CommandArgs&) {
        std::cout << theme::color::AMBER << theme::color::BOLD << "zenv"
                  << theme::color::RESET << theme::color::DIM
                  << " version " << ZENV_VERSION << theme::color::RESET << "\n";
        return Result<void>::Ok();
    }, "version", "Show version");

    add_command("help", [this](BaseCLI&, const CommandArgs&) {
        this->print_usage();
        return Result<void>::Ok();
    }, "help", "Show this help");
}

void ZenvCLI::print_usage() const {
    std::cout << theme::banner(ZENV_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::TEAL << "    zenv " << theme::color::RESET
              << theme::color::AMBER << "<command> [args] [options]" << theme::color::RESET << "\n";
    print_help();
}

int ZenvCLI::run(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string cmd = argv[1];
    if (cmd == "--version" || cmd == "-v") cmd = "version";
    if (cmd == "--help" || cmd == "-h") cmd = "help";

    // `zenv run <id> <command> ...` hands the command's own options through
    auto args = parse_args(argc, argv, 2, cmd == "run" ? 1 : -1);
    if (args.is_err()) return report_failure(args.code, args.error);

    return execute_command(cmd, args.value);
}
