#include <iostream>
#include <string>
#include "cli/zenv_cli.hpp"
#include "cli/theme.hpp"
#include <core/log.hpp>

int main(int argc, char** argv) {
    try {
        ZenvCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        zenv_log(std::string("fatal: ") + e.what());
        return report_failure(ErrorCode::Internal, std::string(e.what()));
    }
}
