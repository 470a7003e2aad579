#pragma once

#include "base_cli.hpp"

// Forward declarations for command registration
void register_environment_commands(BaseCLI& cli);
void register_registry_commands(BaseCLI& cli);

class ZenvCLI : public BaseCLI {
public:
    ZenvCLI();

    // Dispatch argv[1]; returns the process exit status.
    int run(int argc, char** argv);

    void print_usage() const;

private:
    void register_all_commands();
};
