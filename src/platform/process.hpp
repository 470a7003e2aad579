#pragma once

#include <string>
#include <core/types.hpp>

namespace platform {

// Run a shell command and capture its combined stdout/stderr.
// exit_code is the command's exit status, or -1 if it could not be started.
ProcessResult run_capture(const std::string& command);

// Run a shell command with the terminal attached (output streams live).
// Returns the exit status, or -1 if the shell could not be started.
int run_passthrough(const std::string& command);

} // namespace platform
