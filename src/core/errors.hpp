#pragma once

#include <string>

// Error kinds surfaced to the command dispatcher. Each maps to its own
// process exit status (see exit_status()).
enum class ErrorCode {
    None = 0,

    // Configuration
    ConfigNotFound,
    ConfigReadError,
    JsonInvalid,
    ConfigSchemaInvalid,

    // Environment resolution
    EnvironmentNotFound,
    TargetMachineMismatch,
    MissingHostname,

    // Registry
    NotFound,
    Ambiguous,
    RegistryInvalid,

    // External processes
    ModuleLoadError,
    ProcessError,

    IoError,
    ArgsError,
    Internal,
};

// Stable short name, e.g. "ConfigNotFound"
const char* error_name(ErrorCode code);

// One-line next step for the user, or "" when there is nothing to suggest
std::string error_hint(ErrorCode code);

// Process exit status for a failed command (never 0)
int exit_status(ErrorCode code);

// Expected failures are reported without diagnostics; anything else is
// treated as an internal error and gets the full detail.
bool is_expected_failure(ErrorCode code);
