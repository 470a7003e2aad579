#include "errors.hpp"

const char* error_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                  return "None";
        case ErrorCode::ConfigNotFound:        return "ConfigNotFound";
        case ErrorCode::ConfigReadError:       return "ConfigReadError";
        case ErrorCode::JsonInvalid:           return "JsonInvalid";
        case ErrorCode::ConfigSchemaInvalid:   return "ConfigSchemaInvalid";
        case ErrorCode::EnvironmentNotFound:   return "EnvironmentNotFound";
        case ErrorCode::TargetMachineMismatch: return "TargetMachineMismatch";
        case ErrorCode::MissingHostname:       return "MissingHostname";
        case ErrorCode::NotFound:              return "NotFound";
        case ErrorCode::Ambiguous:             return "Ambiguous";
        case ErrorCode::RegistryInvalid:       return "RegistryInvalid";
        case ErrorCode::ModuleLoadError:       return "ModuleLoadError";
        case ErrorCode::ProcessError:          return "ProcessError";
        case ErrorCode::IoError:               return "IoError";
        case ErrorCode::ArgsError:             return "ArgsError";
        case ErrorCode::Internal:              return "Internal";
    }
    return "Unknown";
}

std::string error_hint(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConfigNotFound:
            return "Run zenv from a project directory containing zenv.json";
        case ErrorCode::ConfigReadError:
            return "Check that zenv.json is a readable file";
        case ErrorCode::JsonInvalid:
            return "Fix the JSON syntax in zenv.json";
        case ErrorCode::ConfigSchemaInvalid:
            return "Check keys, value types and required fields in zenv.json (try 'zenv validate')";
        case ErrorCode::EnvironmentNotFound:
            return "Check the environment name against the sections of zenv.json";
        case ErrorCode::TargetMachineMismatch:
            return "Use '--no-host' to bypass the target machine check";
        case ErrorCode::MissingHostname:
            return "Set HOSTNAME, or use '--no-host' to skip the target machine check";
        case ErrorCode::NotFound:
            return "Run 'zenv list --all' to see registered environments and their IDs";
        case ErrorCode::Ambiguous:
            return "Use more characters of the ID, or the full ID, to pick one";
        case ErrorCode::RegistryInvalid:
            return "Repair or remove the registry file";
        case ErrorCode::ModuleLoadError:
            return "Check the module name with 'module avail'";
        case ErrorCode::ProcessError:
            return "See the command output above for details";
        case ErrorCode::IoError:
            return "Check permissions of the zenv directory";
        case ErrorCode::ArgsError:
            return "Run 'zenv help' for usage";
        case ErrorCode::None:
        case ErrorCode::Internal:
            return "";
    }
    return "";
}

int exit_status(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                  return 0;
        case ErrorCode::ArgsError:             return 2;
        case ErrorCode::ConfigNotFound:        return 10;
        case ErrorCode::ConfigReadError:       return 11;
        case ErrorCode::JsonInvalid:           return 12;
        case ErrorCode::ConfigSchemaInvalid:   return 13;
        case ErrorCode::EnvironmentNotFound:   return 20;
        case ErrorCode::TargetMachineMismatch: return 21;
        case ErrorCode::MissingHostname:       return 22;
        case ErrorCode::NotFound:              return 30;
        case ErrorCode::Ambiguous:             return 31;
        case ErrorCode::RegistryInvalid:       return 32;
        case ErrorCode::ModuleLoadError:       return 40;
        case ErrorCode::ProcessError:          return 41;
        case ErrorCode::IoError:               return 50;
        case ErrorCode::Internal:              return 70;
    }
    return 1;
}

bool is_expected_failure(ErrorCode code) {
    return code != ErrorCode::Internal && code != ErrorCode::None;
}
