#include "directory_structure.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>

fs::path get_zenv_root() {
    std::string override_dir = env_or_empty(ENV_ZENV_DIR);
    if (!override_dir.empty()) {
        return fs::path(override_dir);
    }
    return platform::home_dir() / ZENV_HOME_DIRNAME;
}

fs::path get_registry_path() {
    return get_zenv_root() / REGISTRY_FILENAME;
}
