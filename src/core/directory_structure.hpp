#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Base zenv directory: $ZENV_DIR if set, otherwise ~/.zenv
fs::path get_zenv_root();

// ~/.zenv/registry.json (or under $ZENV_DIR)
fs::path get_registry_path();
