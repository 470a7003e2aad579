#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory ($HOME, or the temp directory if unset).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Returns a not-yet-existing path in the temp directory with the given prefix.
std::filesystem::path temp_file(const std::string& prefix);

// Absolute, symlink-resolved current directory (falls back to the plain path).
std::filesystem::path current_dir();

} // namespace platform
