#include "platform.hpp"
#include <cstdlib>
#include <ctime>
#include <random>

#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path temp_file(const std::string& prefix) {
    // pid + random for uniqueness
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)) ^
                            static_cast<unsigned>(getpid()));
    std::uniform_int_distribution<int> dist(10000, 99999);
    fs::path p;
    do {
        p = temp_dir() / (prefix + "_" + std::to_string(getpid()) + "_" +
                          std::to_string(dist(rng)));
    } while (fs::exists(p));
    return p;
}

fs::path current_dir() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) return fs::path(".");
    fs::path canonical = fs::canonical(cwd, ec);
    return ec ? cwd : canonical;
}

} // namespace platform
