#pragma once

#include <string>
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fmt/format.h>
#include <platform/platform.hpp>
#include "constants.hpp"
#include "utils.hpp"

inline std::string zenv_log_path() {
    static std::string path = (platform::temp_dir() / DEBUG_LOG_FILENAME).string();
    return path;
}

// Append a timestamped line to the debug log. With ZENV_DEBUG=1 the line is
// also echoed to stderr.
inline void zenv_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    std::string line = fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}",
                                   tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()), msg);

    if (env_flag(ENV_ZENV_DEBUG)) {
        std::cerr << "\033[38;2;80;80;80m    \xc2\xb7 " << line << "\033[0m\n";
    }

    std::ofstream out(zenv_log_path(), std::ios::app);
    if (!out) return;
    out << line << "\n";
}
