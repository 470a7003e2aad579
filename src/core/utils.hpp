#pragma once

#include <string>
#include <vector>

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Split on a single character. Empty fields are kept.
std::vector<std::string> split(const std::string& s, char delimiter);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

std::string to_lower(std::string s);

// Read an environment variable; nullopt-like "" when unset.
std::string env_or_empty(const char* name);

// True if the variable is set to 1, true or yes.
bool env_flag(const char* name);

// Quote a string for POSIX sh using single quotes.
std::string shell_quote(const std::string& s);
