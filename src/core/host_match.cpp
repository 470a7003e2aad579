#include "host_match.hpp"
#include "utils.hpp"

static const char* LOCAL_SUFFIX = ".local";

std::string normalize_hostname(const std::string& hostname) {
    if (ends_with(hostname, LOCAL_SUFFIX)) {
        return hostname.substr(0, hostname.size() - std::string(LOCAL_SUFFIX).size());
    }
    return hostname;
}

bool is_universal_pattern(const std::string& pattern) {
    return pattern == "*" || pattern == "any" || pattern == "localhost";
}

bool has_wildcards(const std::string& pattern) {
    return pattern.find_first_of("*?") != std::string::npos;
}

static bool glob_from(const std::string& pattern, size_t pi,
                      const std::string& str, size_t si) {
    while (pi < pattern.size()) {
        char c = pattern[pi];
        if (c == '*') {
            while (pi < pattern.size() && pattern[pi] == '*') pi++;
            if (pi == pattern.size()) return true;
            for (size_t k = si; k <= str.size(); k++) {
                if (glob_from(pattern, pi, str, k)) return true;
            }
            return false;
        }
        if (si == str.size()) return false;
        if (c != '?' && c != str[si]) return false;
        pi++;
        si++;
    }
    return si == str.size();
}

bool glob_match(const std::string& pattern, const std::string& str) {
    return glob_from(pattern, 0, str, 0);
}

bool wildcard_match(const std::string& pattern, const std::string& str) {
    if (pattern.size() >= 2) {
        // "prefix*"
        if (pattern.back() == '*') {
            std::string prefix = pattern.substr(0, pattern.size() - 1);
            if (!has_wildcards(prefix)) return starts_with(str, prefix);
        }
        // "*suffix"
        if (pattern.front() == '*') {
            std::string suffix = pattern.substr(1);
            if (!has_wildcards(suffix)) return ends_with(str, suffix);
        }
    }
    return glob_match(pattern, str);
}

bool host_matches(const std::string& hostname, const std::string& pattern) {
    if (is_universal_pattern(pattern)) return true;
    if (pattern.empty()) return false;

    std::string host = normalize_hostname(hostname);

    if (has_wildcards(pattern)) {
        return wildcard_match(pattern, host);
    }

    if (host == pattern) return true;

    for (const auto& component : split(host, '.')) {
        if (component == pattern) return true;
    }

    if (pattern[0] == '.' && ends_with(host, pattern)) return true;

    return host.size() > pattern.size() + 1 && ends_with(host, "." + pattern);
}

bool host_matches_any(const std::string& hostname, const std::vector<std::string>& patterns) {
    if (patterns.empty()) return true;
    for (const auto& p : patterns) {
        if (host_matches(hostname, p)) return true;
    }
    return false;
}

std::string cluster_from_hostname(const std::string& hostname) {
    auto first_dot = hostname.find('.');
    if (first_dot == std::string::npos) return hostname;

    auto second_dot = hostname.find('.', first_dot + 1);
    if (second_dot == std::string::npos) return hostname.substr(first_dot + 1);
    return hostname.substr(first_dot + 1, second_dot - first_dot - 1);
}

std::vector<std::string> split_targets(const std::string& joined) {
    std::vector<std::string> out;
    for (auto& part : split(joined, ',')) {
        trim(part);
        if (!part.empty()) out.push_back(part);
    }
    return out;
}
