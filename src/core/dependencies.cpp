#include "dependencies.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <toml.hpp>
#include <set>
#include <sstream>

std::vector<std::string> parse_requirements(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto hash = line.find(" #");
        if (hash != std::string::npos) line.erase(hash);
        trim(line);
        if (line.empty() || line[0] == '#' || line[0] == '-') continue;
        out.push_back(line);
    }
    return out;
}

Result<std::vector<std::string>> parse_pyproject_dependencies(const std::string& text,
                                                              const std::string& origin) {
    using Deps = std::vector<std::string>;

    toml::value doc;
    try {
        std::istringstream in(text);
        doc = toml::parse(in, origin);
    } catch (const toml::exception& e) {
        return Result<Deps>::Err(ErrorCode::ConfigReadError,
            fmt::format("{} is not valid TOML: {}", origin, e.what()));
    }

    Deps out;
    const auto& root = doc.as_table();
    auto project = root.find("project");
    if (project == root.end() || !project->second.is_table()) return Result<Deps>::Ok(out);

    const auto& table = project->second.as_table();
    auto deps = table.find("dependencies");
    if (deps == table.end()) return Result<Deps>::Ok(out);
    if (!deps->second.is_array()) {
        return Result<Deps>::Err(ErrorCode::ConfigReadError,
            fmt::format("{}: project.dependencies must be an array", origin));
    }

    for (const auto& item : deps->second.as_array()) {
        if (!item.is_string()) {
            return Result<Deps>::Err(ErrorCode::ConfigReadError,
                fmt::format("{}: project.dependencies must contain only strings", origin));
        }
        out.push_back(toml::get<std::string>(item));
    }
    return Result<Deps>::Ok(std::move(out));
}

std::string requirement_name(const std::string& requirement) {
    auto cut = requirement.find_first_of("<>=~![;@ ");
    return trimmed(requirement.substr(0, cut));
}

static bool is_valid_requirement(const std::string& dep) {
    bool has_alpha = false;
    for (char c : dep) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
            has_alpha = true;
        } else if (!((c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
                     c == '>' || c == '<' || c == '=' || c == '~' || c == '!' ||
                     c == ',' || c == ' ' || c == '[' || c == ']')) {
            return false;
        }
    }
    return has_alpha && !requirement_name(dep).empty();
}

std::vector<std::string> validate_dependencies(const std::vector<std::string>& raw) {
    std::vector<std::string> valid;
    std::set<std::string> seen;

    for (const auto& entry : raw) {
        std::string dep = trimmed(entry);
        if (dep.empty()) {
            zenv_log("deps: skipping empty dependency");
            continue;
        }
        if (dep.find('/') != std::string::npos) {
            zenv_log(fmt::format("deps: skipping path-like dependency '{}'", dep));
            continue;
        }
        if (!is_valid_requirement(dep)) {
            zenv_log(fmt::format("deps: skipping invalid dependency '{}'", dep));
            continue;
        }
        std::string key = to_lower(requirement_name(dep));
        if (!seen.insert(key).second) {
            zenv_log(fmt::format("deps: skipping duplicate package '{}'", dep));
            continue;
        }
        valid.push_back(dep);
    }
    return valid;
}
