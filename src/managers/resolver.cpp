#include "resolver.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

using ResolveResult = Result<const RegistryEntry*>;

static std::string describe(const RegistryEntry& e) {
    return fmt::format("{} ({}, {})", e.env_name, e.short_id(), e.project_dir);
}

static ResolveResult ambiguous(const std::string& identifier,
                               const std::vector<const RegistryEntry*>& matches) {
    std::vector<std::string> names;
    std::vector<std::string> details;
    for (const auto* e : matches) {
        names.push_back(e->env_name);
        details.push_back(describe(*e));
    }
    return ResolveResult::Err(ErrorCode::Ambiguous,
        fmt::format("'{}' matches {} environments: {}", identifier, matches.size(),
                    join(details, "; ")),
        names);
}

static ResolveResult not_found(const std::string& identifier) {
    return ResolveResult::Err(ErrorCode::NotFound,
        fmt::format("No registered environment matches '{}'", identifier));
}

ResolveResult resolve(const EnvironmentRegistry& registry,
                      const std::string& identifier,
                      const std::string& cwd) {
    const auto& entries = registry.entries();

    if (identifier.empty()) return not_found(identifier);

    // "." = environment registered for the current directory
    if (identifier == ".") {
        std::vector<const RegistryEntry*> here;
        for (const auto& e : entries) {
            if (e.project_dir == cwd) here.push_back(&e);
        }
        if (here.empty()) {
            return ResolveResult::Err(ErrorCode::NotFound,
                fmt::format("No environment is registered for {}", cwd));
        }
        if (here.size() > 1) return ambiguous(identifier, here);
        return ResolveResult::Ok(here.front());
    }

    // Exact name
    std::vector<const RegistryEntry*> named;
    for (const auto& e : entries) {
        if (e.env_name == identifier) named.push_back(&e);
    }
    if (named.size() == 1) return ResolveResult::Ok(named.front());
    if (named.size() > 1) {
        for (const auto* e : named) {
            if (e->project_dir == cwd) return ResolveResult::Ok(e);
        }
        return ambiguous(identifier, named);
    }

    // Exact full ID
    for (const auto& e : entries) {
        if (e.id == identifier) return ResolveResult::Ok(&e);
    }

    // ID prefix
    if (identifier.size() < MIN_ID_PREFIX_LENGTH) {
        zenv_log(fmt::format("resolve: '{}' too short for an ID prefix", identifier));
        return not_found(identifier);
    }

    std::vector<const RegistryEntry*> prefixed;
    for (const auto& e : entries) {
        if (identifier.size() < e.id.size() && starts_with(e.id, identifier)) {
            prefixed.push_back(&e);
        }
    }
    if (prefixed.empty()) return not_found(identifier);
    if (prefixed.size() > 1) return ambiguous(identifier, prefixed);
    return ResolveResult::Ok(prefixed.front());
}
