#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <core/directory_structure.hpp>

namespace fs = std::filesystem;

struct RegistryEntry {
    std::string id;                 // 40 lowercase hex chars
    std::string env_name;
    std::string project_dir;        // absolute
    std::string venv_path;          // absolute
    std::optional<std::string> description;
    std::string target_machines;    // comma-joined patterns, "any" if none

    std::vector<std::string> targets() const;
    std::string short_id() const;
};

// Global, ID-addressable list of registered environments, backed by
// ~/.zenv/registry.json. Loaded once per command and passed by reference.
class EnvironmentRegistry {
public:
    explicit EnvironmentRegistry(fs::path path = get_registry_path());

    // Missing file -> empty registry. IoError / RegistryInvalid otherwise.
    static Result<EnvironmentRegistry> load(const fs::path& path = get_registry_path());

    // Write all entries as JSON via a sibling temp file + rename.
    Result<void> save() const;

    // Add an environment, or update the entry with the same name and project
    // directory in place (its ID is kept). Returns the stored entry.
    RegistryEntry register_env(const std::string& name,
                               const std::string& project_dir,
                               const std::string& base_dir,
                               const std::optional<std::string>& description,
                               const std::vector<std::string>& targets);

    // Resolve `identifier` and remove that entry. Does not save.
    Result<RegistryEntry> deregister(const std::string& identifier, const std::string& cwd);

    // Exact full ID or exact name only (first match)
    const RegistryEntry* lookup(const std::string& identifier) const;

    const std::vector<RegistryEntry>& entries() const { return entries_; }
    const fs::path& path() const { return path_; }

    // Serialized registry document
    std::string to_json() const;

    // Fresh ID for a new registration (time and random salted)
    static std::string generate_id(const std::string& name,
                                   const std::string& project_dir,
                                   const std::string& targets);

    // Deterministic ID for a stored entry that has none
    static std::string derived_id(const std::string& name,
                                  const std::string& project_dir,
                                  const std::string& targets);

private:
    fs::path path_;
    std::vector<RegistryEntry> entries_;
};

// Where register_env puts the venv: base_dir/name for an absolute base_dir,
// project_dir/base_dir/name otherwise.
std::string venv_path_for(const std::string& project_dir,
                          const std::string& base_dir,
                          const std::string& name);
