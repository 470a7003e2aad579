#include "registry_store.hpp"
#include "resolver.hpp"
#include <core/constants.hpp>
#include <core/host_match.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

std::vector<std::string> RegistryEntry::targets() const {
    return split_targets(target_machines);
}

std::string RegistryEntry::short_id() const {
    return id.substr(0, SHORT_ID_LENGTH);
}

std::string venv_path_for(const std::string& project_dir,
                          const std::string& base_dir,
                          const std::string& name) {
    fs::path base(base_dir);
    if (base.is_absolute()) return (base / name).string();
    return (fs::path(project_dir) / base / name).string();
}

using json = nlohmann::ordered_json;

EnvironmentRegistry::EnvironmentRegistry(fs::path path) : path_(std::move(path)) {}

// ── Load ──────────────────────────────────────────────────────

namespace {
struct RegistryFormatError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
}

static std::string required_string(const json& n, const char* key, size_t index) {
    auto it = n.find(key);
    if (it == n.end() || !it->is_string()) {
        throw RegistryFormatError(fmt::format("entry {} has no string '{}'", index, key));
    }
    return it->get<std::string>();
}

static std::optional<std::string> optional_string(const json& n, const char* key) {
    auto it = n.find(key);
    if (it == n.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

static RegistryEntry parse_entry(const json& n, size_t index) {
    if (!n.is_object()) {
        throw RegistryFormatError(fmt::format("entry {} is not an object", index));
    }

    RegistryEntry e;
    e.env_name = required_string(n, "name", index);
    e.project_dir = required_string(n, "project_dir", index);

    if (auto t = optional_string(n, "target_machines")) {
        e.target_machines = *t;
    } else if (auto legacy = optional_string(n, "target_machine")) {
        e.target_machines = *legacy;
    } else {
        e.target_machines = ANY_TARGET;
    }

    e.description = optional_string(n, "description");

    // Entries written before IDs existed get one derived from their fields,
    // so it is the same on every load until the registry is saved again.
    if (auto id = optional_string(n, "id"); id && !id->empty()) {
        e.id = *id;
    } else {
        e.id = EnvironmentRegistry::derived_id(e.env_name, e.project_dir, e.target_machines);
        zenv_log(fmt::format("registry: derived ID {} for '{}'", e.id, e.env_name));
    }

    if (auto venv = optional_string(n, "venv_path"); venv && !venv->empty()) {
        e.venv_path = *venv;
    } else {
        e.venv_path = venv_path_for(e.project_dir, LEGACY_BASE_DIR, e.env_name);
        zenv_log(fmt::format("registry: reconstructed venv path {} for '{}'",
                             e.venv_path, e.env_name));
    }
    return e;
}

Result<EnvironmentRegistry> EnvironmentRegistry::load(const fs::path& path) {
    EnvironmentRegistry registry(path);

    if (!fs::exists(path)) {
        zenv_log("registry: " + path.string() + " not found, starting empty");
        return Result<EnvironmentRegistry>::Ok(std::move(registry));
    }

    std::ifstream in(path);
    if (!in) {
        return Result<EnvironmentRegistry>::Err(ErrorCode::IoError,
            "Cannot read registry " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();

    try {
        json root = json::parse(buf.str());
        if (!root.is_object()) {
            throw RegistryFormatError("top level is not an object");
        }
        auto envs = root.find("environments");
        if (envs != root.end() && !envs->is_null()) {
            if (!envs->is_array()) {
                throw RegistryFormatError("'environments' is not an array");
            }
            size_t index = 0;
            for (const auto& n : *envs) {
                registry.entries_.push_back(parse_entry(n, index++));
            }
        }
    } catch (const json::exception& e) {
        return Result<EnvironmentRegistry>::Err(ErrorCode::RegistryInvalid,
            fmt::format("Registry {} is invalid: {}", path.string(), e.what()));
    } catch (const RegistryFormatError& e) {
        return Result<EnvironmentRegistry>::Err(ErrorCode::RegistryInvalid,
            fmt::format("Registry {} is invalid: {}", path.string(), e.what()));
    }

    zenv_log(fmt::format("registry: loaded {} entries", registry.entries_.size()));
    return Result<EnvironmentRegistry>::Ok(std::move(registry));
}

// ── Save ──────────────────────────────────────────────────────

std::string EnvironmentRegistry::to_json() const {
    json envs = json::array();
    for (const auto& e : entries_) {
        json entry = {
            {"id", e.id},
            {"name", e.env_name},
            {"project_dir", e.project_dir},
            {"target_machines", e.target_machines},
            {"venv_path", e.venv_path},
        };
        if (e.description) entry["description"] = *e.description;
        envs.push_back(std::move(entry));
    }
    json root = {{"environments", std::move(envs)}};

    // Invalid UTF-8 in a path or description is replaced rather than thrown on
    return root.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

Result<void> EnvironmentRegistry::save() const {
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            return Result<void>::Err(ErrorCode::IoError,
                fmt::format("Cannot create {}: {}", path_.parent_path().string(), ec.message()));
        }
    }

    fs::path tmp = path_;
    tmp += fmt::format(".tmp.{}", getpid());
    {
        std::ofstream fout(tmp.string(), std::ios::trunc);
        if (!fout) {
            return Result<void>::Err(ErrorCode::IoError, "Cannot write " + tmp.string());
        }
        fout << to_json();
        fout.flush();
        if (!fout) {
            fout.close();
            fs::remove(tmp, ec);
            return Result<void>::Err(ErrorCode::IoError, "Failed writing " + tmp.string());
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return Result<void>::Err(ErrorCode::IoError,
            fmt::format("Cannot replace {}: {}", path_.string(), ec.message()));
    }

    zenv_log(fmt::format("registry: saved {} entries to {}", entries_.size(), path_.string()));
    return Result<void>::Ok();
}

// ── Mutation ──────────────────────────────────────────────────

RegistryEntry EnvironmentRegistry::register_env(const std::string& name,
                                                const std::string& project_dir,
                                                const std::string& base_dir,
                                                const std::optional<std::string>& description,
                                                const std::vector<std::string>& targets) {
    std::string joined = targets.empty() ? std::string(ANY_TARGET) : join(targets, ",");
    std::string venv = venv_path_for(project_dir, base_dir, name);

    for (auto& e : entries_) {
        if (e.env_name == name && e.project_dir == project_dir) {
            e.venv_path = venv;
            e.description = description;
            e.target_machines = joined;
            zenv_log(fmt::format("registry: updated '{}' ({})", name, e.id));
            return e;
        }
    }

    RegistryEntry e;
    e.id = generate_id(name, project_dir, joined);
    e.env_name = name;
    e.project_dir = project_dir;
    e.venv_path = venv;
    e.description = description;
    e.target_machines = joined;
    entries_.push_back(e);
    zenv_log(fmt::format("registry: added '{}' ({})", name, e.id));
    return e;
}

Result<RegistryEntry> EnvironmentRegistry::deregister(const std::string& identifier,
                                                      const std::string& cwd) {
    auto found = resolve(*this, identifier, cwd);
    if (found.is_err()) return Result<RegistryEntry>::Err(found);

    std::string id = found.value->id;
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->id == id) {
            RegistryEntry removed = *it;
            entries_.erase(it);
            zenv_log(fmt::format("registry: removed '{}' ({})", removed.env_name, removed.id));
            return Result<RegistryEntry>::Ok(std::move(removed));
        }
    }
    return Result<RegistryEntry>::Err(ErrorCode::Internal,
        "Resolved entry " + id + " vanished from the registry");
}

const RegistryEntry* EnvironmentRegistry::lookup(const std::string& identifier) const {
    for (const auto& e : entries_) {
        if (e.id == identifier) return &e;
    }
    for (const auto& e : entries_) {
        if (e.env_name == identifier) return &e;
    }
    return nullptr;
}

// ── IDs ───────────────────────────────────────────────────────

// 64-bit FNV-1a. Stable across builds, unlike std::hash.
static uint64_t fnv1a(const std::string& data) {
    uint64_t h = 14695981039346656037ULL;
    for (unsigned char c : data) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

static std::string hex_digest(const std::string& seed) {
    std::string id;
    for (char i = 0; id.size() < ID_HEX_LENGTH; i++) {
        id += fmt::format("{:016x}", fnv1a(seed + '\x1f' + static_cast<char>('0' + i)));
    }
    return id.substr(0, ID_HEX_LENGTH);
}

std::string EnvironmentRegistry::generate_id(const std::string& name,
                                             const std::string& project_dir,
                                             const std::string& targets) {
    static std::mt19937_64 rng(std::random_device{}());

    auto now = std::chrono::system_clock::now().time_since_epoch().count();
    return hex_digest(fmt::format("{}\x1f{}\x1f{}\x1f{}\x1f{}",
                                  name, project_dir, targets, now, rng()));
}

std::string EnvironmentRegistry::derived_id(const std::string& name,
                                            const std::string& project_dir,
                                            const std::string& targets) {
    return hex_digest(fmt::format("{}\x1f{}\x1f{}", name, project_dir, targets));
}
