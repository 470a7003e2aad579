#include "config.hpp"
#include "constants.hpp"
#include "host_match.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

// Object members keep file order so environments list the way they are written
using json = nlohmann::ordered_json;

// Type errors inside a section. Caught in ZenvConfig::parse and reported as
// ConfigSchemaInvalid.
namespace {
struct SchemaError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
}

// ── JSON value helpers ────────────────────────────────────────

static std::string where(const std::string& section, const std::string& key) {
    return section.empty() ? key : section + "." + key;
}

static std::string parse_string(const json& node, const std::string& section,
                                const std::string& key) {
    if (!node.is_string()) {
        throw SchemaError(fmt::format("'{}' must be a string", where(section, key)));
    }
    return node.get<std::string>();
}

static std::optional<std::string> parse_optional_string(const json& node,
                                                        const std::string& section,
                                                        const std::string& key) {
    if (node.is_null()) return std::nullopt;
    return parse_string(node, section, key);
}

static std::vector<std::string> parse_string_list(const json& node,
                                                  const std::string& section,
                                                  const std::string& key) {
    std::vector<std::string> out;
    if (node.is_null()) return out;
    if (!node.is_array()) {
        throw SchemaError(fmt::format("'{}' must be an array of strings", where(section, key)));
    }
    for (const auto& item : node) {
        if (!item.is_string()) {
            throw SchemaError(fmt::format("'{}' must contain only strings", where(section, key)));
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

static std::map<std::string, std::string> parse_string_map(const json& node,
                                                           const std::string& section,
                                                           const std::string& key) {
    std::map<std::string, std::string> out;
    if (node.is_null()) return out;
    if (!node.is_object()) {
        throw SchemaError(fmt::format("'{}' must be an object", where(section, key)));
    }
    for (const auto& [var, value] : node.items()) {
        if (!value.is_string()) {
            throw SchemaError(fmt::format("'{}.{}' must be a string", where(section, key), var));
        }
        out[var] = value.get<std::string>();
    }
    return out;
}

// target_machines: a single pattern string or an array of them
static std::optional<std::vector<std::string>> parse_targets(const json& node,
                                                             const std::string& section) {
    if (node.is_null()) return std::nullopt;
    if (node.is_string()) return std::vector<std::string>{node.get<std::string>()};
    if (node.is_array()) return parse_string_list(node, section, "target_machines");
    throw SchemaError(fmt::format("'{}' must be a string or an array of strings",
                                  where(section, "target_machines")));
}

static void warn_unknown_key(const std::string& section, const std::string& key) {
    zenv_log(fmt::format("config: ignoring unknown key '{}'", where(section, key)));
}

// ── Section parsers ───────────────────────────────────────────

static CommonConfig parse_common_config(const json& node) {
    if (!node.is_object()) {
        throw SchemaError(fmt::format("'{}' must be an object", COMMON_SECTION));
    }

    CommonConfig common;
    bool have_requirements = false;
    const std::string section = COMMON_SECTION;

    for (const auto& [key, value] : node.items()) {
        if (key == "base_dir") {
            if (auto v = parse_optional_string(value, section, key)) common.base_dir = *v;
        } else if (key == "requirements_file") {
            if (auto v = parse_optional_string(value, section, key)) {
                common.requirements_file = *v;
                have_requirements = true;
            }
        } else if (key == "python_executable") {
            common.python_executable = parse_optional_string(value, section, key);
        } else if (key == "modules") {
            common.modules = parse_string_list(value, section, key);
        } else if (key == "dependencies") {
            common.dependencies = parse_string_list(value, section, key);
        } else if (key == "custom_activate_vars") {
            common.custom_activate_vars = parse_string_map(value, section, key);
        } else if (key == "setup_commands") {
            common.setup_commands = parse_string_list(value, section, key);
        } else {
            warn_unknown_key(section, key);
        }
    }

    if (!have_requirements) {
        throw SchemaError(fmt::format("'{}.requirements_file' is required", COMMON_SECTION));
    }
    return common;
}

static EnvironmentSpec parse_environment_spec(const std::string& name, const json& node) {
    if (name.empty()) {
        throw SchemaError("environment names must not be empty");
    }
    if (!node.is_object()) {
        throw SchemaError(fmt::format("environment '{}' must be an object", name));
    }

    EnvironmentSpec env;
    env.name = name;

    for (const auto& [key, value] : node.items()) {
        if (key == "target_machines") {
            env.target_machines = parse_targets(value, name);
        } else if (key == "python_executable") {
            env.python_executable = parse_optional_string(value, name, key);
        } else if (key == "modules") {
            env.modules = parse_string_list(value, name, key);
        } else if (key == "modules_file") {
            env.modules_file = parse_optional_string(value, name, key);
        } else if (key == "dependencies") {
            env.dependencies = parse_string_list(value, name, key);
        } else if (key == "requirements_file") {
            env.requirements_file = parse_optional_string(value, name, key);
        } else if (key == "description") {
            env.description = parse_optional_string(value, name, key);
        } else if (key == "custom_activate_vars") {
            env.custom_activate_vars = parse_string_map(value, name, key);
        } else if (key == "setup_commands") {
            env.setup_commands = parse_string_list(value, name, key);
        } else {
            warn_unknown_key(name, key);
        }
    }
    return env;
}

// ── Paths ─────────────────────────────────────────────────────

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / CONFIG_FILENAME;
}

// ── ZenvConfig ────────────────────────────────────────────────

Result<ZenvConfig> ZenvConfig::parse(const std::string& text, const std::string& origin) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        return Result<ZenvConfig>::Err(ErrorCode::JsonInvalid,
            fmt::format("{} is not valid JSON: {}", origin, e.what()));
    }

    if (!root.is_object()) {
        return Result<ZenvConfig>::Err(ErrorCode::JsonInvalid,
            fmt::format("{} must contain a JSON object", origin));
    }

    ZenvConfig config;
    try {
        std::optional<std::string> top_base_dir;
        bool have_common = false;

        for (const auto& [key, value] : root.items()) {
            if (key == COMMON_SECTION) {
                config.common_ = parse_common_config(value);
                have_common = true;
            } else if (key == "base_dir") {
                top_base_dir = parse_optional_string(value, "", key);
            } else {
                config.environments_.push_back(parse_environment_spec(key, value));
            }
        }

        if (!have_common) {
            throw SchemaError(fmt::format("missing required '{}' section", COMMON_SECTION));
        }
        if (top_base_dir) config.common_.base_dir = *top_base_dir;
        if (config.common_.base_dir.empty()) {
            throw SchemaError("'base_dir' is required (top level or in 'common')");
        }
    } catch (const SchemaError& e) {
        return Result<ZenvConfig>::Err(ErrorCode::ConfigSchemaInvalid,
            fmt::format("{}: {}", origin, e.what()));
    }

    zenv_log(fmt::format("config: parsed {} ({} environments)", origin,
                         config.environments_.size()));
    return Result<ZenvConfig>::Ok(std::move(config));
}

Result<ZenvConfig> ZenvConfig::load(const fs::path& project_dir) {
    fs::path path = get_project_config_path(project_dir);
    if (!fs::exists(path)) {
        return Result<ZenvConfig>::Err(ErrorCode::ConfigNotFound,
            "No " + std::string(CONFIG_FILENAME) + " found in " + project_dir.string());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<ZenvConfig>::Err(ErrorCode::ConfigReadError,
            "Cannot read " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return Result<ZenvConfig>::Err(ErrorCode::ConfigReadError,
            "Cannot read " + path.string());
    }

    auto result = parse(buf.str(), path.string());
    if (result.is_ok()) {
        result.value.project_dir_ = project_dir;
    }
    return result;
}

const EnvironmentSpec* ZenvConfig::find(const std::string& name) const {
    for (const auto& env : environments_) {
        if (env.name == name) return &env;
    }
    return nullptr;
}

std::vector<std::string> ZenvConfig::environment_names() const {
    std::vector<std::string> names;
    for (const auto& env : environments_) names.push_back(env.name);
    return names;
}

Result<std::string> ZenvConfig::detect_environment(const std::string& hostname) const {
    std::string cluster = cluster_from_hostname(hostname);

    std::vector<std::string> matches;
    for (const auto& env : environments_) {
        if (!env.target_machines) continue;
        for (const auto& pattern : *env.target_machines) {
            if (is_universal_pattern(pattern)) continue;
            if (pattern == cluster || host_matches(hostname, pattern)) {
                matches.push_back(env.name);
                break;
            }
        }
    }

    if (matches.size() == 1) {
        zenv_log(fmt::format("config: '{}' targets {} (cluster '{}')", matches[0], hostname, cluster));
        return Result<std::string>::Ok(matches[0]);
    }
    if (matches.empty()) {
        return Result<std::string>::Err(ErrorCode::EnvironmentNotFound,
            fmt::format("No environment in {} targets this machine (cluster '{}'); name one explicitly",
                        CONFIG_FILENAME, cluster));
    }
    return Result<std::string>::Err(ErrorCode::EnvironmentNotFound,
        fmt::format("Several environments target this machine (cluster '{}'): {}; name one explicitly",
                    cluster, join(matches, ", ")));
}

Result<EffectiveConfig> ZenvConfig::effective(const std::string& name,
                                              const std::string& fallback_cluster) const {
    const EnvironmentSpec* env = find(name);
    if (!env) {
        std::string known = environments_.empty() ? "none" : join(environment_names(), ", ");
        return Result<EffectiveConfig>::Err(ErrorCode::EnvironmentNotFound,
            fmt::format("Environment '{}' is not defined in {} (defined: {})",
                        name, CONFIG_FILENAME, known));
    }

    EffectiveConfig eff = merge(common_, *env, fallback_cluster);

    if (eff.modules_file) {
        fs::path modules_path = *eff.modules_file;
        if (modules_path.is_relative()) modules_path = project_dir_ / modules_path;
        auto modules = read_modules_file(modules_path);
        if (modules.is_err()) return Result<EffectiveConfig>::Err(modules);
        zenv_log(fmt::format("config: {} modules from {}", modules.value.size(),
                             modules_path.string()));
        eff.modules = std::move(modules.value);
    }
    return Result<EffectiveConfig>::Ok(std::move(eff));
}

// ── Merge ─────────────────────────────────────────────────────

template <typename T>
static std::vector<T> concat(const std::vector<T>& a, const std::vector<T>& b) {
    std::vector<T> out = a;
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

EffectiveConfig merge(const CommonConfig& common,
                      const EnvironmentSpec& env,
                      const std::string& fallback_cluster) {
    EffectiveConfig eff;
    eff.name = env.name;

    if (env.python_executable) {
        eff.python_executable = *env.python_executable;
    } else if (common.python_executable) {
        eff.python_executable = *common.python_executable;
    } else {
        eff.python_executable = DEFAULT_PYTHON;
    }

    if (env.target_machines) {
        eff.target_machines = *env.target_machines;
    } else if (!fallback_cluster.empty()) {
        eff.target_machines = {fallback_cluster};
    }

    eff.modules = concat(common.modules, env.modules);
    eff.dependencies = concat(common.dependencies, env.dependencies);
    eff.setup_commands = concat(common.setup_commands, env.setup_commands);

    eff.custom_activate_vars = common.custom_activate_vars;
    for (const auto& [key, value] : env.custom_activate_vars) {
        eff.custom_activate_vars[key] = value;
    }

    eff.requirements_file = env.requirements_file ? *env.requirements_file
                                                  : common.requirements_file;
    eff.description = env.description;
    eff.modules_file = env.modules_file;
    eff.base_dir = common.base_dir;
    return eff;
}

// ── Template ──────────────────────────────────────────────────

std::string config_template(const std::string& env_name,
                            const std::string& description,
                            const std::string& requirements_file) {
    json doc = {
        {COMMON_SECTION, {
            {"base_dir", LEGACY_BASE_DIR},
            {"requirements_file", requirements_file},
            {"python_executable", DEFAULT_PYTHON},
            {"modules", json::array()},
            {"dependencies", json::array()},
            {"custom_activate_vars", json::object()},
            {"setup_commands", json::array()},
        }},
        {env_name, {
            {"target_machines", json::array({"*"})},
            {"description", description},
            {"modules", json::array()},
            {"dependencies", json::array()},
        }},
    };
    return doc.dump(2) + "\n";
}

Result<fs::path> write_config_template(const fs::path& dir,
                                       const std::string& env_name,
                                       const std::string& description) {
    if (env_name.empty() || env_name == COMMON_SECTION || env_name == "base_dir") {
        return Result<fs::path>::Err(ErrorCode::ArgsError,
            fmt::format("'{}' cannot be used as an environment name", env_name));
    }

    fs::path path = get_project_config_path(dir);
    if (fs::exists(path)) {
        return Result<fs::path>::Err(ErrorCode::IoError,
            path.string() + " already exists; remove or rename it first");
    }

    std::string requirements = "requirements.txt";
    if (!fs::exists(dir / requirements) && fs::exists(dir / "pyproject.toml")) {
        requirements = "pyproject.toml";
    }

    std::ofstream out(path);
    if (!out) {
        return Result<fs::path>::Err(ErrorCode::IoError, "Cannot write " + path.string());
    }
    out << config_template(env_name, description, requirements);
    if (!out) {
        return Result<fs::path>::Err(ErrorCode::IoError, "Failed writing " + path.string());
    }
    zenv_log(fmt::format("config: wrote template for '{}' to {}", env_name, path.string()));
    return Result<fs::path>::Ok(path);
}

// ── Modules file ──────────────────────────────────────────────

Result<std::vector<std::string>> read_modules_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<std::vector<std::string>>::Err(ErrorCode::ConfigReadError,
            "Cannot read modules file " + path.string());
    }

    std::vector<std::string> modules;
    std::string line;
    while (std::getline(in, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);

        std::istringstream words(line);
        std::string word;
        while (words >> word) modules.push_back(word);
    }
    return Result<std::vector<std::string>>::Ok(std::move(modules));
}
