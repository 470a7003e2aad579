#include <gtest/gtest.h>
#include <core/config.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static const char* BASIC_CONFIG = R"({
  "common": {
    "base_dir": "zenv",
    "requirements_file": "requirements.txt",
    "modules": ["Stages/2024", "GCC"],
    "dependencies": ["numpy"],
    "custom_activate_vars": {"OMP_NUM_THREADS": "1", "PROJECT": "common"},
    "setup_commands": ["echo common"]
  },
  "jureca": {
    "target_machines": ["jureca", "jrlogin*"],
    "python_executable": "python3.11",
    "modules": ["Python"],
    "dependencies": ["torch"],
    "custom_activate_vars": {"PROJECT": "jureca"},
    "setup_commands": ["echo env"],
    "description": "JURECA GPU env"
  },
  "plain": {},
  "single": {"target_machines": "juwels"}
})";

static ZenvConfig parse_ok(const std::string& text) {
    auto r = ZenvConfig::parse(text, "test.json");
    EXPECT_TRUE(r.is_ok()) << r.error;
    return r.value;
}

TEST(Config, ParsesSectionsInFileOrder) {
    auto config = parse_ok(BASIC_CONFIG);
    EXPECT_EQ(config.environment_names(), (std::vector<std::string>{"jureca", "plain", "single"}));
    EXPECT_EQ(config.base_dir(), "zenv");
    EXPECT_EQ(config.common().requirements_file, "requirements.txt");
    ASSERT_NE(config.find("single"), nullptr);
    ASSERT_TRUE(config.find("single")->target_machines.has_value());
    EXPECT_EQ(*config.find("single")->target_machines, (std::vector<std::string>{"juwels"}));
    EXPECT_EQ(config.find("missing"), nullptr);
}

TEST(Config, MergeListsCommonThenEnv) {
    auto config = parse_ok(BASIC_CONFIG);
    auto eff = config.effective("jureca", "fallback");
    ASSERT_TRUE(eff.is_ok()) << eff.error;

    EXPECT_EQ(eff.value.modules, (std::vector<std::string>{"Stages/2024", "GCC", "Python"}));
    EXPECT_EQ(eff.value.dependencies, (std::vector<std::string>{"numpy", "torch"}));
    EXPECT_EQ(eff.value.setup_commands, (std::vector<std::string>{"echo common", "echo env"}));
    EXPECT_EQ(eff.value.target_machines, (std::vector<std::string>{"jureca", "jrlogin*"}));
    EXPECT_EQ(eff.value.python_executable, "python3.11");
    EXPECT_EQ(eff.value.description.value_or(""), "JURECA GPU env");
}

TEST(Config, MergeEnvWinsCustomVars) {
    auto config = parse_ok(BASIC_CONFIG);
    auto eff = config.effective("jureca", "");
    ASSERT_TRUE(eff.is_ok());
    EXPECT_EQ(eff.value.custom_activate_vars.at("PROJECT"), "jureca");
    EXPECT_EQ(eff.value.custom_activate_vars.at("OMP_NUM_THREADS"), "1");
}

TEST(Config, MergeWithEmptyEnvYieldsCommon) {
    CommonConfig common;
    common.base_dir = "envs";
    common.requirements_file = "pyproject.toml";
    common.python_executable = "python3.10";
    common.modules = {"a", "b"};
    common.dependencies = {"numpy"};
    common.custom_activate_vars = {{"X", "1"}};
    common.setup_commands = {"make"};

    EnvironmentSpec env;
    env.name = "empty";
    env.target_machines = std::vector<std::string>{};

    auto eff = merge(common, env, "cluster");
    EXPECT_EQ(eff.name, "empty");
    EXPECT_EQ(eff.python_executable, "python3.10");
    EXPECT_EQ(eff.modules, common.modules);
    EXPECT_EQ(eff.dependencies, common.dependencies);
    EXPECT_EQ(eff.custom_activate_vars, common.custom_activate_vars);
    EXPECT_EQ(eff.setup_commands, common.setup_commands);
    EXPECT_EQ(eff.requirements_file, "pyproject.toml");
    EXPECT_EQ(eff.base_dir, "envs");
    EXPECT_TRUE(eff.target_machines.empty());
}

TEST(Config, ListMergeOrdering) {
    CommonConfig common;
    common.modules = {"a", "b"};
    EnvironmentSpec env;
    env.modules = {"c"};
    EXPECT_EQ(merge(common, env, "").modules, (std::vector<std::string>{"a", "b", "c"}));
}

TEST(Config, PythonDefaultsToPython3) {
    auto config = parse_ok(BASIC_CONFIG);
    auto eff = config.effective("plain", "jureca");
    ASSERT_TRUE(eff.is_ok());
    EXPECT_EQ(eff.value.python_executable, "python3");
}

TEST(Config, MissingTargetsFallBackToCluster) {
    auto config = parse_ok(BASIC_CONFIG);
    auto eff = config.effective("plain", "jureca");
    ASSERT_TRUE(eff.is_ok());
    EXPECT_EQ(eff.value.target_machines, (std::vector<std::string>{"jureca"}));

    auto no_cluster = config.effective("plain", "");
    ASSERT_TRUE(no_cluster.is_ok());
    EXPECT_TRUE(no_cluster.value.target_machines.empty());
}

TEST(Config, TopLevelBaseDirWins) {
    auto config = parse_ok(R"({"base_dir": "/scratch/envs",
        "common": {"base_dir": "zenv", "requirements_file": "r.txt"}})");
    EXPECT_EQ(config.base_dir(), "/scratch/envs");

    auto top_only = parse_ok(R"({"base_dir": "top", "common": {"requirements_file": "r.txt"}})");
    EXPECT_EQ(top_only.base_dir(), "top");
}

TEST(Config, UnknownEnvironment) {
    auto config = parse_ok(BASIC_CONFIG);
    auto eff = config.effective("nope", "");
    ASSERT_TRUE(eff.is_err());
    EXPECT_EQ(eff.code, ErrorCode::EnvironmentNotFound);
}

TEST(Config, MalformedJson) {
    auto r = ZenvConfig::parse(R"({"common": {"base_dir": "zenv",)", "bad.json");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::JsonInvalid);

    auto not_object = ZenvConfig::parse(R"(["a", "b"])", "list.json");
    EXPECT_EQ(not_object.code, ErrorCode::JsonInvalid);
}

TEST(Config, DetectEnvironmentByClusterOrPattern) {
    auto config = parse_ok(R"({
      "common": {"base_dir": "zenv", "requirements_file": "r.txt"},
      "everywhere": {"target_machines": "*"},
      "untargeted": {},
      "jureca": {"target_machines": ["jureca"]},
      "juwels": {"target_machines": ["jwlogin*"]}
    })");

    auto by_cluster = config.detect_environment("jrlogin08.jureca.fz-juelich.de");
    ASSERT_TRUE(by_cluster.is_ok()) << by_cluster.error;
    EXPECT_EQ(by_cluster.value, "jureca");

    auto by_pattern = config.detect_environment("jwlogin03.juwels");
    ASSERT_TRUE(by_pattern.is_ok()) << by_pattern.error;
    EXPECT_EQ(by_pattern.value, "juwels");

    auto none = config.detect_environment("workstation");
    ASSERT_TRUE(none.is_err());
    EXPECT_EQ(none.code, ErrorCode::EnvironmentNotFound);
    EXPECT_NE(none.error.find("workstation"), std::string::npos);
}

TEST(Config, DetectEnvironmentRefusesToGuess) {
    auto config = parse_ok(R"({
      "common": {"base_dir": "zenv", "requirements_file": "r.txt"},
      "gpu": {"target_machines": ["jureca"]},
      "cpu": {"target_machines": ["jrlogin*"]}
    })");
    auto r = config.detect_environment("jrlogin08.jureca");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::EnvironmentNotFound);
    EXPECT_NE(r.error.find("gpu, cpu"), std::string::npos) << r.error;
}

TEST(Config, TemplateParsesBack) {
    auto config = parse_ok(config_template("dev", "Env config created by zenv", "requirements.txt"));
    EXPECT_EQ(config.base_dir(), "zenv");
    EXPECT_EQ(config.environment_names(), (std::vector<std::string>{"dev"}));

    auto eff = config.effective("dev", "");
    ASSERT_TRUE(eff.is_ok()) << eff.error;
    EXPECT_EQ(eff.value.target_machines, (std::vector<std::string>{"*"}));
    EXPECT_EQ(eff.value.python_executable, "python3");
}

TEST(Config, TrailingContentIsJsonInvalid) {
    auto r = ZenvConfig::parse(
        R"({"common": {"base_dir": "zenv", "requirements_file": "r.txt"}} xyz)", "trail.json");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::JsonInvalid);

    // YAML-only syntax is not JSON
    auto yaml = ZenvConfig::parse("common:\n  base_dir: zenv\n  requirements_file: r.txt\n",
                                  "yaml.json");
    EXPECT_EQ(yaml.code, ErrorCode::JsonInvalid);
}

TEST(Config, SchemaErrorsFailFast) {
    struct Case { const char* text; const char* why; };
    std::vector<Case> cases = {
        {R"({"env": {}})", "missing common"},
        {R"({"common": {"base_dir": "zenv"}})", "missing requirements_file"},
        {R"({"common": {"requirements_file": "r.txt"}})", "missing base_dir"},
        {R"({"common": "zenv"})", "common not an object"},
        {R"({"common": {"base_dir": "zenv", "requirements_file": 3}})", "number for string"},
        {R"({"common": {"base_dir": "zenv", "requirements_file": "r.txt"}, "e": {"modules": "GCC"}})",
         "string for list"},
        {R"({"common": {"base_dir": "zenv", "requirements_file": "r.txt"}, "e": {"modules": ["GCC", 1]}})",
         "number in list"},
        {R"({"common": {"base_dir": "zenv", "requirements_file": "r.txt"}, "e": {"target_machines": true}})",
         "bool targets"},
        {R"({"common": {"base_dir": "zenv", "requirements_file": "r.txt"}, "e": {"custom_activate_vars": {"A": 1}}})",
         "number var"},
        {R"({"common": {"base_dir": "zenv", "requirements_file": "r.txt"}, "e": []})", "env not object"},
    };
    for (const auto& c : cases) {
        auto r = ZenvConfig::parse(c.text, "schema.json");
        EXPECT_TRUE(r.is_err()) << c.why;
        EXPECT_EQ(r.code, ErrorCode::ConfigSchemaInvalid) << c.why << ": " << r.error;
    }
}

TEST(Config, NullMeansUnset) {
    auto config = parse_ok(R"({"common": {"base_dir": "zenv", "requirements_file": "r.txt",
        "python_executable": null}, "e": {"python_executable": null, "target_machines": null}})");
    auto eff = config.effective("e", "cl");
    ASSERT_TRUE(eff.is_ok());
    EXPECT_EQ(eff.value.python_executable, "python3");
    EXPECT_EQ(eff.value.target_machines, (std::vector<std::string>{"cl"}));
}

TEST(Config, UnknownKeysIgnored) {
    auto config = parse_ok(R"({"common": {"base_dir": "zenv", "requirements_file": "r.txt",
        "colour": "blue"}, "e": {"frobnicate": [1, 2]}})");
    EXPECT_EQ(config.environment_names(), (std::vector<std::string>{"e"}));
}

class ConfigFileTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = platform::temp_file("zenv_config_test");
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const std::string& rel_path, const std::string& content) {
        std::ofstream(test_dir / rel_path) << content;
    }
};

TEST_F(ConfigFileTest, MissingFileIsConfigNotFound) {
    auto r = ZenvConfig::load(test_dir);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::ConfigNotFound);
}

TEST_F(ConfigFileTest, LoadsFromProjectDir) {
    write_file("zenv.json", BASIC_CONFIG);
    auto r = ZenvConfig::load(test_dir);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.project_dir(), test_dir);
    EXPECT_EQ(r.value.environments().size(), 3u);
}

TEST_F(ConfigFileTest, ModulesFileReplacesModules) {
    write_file("zenv.json", R"({"common": {"base_dir": "zenv", "requirements_file": "r.txt",
        "modules": ["Stages/2024"]}, "e": {"modules_file": "modules.txt"}})");
    write_file("modules.txt", "# toolchain\nGCC OpenMPI\n\n  Python/3.11  # interpreter\n");

    auto config = ZenvConfig::load(test_dir);
    ASSERT_TRUE(config.is_ok()) << config.error;
    auto eff = config.value.effective("e", "");
    ASSERT_TRUE(eff.is_ok()) << eff.error;
    EXPECT_EQ(eff.value.modules, (std::vector<std::string>{"GCC", "OpenMPI", "Python/3.11"}));
}

TEST_F(ConfigFileTest, TemplateRejectsReservedNames) {
    EXPECT_EQ(write_config_template(test_dir, "common", "x").code, ErrorCode::ArgsError);
    EXPECT_EQ(write_config_template(test_dir, "", "x").code, ErrorCode::ArgsError);
    EXPECT_FALSE(project_config_exists(test_dir));
}

TEST_F(ConfigFileTest, MissingModulesFile) {
    write_file("zenv.json", R"({"common": {"base_dir": "zenv", "requirements_file": "r.txt"},
        "e": {"modules_file": "nope.txt"}})");
    auto config = ZenvConfig::load(test_dir);
    ASSERT_TRUE(config.is_ok());
    auto eff = config.value.effective("e", "");
    ASSERT_TRUE(eff.is_err());
    EXPECT_EQ(eff.code, ErrorCode::ConfigReadError);
}
