#include <gtest/gtest.h>
#include <managers/registry_store.hpp>
#include <managers/resolver.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace fs = std::filesystem;

class RegistryTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path registry_path;

    void SetUp() override {
        test_dir = platform::temp_file("zenv_registry_test");
        fs::create_directories(test_dir);
        registry_path = test_dir / "home" / "registry.json";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_registry(const std::string& content) {
        fs::create_directories(registry_path.parent_path());
        std::ofstream(registry_path) << content;
    }

    std::string read_registry() {
        std::ifstream in(registry_path);
        std::stringstream buf;
        buf << in.rdbuf();
        return buf.str();
    }
};

TEST_F(RegistryTest, MissingFileIsEmpty) {
    auto r = EnvironmentRegistry::load(registry_path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.entries().empty());
    EXPECT_EQ(r.value.path(), registry_path);
}

TEST_F(RegistryTest, MalformedFileIsRegistryInvalid) {
    write_registry("{\"environments\": [ {\"name\": ");
    auto r = EnvironmentRegistry::load(registry_path);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::RegistryInvalid);
}

TEST_F(RegistryTest, WrongShapeIsRegistryInvalid) {
    write_registry("{\"environments\": {\"name\": \"x\"}}");
    EXPECT_EQ(EnvironmentRegistry::load(registry_path).code, ErrorCode::RegistryInvalid);

    write_registry("{\"environments\": [{\"project_dir\": \"/p\"}]}");
    EXPECT_EQ(EnvironmentRegistry::load(registry_path).code, ErrorCode::RegistryInvalid);
}

TEST_F(RegistryTest, RegisterComputesVenvPathAndTargets) {
    EnvironmentRegistry reg(registry_path);

    auto rel = reg.register_env("gpu", "/home/u/proj", "zenv", std::string("GPU env"),
                                {"jureca", "jrlogin*"});
    EXPECT_EQ(rel.venv_path, "/home/u/proj/zenv/gpu");
    EXPECT_EQ(rel.target_machines, "jureca,jrlogin*");
    EXPECT_EQ(rel.id.size(), ID_HEX_LENGTH);
    EXPECT_EQ(rel.id.find_first_not_of("0123456789abcdef"), std::string::npos);

    auto abs = reg.register_env("cpu", "/home/u/proj", "/scratch/envs", std::nullopt, {});
    EXPECT_EQ(abs.venv_path, "/scratch/envs/cpu");
    EXPECT_EQ(abs.target_machines, "any");
    EXPECT_NE(abs.id, rel.id);
    EXPECT_EQ(reg.entries().size(), 2u);
}

TEST_F(RegistryTest, ReRegisterUpdatesInPlace) {
    EnvironmentRegistry reg(registry_path);
    auto first = reg.register_env("gpu", "/p", "zenv", std::nullopt, {"jureca"});
    auto second = reg.register_env("gpu", "/p", "envs", std::string("new"), {"juwels"});

    ASSERT_EQ(reg.entries().size(), 1u);
    EXPECT_EQ(second.id, first.id);
    EXPECT_EQ(reg.entries()[0].venv_path, "/p/envs/gpu");
    EXPECT_EQ(reg.entries()[0].target_machines, "juwels");
    EXPECT_EQ(reg.entries()[0].description.value_or(""), "new");

    // Same name in another project is a separate environment
    reg.register_env("gpu", "/other", "zenv", std::nullopt, {});
    EXPECT_EQ(reg.entries().size(), 2u);
}

TEST_F(RegistryTest, SaveLoadSaveIsStable) {
    EnvironmentRegistry reg(registry_path);
    reg.register_env("gpu", "/home/u/proj", "zenv", std::string("with \"quotes\" and \\ slash"),
                     {"jureca", "*.fz-juelich.de"});
    reg.register_env("cpu", "/home/u/other dir", "/abs", std::nullopt, {});

    ASSERT_TRUE(reg.save().is_ok());
    std::string first = read_registry();

    auto loaded = EnvironmentRegistry::load(registry_path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    ASSERT_EQ(loaded.value.entries().size(), 2u);
    ASSERT_TRUE(loaded.value.save().is_ok());

    EXPECT_EQ(read_registry(), first);
    EXPECT_EQ(loaded.value.entries()[0].description.value_or(""), "with \"quotes\" and \\ slash");
    EXPECT_FALSE(loaded.value.entries()[1].description.has_value());
    EXPECT_EQ(loaded.value.entries()[1].project_dir, "/home/u/other dir");
}

TEST_F(RegistryTest, ControlCharactersSurviveSaveAndLoad) {
    const std::string description = "tab\there \x01 ctl \xc3\xa9";
    EnvironmentRegistry reg(registry_path);
    reg.register_env("gpu", "/p", "zenv", description, {});
    ASSERT_TRUE(reg.save().is_ok());

    std::string text = read_registry();
    EXPECT_NE(text.find("\\u0001"), std::string::npos) << text;
    EXPECT_EQ(text.find("\\x01"), std::string::npos) << text;

    auto loaded = EnvironmentRegistry::load(registry_path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.entries()[0].description.value_or(""), description);
}

TEST_F(RegistryTest, SaveCreatesParentAndLeavesNoTempFiles) {
    EnvironmentRegistry reg(registry_path);
    reg.register_env("gpu", "/p", "zenv", std::nullopt, {});
    ASSERT_TRUE(reg.save().is_ok());

    size_t files = 0;
    for (const auto& entry : fs::directory_iterator(registry_path.parent_path())) {
        (void)entry;
        files++;
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(RegistryTest, LegacyEntries) {
    write_registry(R"({"environments": [
        {"name": "old", "project_dir": "/proj", "target_machine": "jureca"},
        {"id": "0123456789abcdef0123456789abcdef01234567", "name": "new",
         "project_dir": "/proj", "target_machines": "juwels", "venv_path": "/envs/new"}
    ]})");

    auto r = EnvironmentRegistry::load(registry_path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& old = r.value.entries()[0];
    EXPECT_EQ(old.id.size(), ID_HEX_LENGTH);
    EXPECT_EQ(old.venv_path, "/proj/zenv/old");
    EXPECT_EQ(old.target_machines, "jureca");

    const auto& fresh = r.value.entries()[1];
    EXPECT_EQ(fresh.id, "0123456789abcdef0123456789abcdef01234567");
    EXPECT_EQ(fresh.venv_path, "/envs/new");
    EXPECT_EQ(fresh.targets(), (std::vector<std::string>{"juwels"}));
}

TEST_F(RegistryTest, LegacyIdIsSameOnEveryLoad) {
    write_registry(R"({"environments":[{"name":"gpu","project_dir":"/p","target_machine":"jureca"}]})");

    auto first = EnvironmentRegistry::load(registry_path);
    auto second = EnvironmentRegistry::load(registry_path);
    ASSERT_TRUE(first.is_ok()) << first.error;
    ASSERT_TRUE(second.is_ok()) << second.error;

    const std::string id = first.value.entries()[0].id;
    EXPECT_EQ(id.size(), ID_HEX_LENGTH);
    EXPECT_EQ(second.value.entries()[0].id, id);
    EXPECT_EQ(EnvironmentRegistry::derived_id("gpu", "/p", "jureca"), id);

    auto found = resolve(second.value, first.value.entries()[0].short_id(), "/elsewhere");
    ASSERT_TRUE(found.is_ok()) << found.error;
    EXPECT_EQ(found.value->env_name, "gpu");
}

TEST_F(RegistryTest, LookupIsExactOnly) {
    EnvironmentRegistry reg(registry_path);
    auto e = reg.register_env("gpu", "/p", "zenv", std::nullopt, {});

    ASSERT_NE(reg.lookup("gpu"), nullptr);
    ASSERT_NE(reg.lookup(e.id), nullptr);
    EXPECT_EQ(reg.lookup(e.id)->env_name, "gpu");
    EXPECT_EQ(reg.lookup(e.id.substr(0, 10)), nullptr);
    EXPECT_EQ(reg.lookup("gp"), nullptr);
}

TEST_F(RegistryTest, DeregisterRemovesOnlyThatEntry) {
    EnvironmentRegistry reg(registry_path);
    reg.register_env("gpu", "/p", "zenv", std::nullopt, {});
    auto cpu = reg.register_env("cpu", "/p", "zenv", std::nullopt, {});

    auto removed = reg.deregister(cpu.id, "/elsewhere");
    ASSERT_TRUE(removed.is_ok()) << removed.error;
    EXPECT_EQ(removed.value.env_name, "cpu");
    ASSERT_EQ(reg.entries().size(), 1u);
    EXPECT_EQ(reg.entries()[0].env_name, "gpu");
}

TEST_F(RegistryTest, DeregisterUnknownDoesNotWrite) {
    EnvironmentRegistry reg(registry_path);
    reg.register_env("gpu", "/p", "zenv", std::nullopt, {});

    auto removed = reg.deregister("nothing-here", "/p");
    ASSERT_TRUE(removed.is_err());
    EXPECT_EQ(removed.code, ErrorCode::NotFound);
    EXPECT_EQ(reg.entries().size(), 1u);
    EXPECT_FALSE(fs::exists(registry_path));
}

TEST_F(RegistryTest, GeneratedIdsDiffer) {
    auto a = EnvironmentRegistry::generate_id("gpu", "/p", "any");
    auto b = EnvironmentRegistry::generate_id("gpu", "/p", "any");
    EXPECT_EQ(a.size(), ID_HEX_LENGTH);
    EXPECT_NE(a, b);
}

TEST(RegistryPath, HonoursZenvDir) {
    setenv("ZENV_DIR", "/tmp/zenv_home_override", 1);
    EXPECT_EQ(get_registry_path(), fs::path("/tmp/zenv_home_override") / "registry.json");

    unsetenv("ZENV_DIR");
    EXPECT_EQ(get_registry_path().filename(), "registry.json");
    EXPECT_EQ(get_registry_path().parent_path().filename(), ".zenv");
}
