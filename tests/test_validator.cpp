#include <gtest/gtest.h>
#include <core/validator.hpp>

static EffectiveConfig make_effective() {
    EffectiveConfig eff;
    eff.name = "gpu";
    eff.python_executable = "python3";
    eff.base_dir = "zenv";
    eff.requirements_file = "requirements.txt";
    eff.target_machines = {"jureca", "jrlogin*"};
    eff.modules = {"GCC", "Python"};
    eff.dependencies = {"numpy"};
    return eff;
}

static std::vector<HostnameSource> fixed_host(const std::string& host) {
    return {[host] { return host; }};
}

TEST(Validator, AcceptsWellFormedEnvironment) {
    EXPECT_TRUE(validate_environment(make_effective()).is_ok());
}

TEST(Validator, RejectsEmptyFields) {
    auto eff = make_effective();
    eff.python_executable = "";
    EXPECT_EQ(validate_environment(eff).code, ErrorCode::ConfigSchemaInvalid);

    eff = make_effective();
    eff.base_dir = " ";
    EXPECT_EQ(validate_environment(eff).code, ErrorCode::ConfigSchemaInvalid);

    eff = make_effective();
    eff.target_machines.push_back("");
    EXPECT_EQ(validate_environment(eff).code, ErrorCode::ConfigSchemaInvalid);

    eff = make_effective();
    eff.modules = {"GCC", ""};
    EXPECT_EQ(validate_environment(eff).code, ErrorCode::ConfigSchemaInvalid);

    eff = make_effective();
    eff.dependencies = {""};
    EXPECT_EQ(validate_environment(eff).code, ErrorCode::ConfigSchemaInvalid);
}

TEST(Validator, RejectsBadVariableNames) {
    auto eff = make_effective();
    eff.custom_activate_vars = {{"GOOD_NAME", "1"}};
    EXPECT_TRUE(validate_environment(eff).is_ok());

    eff.custom_activate_vars = {{"1BAD", "1"}};
    EXPECT_EQ(validate_environment(eff).code, ErrorCode::ConfigSchemaInvalid);

    eff.custom_activate_vars = {{"BAD-NAME", "1"}};
    EXPECT_EQ(validate_environment(eff).code, ErrorCode::ConfigSchemaInvalid);
}

TEST(Validator, Eligibility) {
    auto eff = make_effective();
    EXPECT_TRUE(is_eligible(eff, "login03.jureca.fz-juelich.de"));
    EXPECT_TRUE(is_eligible(eff, "jrlogin08"));
    EXPECT_FALSE(is_eligible(eff, "juwels01.juwels"));

    eff.target_machines.clear();
    EXPECT_TRUE(is_eligible(eff, "juwels01.juwels"));
}

TEST(Validator, CheckMachineMismatch) {
    auto eff = make_effective();
    eff.target_machines = {"jrlogin*"};
    auto r = check_machine(eff, HostCheckPolicy{}, fixed_host("login03.jureca.fz-juelich.de"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::TargetMachineMismatch);
    EXPECT_NE(r.error.find("jrlogin*"), std::string::npos);
    EXPECT_NE(error_hint(r.code).find("--no-host"), std::string::npos);
}

TEST(Validator, CheckMachineMatch) {
    auto r = check_machine(make_effective(), HostCheckPolicy{}, fixed_host("jrlogin08.jureca"));
    EXPECT_TRUE(r.is_ok()) << r.error;
}

TEST(Validator, BypassSkipsHostnameEntirely) {
    auto eff = make_effective();
    eff.target_machines = {"nowhere"};
    bool asked = false;
    std::vector<HostnameSource> sources = {[&asked] { asked = true; return std::string("x"); }};

    auto r = check_machine(eff, HostCheckPolicy{true}, sources);
    EXPECT_TRUE(r.is_ok());
    EXPECT_FALSE(asked);
}

TEST(Validator, MissingHostname) {
    auto r = check_machine(make_effective(), HostCheckPolicy{}, fixed_host(""));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::MissingHostname);
}
