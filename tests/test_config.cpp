#include "testing.hpp"

#include "app/runtime.hpp"
#include "util/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

namespace {

using genup::config::OrchestratorConfig;

class ConfigTests : public ::testing::Test {
  protected:
    std::string Write(const std::string& text) {
        const std::string path = tmp.Join("genup.conf");
        testutil::WriteFile(path, text);
        return path;
    }

    testutil::TemporaryDirectory tmp;
    OrchestratorConfig cfg;
    std::string err;
};

TEST_F(ConfigTests, LoadsFullConfig) {
    const std::string path = Write(R"({
        "StateDir": "/var/lib/genup",
        "RevisionSource": "/etc/genup/targets/{target}.json",
        "BuildCommand": "genup-build",
        "ValidateCommand": "genup-validate",
        "HealthCheckCommand": "curl -fs http://localhost/health",
        "IssueDatabase": "/var/lib/genup/issues.json",
        "NotifyFile": "/var/log/genup/reports.log",
        "NotifyCommand": "mail -s genup root",
        "MaxRemediationAttempts": 5,
        "AutoProceedOnCritical": true,
        "TimeoutSeconds": 1800,
        "RemediationRules": ["no-space", "missing-dependency"],
        "LogLevel": "debug"
    })");

    ASSERT_TRUE(cfg.LoadFile(path, err)) << err;
    EXPECT_EQ(cfg.state_dir, "/var/lib/genup");
    EXPECT_EQ(cfg.revision_source, "/etc/genup/targets/{target}.json");
    EXPECT_EQ(cfg.build_command, "genup-build");
    EXPECT_EQ(cfg.validate_command, "genup-validate");
    EXPECT_EQ(cfg.issue_database, "/var/lib/genup/issues.json");
    EXPECT_EQ(cfg.max_remediation_attempts, std::optional<std::uint64_t>(5));
    EXPECT_EQ(cfg.auto_proceed_on_critical, std::optional<bool>(true));
    EXPECT_EQ(cfg.timeout_seconds, std::optional<std::uint64_t>(1800));
    ASSERT_TRUE(cfg.remediation_rules.has_value());
    EXPECT_EQ(cfg.remediation_rules->size(), 2u);
    EXPECT_EQ(cfg.log_level, std::optional<std::string>("debug"));
}

TEST_F(ConfigTests, OptionalKeysStayUnset) {
    ASSERT_TRUE(cfg.LoadFile(Write(R"({"StateDir": "/s", "RevisionSource": "/r", "BuildCommand": "b"})"), err)) << err;
    EXPECT_FALSE(cfg.max_remediation_attempts.has_value());
    EXPECT_FALSE(cfg.auto_proceed_on_critical.has_value());
    EXPECT_FALSE(cfg.remediation_rules.has_value());
    EXPECT_TRUE(cfg.issue_command.empty());
}

TEST_F(ConfigTests, MissingRequiredKey) {
    EXPECT_FALSE(cfg.LoadFile(Write(R"({"StateDir": "/s", "RevisionSource": "/r"})"), err));
    EXPECT_NE(err.find("BuildCommand"), std::string::npos);
}

TEST_F(ConfigTests, WrongTypesAreRejected) {
    const char* docs[] = {
        R"({"StateDir": 1, "RevisionSource": "/r", "BuildCommand": "b"})",
        R"({"StateDir": "/s", "RevisionSource": "/r", "BuildCommand": "b", "MaxRemediationAttempts": -1})",
        R"({"StateDir": "/s", "RevisionSource": "/r", "BuildCommand": "b", "AutoProceedOnCritical": "yes"})",
        R"({"StateDir": "/s", "RevisionSource": "/r", "BuildCommand": "b", "RemediationRules": "no-space"})",
        R"({"StateDir": "/s", "RevisionSource": "/r", "BuildCommand": "b", "LogLevel": "chatty"})",
    };
    for (const char* doc : docs) {
        err.clear();
        EXPECT_FALSE(cfg.LoadFile(Write(doc), err)) << doc;
        EXPECT_FALSE(err.empty());
    }
}

TEST_F(ConfigTests, IssueSourcesAreMutuallyExclusive) {
    EXPECT_FALSE(cfg.LoadFile(Write(R"({"StateDir": "/s", "RevisionSource": "/r", "BuildCommand": "b",
                                        "IssueDatabase": "/i", "IssueCommand": "c"})"),
                              err));
    EXPECT_NE(err.find("mutually exclusive"), std::string::npos);
}

TEST_F(ConfigTests, MissingOrGarbledFile) {
    EXPECT_FALSE(cfg.LoadFile(tmp.Join("absent.conf"), err));
    EXPECT_FALSE(cfg.LoadFile(Write("{ not json"), err));
}

TEST_F(ConfigTests, ReloadResetsPreviousValues) {
    ASSERT_TRUE(cfg.LoadFile(Write(R"({"StateDir": "/s", "RevisionSource": "/r", "BuildCommand": "b",
                                       "NotifyFile": "/n", "TimeoutSeconds": 5})"),
                             err));
    ASSERT_TRUE(cfg.LoadFile(Write(R"({"StateDir": "/s2", "RevisionSource": "/r", "BuildCommand": "b"})"), err));
    EXPECT_EQ(cfg.state_dir, "/s2");
    EXPECT_TRUE(cfg.notify_file.empty());
    EXPECT_FALSE(cfg.timeout_seconds.has_value());
}

TEST(ResolveConfigPathTests, CommandLineThenEnvironmentThenDefault) {
    ::unsetenv("GENUP_CONFIG_PATH");
    EXPECT_EQ(genup::config::ResolveConfigPath(""), genup::config::kDefaultConfigPath);
    ::setenv("GENUP_CONFIG_PATH", "/tmp/env.conf", 1);
    EXPECT_EQ(genup::config::ResolveConfigPath(""), "/tmp/env.conf");
    EXPECT_EQ(genup::config::ResolveConfigPath("/tmp/cli.conf"), "/tmp/cli.conf");
    ::unsetenv("GENUP_CONFIG_PATH");
}

TEST_F(ConfigTests, RuntimeFollowsConfig) {
    ASSERT_TRUE(cfg.LoadFile(Write(R"({"StateDir": ")" + tmp.Path() + R"(", "RevisionSource": "/r",
                                       "BuildCommand": "b", "IssueCommand": "c", "HealthCheckCommand": "h",
                                       "MaxRemediationAttempts": 1, "TimeoutSeconds": 60,
                                       "RemediationRules": ["no-space"]})"),
                             err))
        << err;

    auto rt = genup::BuildRuntime(cfg);
    ASSERT_TRUE(rt.has_value()) << rt.error();
    const auto wiring = (*rt)->Wiring();
    EXPECT_NE(wiring.source, nullptr);
    EXPECT_NE(wiring.builder, nullptr);
    EXPECT_NE(wiring.notifier, nullptr);
    EXPECT_NE(wiring.issue_registry, nullptr);
    EXPECT_NE(wiring.health_check, nullptr);
    EXPECT_EQ(wiring.validator, nullptr);
    EXPECT_EQ((*rt)->policy.max_remediation_attempts, 1);
    EXPECT_EQ((*rt)->policy.timeout, std::chrono::seconds(60));
    EXPECT_FALSE((*rt)->policy.auto_proceed_on_critical);
    ASSERT_EQ((*rt)->rules.size(), 1u);
    EXPECT_STREQ((*rt)->rules[0]->Name(), "no-space");
}

TEST_F(ConfigTests, RuntimeRejectsUnknownRule) {
    ASSERT_TRUE(cfg.LoadFile(Write(R"({"StateDir": "/s", "RevisionSource": "/r", "BuildCommand": "b",
                                       "RemediationRules": ["pray"]})"),
                             err));
    auto rt = genup::BuildRuntime(cfg);
    ASSERT_FALSE(rt.has_value());
    EXPECT_NE(rt.error().find("pray"), std::string::npos);
}

} // namespace
