#include "fakes.hpp"

#include "update/builder_adapter.hpp"
#include "update/remediation_engine.hpp"
#include "update/remediation_rules.hpp"

#include <gtest/gtest.h>

#include <memory>

namespace {

using genup::BuildError;
using genup::RemediationEngine;
using nlohmann::json;

BuildError Failure(const char* cls, std::map<std::string, std::string> hints = {}) {
    BuildError e;
    e.exit_code = 1;
    e.failure_class = cls;
    e.hints = std::move(hints);
    return e;
}

class RemediationEngineTests : public ::testing::Test {
  protected:
    RemediationEngine engine{3};
    genup::Revision base = testutil::MakeRevision({"nginx"}, json{{"options", json::object()}});
};

TEST_F(RemediationEngineTests, MissingDependencyAddsComponent) {
    auto r = engine.Remediate(base, Failure(genup::kFailureMissingDependency, {{"dependency", "libfoo"}}), 1);
    ASSERT_TRUE(r.has_value()) << r.error().detail;
    EXPECT_EQ(r->rule, genup::kFailureMissingDependency);
    EXPECT_TRUE(r->revision.HasComponent("libfoo"));
    EXPECT_TRUE(r->revision.HasComponent("nginx"));
    EXPECT_EQ(r->revision.payload["dependencies"], json::array({"libfoo"}));
    EXPECT_EQ(r->revision.parent_id, base.id);
    EXPECT_TRUE(r->revision.DescendsFrom(base.id));
    EXPECT_EQ(r->revision.applied_fixes, std::vector<std::string>{"missing-dependency"});
    EXPECT_NE(r->revision.id, base.id);
}

TEST_F(RemediationEngineTests, MissingDependencyAlreadyDeclaredIsTransformFailure) {
    auto first = engine.Remediate(base, Failure(genup::kFailureMissingDependency, {{"dependency", "libfoo"}}), 1);
    ASSERT_TRUE(first.has_value());
    auto second =
        engine.Remediate(first->revision, Failure(genup::kFailureMissingDependency, {{"dependency", "libfoo"}}), 2);
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().reason, RemediationEngine::MissReason::TransformFailed);
}

TEST_F(RemediationEngineTests, HashMismatchReplacesPinnedHash) {
    base = testutil::MakeRevision({"app"}, json{{"sources", {{"app", {{"hash", "sha256-old"}}}}}});
    auto r = engine.Remediate(
        base, Failure(genup::kFailureHashMismatch, {{"specified", "sha256-old"}, {"got", "sha256-new"}}), 1);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->revision.payload["sources"]["app"]["hash"], "sha256-new");
}

TEST_F(RemediationEngineTests, HashMismatchWithoutHintsCannotTransform) {
    auto r = engine.Remediate(base, Failure(genup::kFailureHashMismatch), 1);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().reason, RemediationEngine::MissReason::TransformFailed);
}

TEST_F(RemediationEngineTests, NoSpaceEnablesGarbageCollectionOnce) {
    auto r = engine.Remediate(base, Failure(genup::kFailureNoSpace), 1);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->revision.payload["build"]["collect_garbage"], true);

    auto again = engine.Remediate(r->revision, Failure(genup::kFailureNoSpace), 2);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().reason, RemediationEngine::MissReason::TransformFailed);
}

TEST_F(RemediationEngineTests, ObsoleteOptionRemovesFlatAndNestedKeys) {
    base = testutil::MakeRevision(
        {"svc"}, json{{"options", {{"services.foo.legacy", true}, {"services", {{"bar", {{"old", 1}, {"keep", 2}}}}}}}});

    auto flat = engine.Remediate(base, Failure(genup::kFailureObsoleteOption, {{"option", "services.foo.legacy"}}), 1);
    ASSERT_TRUE(flat.has_value());
    EXPECT_FALSE(flat->revision.payload["options"].contains("services.foo.legacy"));

    auto nested =
        engine.Remediate(flat->revision, Failure(genup::kFailureObsoleteOption, {{"option", "services.bar.old"}}), 2);
    ASSERT_TRUE(nested.has_value());
    EXPECT_FALSE(nested->revision.payload["options"]["services"]["bar"].contains("old"));
    EXPECT_EQ(nested->revision.payload["options"]["services"]["bar"]["keep"], 2);
    EXPECT_EQ(nested->revision.applied_fixes.size(), 2u);
    EXPECT_EQ(nested->revision.origin_id, base.id);
}

TEST_F(RemediationEngineTests, UnknownFailureMatchesNoRule) {
    auto r = engine.Remediate(base, Failure(genup::kFailureUnknown), 1);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().reason, RemediationEngine::MissReason::NoRuleMatched);
    EXPECT_STREQ(genup::ToString(r.error().reason), "no-rule-matched");
}

TEST_F(RemediationEngineTests, AttemptAboveLimitIsRefused) {
    auto r = engine.Remediate(base, Failure(genup::kFailureNoSpace), 4);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().reason, RemediationEngine::MissReason::AttemptLimitReached);
}

TEST(RemediationEngineLimitTests, ZeroAttemptsNeverRemediates) {
    RemediationEngine engine(0);
    auto r = engine.Remediate(testutil::MakeRevision({"a"}), Failure(genup::kFailureNoSpace), 1);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().reason, RemediationEngine::MissReason::AttemptLimitReached);
}

class IdentityRule final : public RemediationEngine::IRule {
  public:
    const char* Name() const override { return "identity"; }
    bool Matches(const BuildError&) const override { return true; }
    std::optional<genup::Revision> Apply(const genup::Revision& r, const BuildError&) const override { return r; }
};

TEST(RemediationEngineRuleTests, UnchangedRevisionIsTransformFailure) {
    RemediationEngine engine({std::make_shared<IdentityRule>()}, 3);
    auto r = engine.Remediate(testutil::MakeRevision({"a"}), Failure(genup::kFailureUnknown), 1);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().reason, RemediationEngine::MissReason::TransformFailed);
}

TEST(RemediationEngineRuleTests, FirstMatchingRuleWins) {
    auto only_space = genup::SelectRemediationRules({"no-space"});
    ASSERT_TRUE(only_space.has_value());
    std::vector<RemediationEngine::RulePtr> rules = *only_space;
    rules.push_back(std::make_shared<IdentityRule>());
    RemediationEngine engine(rules, 3);

    auto r = engine.Remediate(testutil::MakeRevision({"a"}), Failure(genup::kFailureNoSpace), 1);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->rule, "no-space");
    EXPECT_EQ(engine.RuleNames(), (std::vector<std::string>{"no-space", "identity"}));
}

TEST(RemediationRulesTests, DefaultRuleNames) {
    RemediationEngine engine(3);
    EXPECT_EQ(engine.RuleNames(),
              (std::vector<std::string>{"missing-dependency", "hash-mismatch", "no-space", "obsolete-option"}));
}

TEST(RemediationRulesTests, SelectRejectsUnknownName) {
    auto r = genup::SelectRemediationRules({"no-space", "reboot-and-pray"});
    ASSERT_FALSE(r.has_value());
    EXPECT_NE(r.error().find("reboot-and-pray"), std::string::npos);
}

} // namespace
