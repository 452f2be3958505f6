#include "fakes.hpp"

#include "model/model_json.hpp"
#include "model/session.hpp"

#include <gtest/gtest.h>

namespace {

using nlohmann::json;

TEST(ModelJsonTests, IssueSeverityIsCaseInsensitive) {
    auto r = genup::IssueReportFromJson(
        json{{"component", "openssl"}, {"severity", "CRITICAL"}, {"recommendation", "Abort"}, {"summary", "CVE"}});
    ASSERT_TRUE(r.has_value()) << r.error();
    EXPECT_EQ(r->severity, genup::Severity::Critical);
    EXPECT_EQ(r->recommendation, genup::Recommendation::Abort);
    EXPECT_TRUE(genup::IsCriticalAbort(*r));
}

TEST(ModelJsonTests, IssueRecommendationDefaultsToProceed) {
    auto r = genup::IssueReportFromJson(json{{"component", "nginx"}, {"severity", "low"}});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->recommendation, genup::Recommendation::Proceed);
}

TEST(ModelJsonTests, IssueWithoutSeverityOrComponentIsRejected) {
    EXPECT_FALSE(genup::IssueReportFromJson(json{{"component", "nginx"}}).has_value());
    EXPECT_FALSE(genup::IssueReportFromJson(json{{"severity", "high"}}).has_value());
    EXPECT_FALSE(genup::IssueReportFromJson(json{{"component", "nginx"}, {"severity", "apocalyptic"}}).has_value());
    EXPECT_FALSE(genup::IssueReportFromJson(json::array()).has_value());
}

TEST(ModelJsonTests, RevisionComponentsAreNormalised) {
    auto r = genup::RevisionFromJson(json{{"id", "r1"}, {"components", {"zlib", "nginx", "zlib", ""}}});
    ASSERT_TRUE(r.has_value()) << r.error();
    EXPECT_EQ(r->components, (std::vector<std::string>{"nginx", "zlib"}));
    EXPECT_TRUE(r->payload.is_object());
}

TEST(ModelJsonTests, RevisionRejectsMissingIdAndBadComponents) {
    EXPECT_FALSE(genup::RevisionFromJson(json{{"components", json::array()}}).has_value());
    EXPECT_FALSE(genup::RevisionFromJson(json{{"id", "r1"}, {"components", "nginx"}}).has_value());
    EXPECT_FALSE(genup::RevisionFromJson(json{{"id", "r1"}, {"components", {1, 2}}}).has_value());
}

TEST(ModelJsonTests, DerivedRevisionKeepsLineage) {
    const genup::Revision base = testutil::MakeRevision({"nginx"});
    const genup::Revision fixed =
        genup::DeriveRevision(base, {"nginx", "libfoo"}, json{{"dependencies", {"libfoo"}}}, "missing-dependency");

    auto back = genup::RevisionFromJson(genup::ToJson(fixed));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->parent_id, base.id);
    EXPECT_EQ(back->origin_id, base.id);
    EXPECT_TRUE(back->DescendsFrom(base.id));
    EXPECT_FALSE(back->DescendsFrom("something-else"));
    EXPECT_EQ(back->applied_fixes, std::vector<std::string>{"missing-dependency"});
}

TEST(ModelJsonTests, RevisionIdIgnoresComponentOrder) {
    EXPECT_EQ(testutil::MakeRevision({"a", "b"}).id, testutil::MakeRevision({"b", "a"}).id);
    EXPECT_NE(testutil::MakeRevision({"a"}, {{"x", 1}}).id, testutil::MakeRevision({"a"}, {{"x", 2}}).id);
    EXPECT_EQ(testutil::MakeRevision({"a"}).id.size(), 32u);
}

TEST(ModelJsonTests, SessionSurvivesArchiveFormat) {
    genup::UpdateSession s;
    s.session_id = "0123456789abcdef";
    s.target_id = "web-01";
    s.revision = testutil::MakeRevision({"nginx"});
    s.started_at = genup::FromEpochMillis(1700000000123);
    s.ended_at = genup::FromEpochMillis(1700000004567);
    s.outcome = genup::SessionOutcome::RolledBack;
    s.terminal_failure = genup::FailureClass::SwitchError;
    s.manual_action_required = true;
    s.baseline_generation = 3;
    s.result_generation = 3;
    s.remediation_attempts = 1;
    genup::StepResult step;
    step.step_name = "activate";
    step.status = genup::StepStatus::Failed;
    step.failure_class = genup::FailureClass::SwitchError;
    step.detail = "rename failed";
    step.fatal = true;
    s.steps.push_back(step);
    genup::RemediationAttempt a;
    a.attempt_number = 1;
    a.matched_failure_class = "no-space";
    a.transform_applied = "no-space";
    a.resulting_step = step;
    s.attempts.push_back(a);
    s.notices.push_back("risk assessment skipped: timeout");

    auto back = genup::SessionFromJson(genup::ToJson(s));
    ASSERT_TRUE(back.has_value()) << back.error();
    EXPECT_EQ(back->session_id, s.session_id);
    EXPECT_EQ(back->outcome, genup::SessionOutcome::RolledBack);
    EXPECT_EQ(back->terminal_failure, genup::FailureClass::SwitchError);
    EXPECT_TRUE(back->manual_action_required);
    EXPECT_EQ(back->started_at, s.started_at);
    EXPECT_EQ(back->baseline_generation, std::optional<genup::GenerationId>(3));
    ASSERT_EQ(back->steps.size(), 1u);
    EXPECT_TRUE(back->steps[0].fatal);
    ASSERT_EQ(back->attempts.size(), 1u);
    EXPECT_EQ(back->attempts[0].resulting_step.step_name, "activate");
    EXPECT_EQ(back->notices, s.notices);
}

TEST(ModelJsonTests, SessionWithUnknownOutcomeIsRejected) {
    EXPECT_FALSE(genup::SessionFromJson(json{{"session_id", "x"}, {"outcome", "exploded"}}).has_value());
    EXPECT_FALSE(genup::SessionFromJson(json{{"outcome", "success"}}).has_value());
}

TEST(ModelJsonTests, EnumNames) {
    EXPECT_STREQ(genup::ToString(genup::SessionState::RolledBack), "rolled-back");
    EXPECT_STREQ(genup::ToString(genup::FailureClass::RemediationExhausted), "remediation-exhausted");
    EXPECT_EQ(genup::ParseGenerationStatus("superseded"), genup::GenerationStatus::Superseded);
    EXPECT_FALSE(genup::ParseFailureClass("nope").has_value());
    EXPECT_TRUE(genup::IsTerminal(genup::SessionState::RolledBack));
    EXPECT_FALSE(genup::IsTerminal(genup::SessionState::RollingBack));
}

} // namespace
