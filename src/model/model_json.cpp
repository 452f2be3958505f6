#include "model/model_json.hpp"

#include "util/json_utils.hpp"

#include <algorithm>
#include <cctype>

namespace genup {

using json = nlohmann::json;
using namespace json_utils;

namespace {

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::expected<StepResult, std::string> StepFromJson(const json& j) {
    if (!j.is_object()) return std::unexpected("step must be an object");
    StepResult s;
    std::string status;
    std::int64_t started = 0, ended = 0;
    if (!GetStringIfPresent(j, "step", s.step_name)) return std::unexpected("step missing name");
    (void)GetI64IfPresent(j, "started_at", started);
    (void)GetI64IfPresent(j, "ended_at", ended);
    s.started_at = FromEpochMillis(started);
    s.ended_at = FromEpochMillis(ended);
    if (!GetStringIfPresent(j, "status", status)) return std::unexpected("step missing status");
    auto st = ParseStepStatus(status);
    if (!st) return std::unexpected("unknown step status: " + status);
    s.status = *st;
    std::string fc;
    if (GetStringIfPresent(j, "failure_class", fc)) {
        s.failure_class = ParseFailureClass(fc);
        if (!s.failure_class) return std::unexpected("unknown failure class: " + fc);
    }
    (void)GetStringIfPresent(j, "detail", s.detail);
    (void)GetBoolIfPresent(j, "fatal", s.fatal);
    return s;
}

} // namespace

json ToJson(const Revision& r) {
    json j = json::object();
    j["id"] = r.id;
    j["target"] = r.target_id;
    if (!r.parent_id.empty()) j["parent"] = r.parent_id;
    if (!r.origin_id.empty()) j["origin"] = r.origin_id;
    j["components"] = r.components;
    j["payload"] = r.payload;
    if (!r.source_ref.empty()) j["source"] = r.source_ref;
    if (!r.applied_fixes.empty()) j["applied_fixes"] = r.applied_fixes;
    return j;
}

json ToJson(const IssueReport& r) {
    return json{
        {"component", r.component},
        {"severity", ToString(r.severity)},
        {"summary", r.summary},
        {"recommendation", ToString(r.recommendation)},
    };
}

json ToJson(const StepResult& s) {
    json j = json::object();
    j["step"] = s.step_name;
    j["started_at"] = ToEpochMillis(s.started_at);
    j["ended_at"] = ToEpochMillis(s.ended_at);
    j["status"] = ToString(s.status);
    if (s.failure_class) j["failure_class"] = ToString(*s.failure_class);
    j["detail"] = s.detail;
    if (s.fatal) j["fatal"] = true;
    return j;
}

json ToJson(const RemediationAttempt& a) {
    return json{
        {"attempt", a.attempt_number},
        {"matched_failure_class", a.matched_failure_class},
        {"transform", a.transform_applied},
        {"result", ToJson(a.resulting_step)},
    };
}

json ToJson(const UpdateSession& s) {
    json j = json::object();
    j["session_id"] = s.session_id;
    j["target"] = s.target_id;
    if (s.revision) j["revision"] = ToJson(*s.revision);
    j["started_at"] = ToEpochMillis(s.started_at);
    j["ended_at"] = ToEpochMillis(s.ended_at);
    j["outcome"] = ToString(s.outcome);
    if (s.terminal_failure) j["failure_class"] = ToString(*s.terminal_failure);
    j["remediation_attempts"] = s.remediation_attempts;

    json steps = json::array();
    for (const auto& step : s.steps) steps.push_back(ToJson(step));
    j["steps"] = std::move(steps);

    json attempts = json::array();
    for (const auto& a : s.attempts) attempts.push_back(ToJson(a));
    j["attempts"] = std::move(attempts);

    json issues = json::array();
    for (const auto& i : s.issues) issues.push_back(ToJson(i));
    j["issues"] = std::move(issues);

    j["notices"] = s.notices;
    if (s.baseline_generation) j["baseline_generation"] = *s.baseline_generation;
    if (s.result_generation) j["result_generation"] = *s.result_generation;
    j["manual_action_required"] = s.manual_action_required;
    return j;
}

json GenerationRecordToJson(const Generation& g) {
    return json{
        {"id", g.id},
        {"revision", ToJson(g.revision)},
        {"artifact", g.artifact_ref},
        {"created_at", ToEpochMillis(g.created_at)},
    };
}

std::expected<Revision, std::string> RevisionFromJson(const json& j) {
    if (!j.is_object()) return std::unexpected("revision must be an object");
    Revision r;
    if (!GetStringIfPresent(j, "id", r.id) || r.id.empty())
        return std::unexpected("revision missing id");
    (void)GetStringIfPresent(j, "target", r.target_id);
    (void)GetStringIfPresent(j, "parent", r.parent_id);
    (void)GetStringIfPresent(j, "origin", r.origin_id);
    if (HasWrongType(j, "components", json::value_t::array) ||
        (j.contains("components") && !GetStringArrayIfPresent(j, "components", r.components)))
        return std::unexpected("revision components must be an array of strings");
    NormalizeComponents(r.components);
    if (auto it = j.find("payload"); it != j.end()) r.payload = *it;
    (void)GetStringIfPresent(j, "source", r.source_ref);
    (void)GetStringArrayIfPresent(j, "applied_fixes", r.applied_fixes);
    return r;
}

std::expected<IssueReport, std::string> IssueReportFromJson(const json& j) {
    if (!j.is_object()) return std::unexpected("issue must be an object");
    IssueReport r;
    std::string severity, recommendation;
    if (!GetStringIfPresent(j, "component", r.component) || r.component.empty())
        return std::unexpected("issue missing component");
    if (!GetStringIfPresent(j, "severity", severity))
        return std::unexpected("issue missing severity: " + r.component);
    auto sev = ParseSeverity(Lower(severity));
    if (!sev) return std::unexpected("unknown severity '" + severity + "' for " + r.component);
    r.severity = *sev;
    (void)GetStringIfPresent(j, "summary", r.summary);
    if (GetStringIfPresent(j, "recommendation", recommendation)) {
        auto rec = ParseRecommendation(Lower(recommendation));
        if (!rec)
            return std::unexpected("unknown recommendation '" + recommendation + "' for " + r.component);
        r.recommendation = *rec;
    }
    return r;
}

std::expected<Generation, std::string> GenerationRecordFromJson(const json& j) {
    if (!j.is_object()) return std::unexpected("generation record must be an object");
    Generation g;
    std::uint64_t id = 0;
    if (!GetU64IfPresent(j, "id", id) || id == 0) return std::unexpected("generation record missing id");
    g.id = id;
    auto it = j.find("revision");
    if (it == j.end()) return std::unexpected("generation record missing revision");
    auto rev = RevisionFromJson(*it);
    if (!rev) return std::unexpected(rev.error());
    g.revision = std::move(*rev);
    (void)GetStringIfPresent(j, "artifact", g.artifact_ref);
    std::int64_t created = 0;
    (void)GetI64IfPresent(j, "created_at", created);
    g.created_at = FromEpochMillis(created);
    return g;
}

std::expected<UpdateSession, std::string> SessionFromJson(const json& j) {
    if (!j.is_object()) return std::unexpected("session must be an object");
    UpdateSession s;
    if (!GetStringIfPresent(j, "session_id", s.session_id))
        return std::unexpected("session missing session_id");
    (void)GetStringIfPresent(j, "target", s.target_id);
    if (auto it = j.find("revision"); it != j.end()) {
        auto rev = RevisionFromJson(*it);
        if (!rev) return std::unexpected(rev.error());
        s.revision = std::move(*rev);
    }
    std::int64_t started = 0, ended = 0;
    (void)GetI64IfPresent(j, "started_at", started);
    (void)GetI64IfPresent(j, "ended_at", ended);
    s.started_at = FromEpochMillis(started);
    s.ended_at = FromEpochMillis(ended);

    std::string outcome;
    if (!GetStringIfPresent(j, "outcome", outcome)) return std::unexpected("session missing outcome");
    auto oc = ParseSessionOutcome(outcome);
    if (!oc) return std::unexpected("unknown outcome: " + outcome);
    s.outcome = *oc;

    std::string fc;
    if (GetStringIfPresent(j, "failure_class", fc)) s.terminal_failure = ParseFailureClass(fc);

    std::int64_t attempts = 0;
    (void)GetI64IfPresent(j, "remediation_attempts", attempts);
    s.remediation_attempts = static_cast<int>(attempts);

    if (auto it = j.find("steps"); it != j.end() && it->is_array()) {
        for (const auto& item : *it) {
            auto step = StepFromJson(item);
            if (!step) return std::unexpected(step.error());
            s.steps.push_back(std::move(*step));
        }
    }
    if (auto it = j.find("attempts"); it != j.end() && it->is_array()) {
        for (const auto& item : *it) {
            RemediationAttempt a;
            a.attempt_number = item.value("attempt", 0);
            a.matched_failure_class = item.value("matched_failure_class", "");
            a.transform_applied = item.value("transform", "");
            if (auto rit = item.find("result"); rit != item.end()) {
                auto step = StepFromJson(*rit);
                if (!step) return std::unexpected(step.error());
                a.resulting_step = std::move(*step);
            }
            s.attempts.push_back(std::move(a));
        }
    }
    if (auto it = j.find("issues"); it != j.end() && it->is_array()) {
        for (const auto& item : *it) {
            auto issue = IssueReportFromJson(item);
            if (!issue) return std::unexpected(issue.error());
            s.issues.push_back(std::move(*issue));
        }
    }
    (void)GetStringArrayIfPresent(j, "notices", s.notices);
    std::uint64_t gen = 0;
    if (GetU64IfPresent(j, "baseline_generation", gen)) s.baseline_generation = gen;
    if (GetU64IfPresent(j, "result_generation", gen)) s.result_generation = gen;
    (void)GetBoolIfPresent(j, "manual_action_required", s.manual_action_required);
    return s;
}

} // namespace genup
