#include "model/generation.hpp"
#include "model/issue.hpp"
#include "model/session.hpp"

#include <array>
#include <utility>

namespace genup {

namespace {

template <typename E, size_t N>
std::optional<E> Lookup(const std::array<std::pair<E, const char*>, N>& table, std::string_view s) {
    for (const auto& [value, name] : table) {
        if (s == name) return value;
    }
    return std::nullopt;
}

template <typename E, size_t N>
const char* Name(const std::array<std::pair<E, const char*>, N>& table, E value) {
    for (const auto& [v, name] : table) {
        if (v == value) return name;
    }
    return "unknown";
}

constexpr std::array<std::pair<Severity, const char*>, 4> kSeverities{{
    {Severity::Low, "low"},
    {Severity::Medium, "medium"},
    {Severity::High, "high"},
    {Severity::Critical, "critical"},
}};

constexpr std::array<std::pair<Recommendation, const char*>, 4> kRecommendations{{
    {Recommendation::Proceed, "proceed"},
    {Recommendation::Caution, "caution"},
    {Recommendation::Delay, "delay"},
    {Recommendation::Abort, "abort"},
}};

constexpr std::array<std::pair<GenerationStatus, const char*>, 4> kGenerationStatuses{{
    {GenerationStatus::Pending, "pending"},
    {GenerationStatus::Active, "active"},
    {GenerationStatus::Superseded, "superseded"},
    {GenerationStatus::RolledBack, "rolled-back"},
}};

constexpr std::array<std::pair<SessionState, const char*>, 9> kStates{{
    {SessionState::Fetching, "fetching"},
    {SessionState::RiskCheck, "risk-check"},
    {SessionState::Building, "building"},
    {SessionState::Remediating, "remediating"},
    {SessionState::Activating, "activating"},
    {SessionState::RollingBack, "rolling-back"},
    {SessionState::Done, "done"},
    {SessionState::Aborted, "aborted"},
    {SessionState::RolledBack, "rolled-back"},
}};

constexpr std::array<std::pair<SessionOutcome, const char*>, 4> kOutcomes{{
    {SessionOutcome::Pending, "pending"},
    {SessionOutcome::Success, "success"},
    {SessionOutcome::RolledBack, "rolled-back"},
    {SessionOutcome::Aborted, "aborted"},
}};

constexpr std::array<std::pair<StepStatus, const char*>, 2> kStepStatuses{{
    {StepStatus::Ok, "ok"},
    {StepStatus::Failed, "failed"},
}};

constexpr std::array<std::pair<FailureClass, const char*>, 7> kFailureClasses{{
    {FailureClass::FetchError, "fetch-error"},
    {FailureClass::RiskAbortError, "risk-abort-error"},
    {FailureClass::BuildError, "build-error"},
    {FailureClass::RemediationExhausted, "remediation-exhausted"},
    {FailureClass::ValidationError, "validation-error"},
    {FailureClass::SwitchError, "switch-error"},
    {FailureClass::Cancelled, "cancelled"},
}};

} // namespace

const char* ToString(Severity s) { return Name(kSeverities, s); }
const char* ToString(Recommendation r) { return Name(kRecommendations, r); }
const char* ToString(GenerationStatus s) { return Name(kGenerationStatuses, s); }
const char* ToString(SessionState s) { return Name(kStates, s); }
const char* ToString(SessionOutcome o) { return Name(kOutcomes, o); }
const char* ToString(StepStatus s) { return Name(kStepStatuses, s); }
const char* ToString(FailureClass f) { return Name(kFailureClasses, f); }

std::optional<Severity> ParseSeverity(std::string_view s) { return Lookup(kSeverities, s); }
std::optional<Recommendation> ParseRecommendation(std::string_view s) {
    return Lookup(kRecommendations, s);
}
std::optional<GenerationStatus> ParseGenerationStatus(std::string_view s) {
    return Lookup(kGenerationStatuses, s);
}
std::optional<SessionOutcome> ParseSessionOutcome(std::string_view s) { return Lookup(kOutcomes, s); }
std::optional<StepStatus> ParseStepStatus(std::string_view s) { return Lookup(kStepStatuses, s); }
std::optional<FailureClass> ParseFailureClass(std::string_view s) {
    return Lookup(kFailureClasses, s);
}

} // namespace genup
