#pragma once

#include "model/generation.hpp"
#include "model/issue.hpp"
#include "model/revision.hpp"
#include "util/time_utils.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace genup {

enum class SessionState {
    Fetching,
    RiskCheck,
    Building,
    Remediating,
    Activating,
    RollingBack,
    Done,
    Aborted,
    RolledBack,
};

enum class SessionOutcome { Pending, Success, RolledBack, Aborted };

enum class StepStatus { Ok, Failed };

enum class FailureClass {
    FetchError,
    RiskAbortError,
    BuildError,
    RemediationExhausted,
    ValidationError,
    SwitchError,
    Cancelled,
};

const char* ToString(SessionState s);
const char* ToString(SessionOutcome o);
const char* ToString(StepStatus s);
const char* ToString(FailureClass f);
std::optional<SessionOutcome> ParseSessionOutcome(std::string_view s);
std::optional<StepStatus> ParseStepStatus(std::string_view s);
std::optional<FailureClass> ParseFailureClass(std::string_view s);

inline bool IsTerminal(SessionState s) {
    return s == SessionState::Done || s == SessionState::Aborted || s == SessionState::RolledBack;
}

struct StepResult {
    std::string step_name;
    SystemTime started_at{};
    SystemTime ended_at{};
    StepStatus status = StepStatus::Ok;
    std::optional<FailureClass> failure_class;
    std::string detail;
    bool fatal = false;  // needs a human; never retried
};

struct RemediationAttempt {
    int attempt_number = 0;
    std::string matched_failure_class;
    std::string transform_applied;  // rule name, empty when nothing matched
    StepResult resulting_step;
};

// One orchestration run. Owned by the orchestrator while it runs; after the
// outcome is set it is only read (archived, reported).
struct UpdateSession {
    std::string session_id;
    std::string target_id;
    std::optional<Revision> revision;
    SystemTime started_at{};
    SystemTime ended_at{};
    std::vector<StepResult> steps;
    int remediation_attempts = 0;
    std::vector<RemediationAttempt> attempts;
    SessionOutcome outcome = SessionOutcome::Pending;

    std::optional<FailureClass> terminal_failure;
    std::vector<std::string> notices;
    std::vector<IssueReport> issues;
    std::optional<GenerationId> baseline_generation;  // Active when the session started
    std::optional<GenerationId> result_generation;    // Active when the session ended
    bool manual_action_required = false;

    bool IsTerminal() const { return outcome != SessionOutcome::Pending; }
};

} // namespace genup
