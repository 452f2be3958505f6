#pragma once

#include "model/session.hpp"
#include "store/target_registry.hpp"
#include "update/collaborators.hpp"
#include "update/remediation_engine.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace genup {

struct UpdatePolicy {
    int max_remediation_attempts = 3;
    bool auto_proceed_on_critical = false;
    std::chrono::milliseconds timeout{0};  // 0 => no deadline
};

// Drives one update session per call:
//   Fetching -> RiskCheck -> Building <-> Remediating -> Activating -> Done
// with RollingBack and Aborted on failure. Sessions for the same target are
// serialised; different targets run independently.
class UpdateOrchestrator {
public:
    struct Collaborators {
        IConfigurationSource* source = nullptr;   // required
        IBuilder* builder = nullptr;              // required
        INotifier* notifier = nullptr;            // required
        IIssueRegistry* issue_registry = nullptr; // optional; risk check is skipped without it
        IGenerationCheck* validator = nullptr;    // optional, runs on the staged generation
        IGenerationCheck* health_check = nullptr; // optional, runs after activation
    };

    UpdateOrchestrator(TargetRegistry& targets, Collaborators collaborators);
    UpdateOrchestrator(TargetRegistry& targets,
                       Collaborators collaborators,
                       std::vector<RemediationEngine::RulePtr> rules);

    // Always returns a terminal session, already archived and reported.
    UpdateSession RunUpdate(const std::string& target_id,
                            const UpdatePolicy& policy,
                            const CancelToken& cancel = CancelToken());

private:
    struct Run;

    SessionState Fetch(Run& run);
    SessionState CheckRisk(Run& run);
    SessionState BuildRevision(Run& run);
    SessionState Remediate(Run& run);
    SessionState Activate(Run& run);
    SessionState RollBack(Run& run);
    SessionState OnCancelled(Run& run, SessionState interrupted);
    SessionState Exhausted(Run& run, const std::string& why);

    void Finish(UpdateSession& session, SessionState terminal, TargetState* target);

    TargetRegistry& targets_;
    Collaborators c_;
    std::vector<RemediationEngine::RulePtr> rules_;
};

} // namespace genup
