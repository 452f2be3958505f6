#include "update/update_orchestrator.hpp"

#include "update/builder_adapter.hpp"
#include "update/issue_detector.hpp"
#include "update/remediation_rules.hpp"
#include "update/reporter.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <mutex>
#include <random>
#include <stdexcept>
#include <thread>
#include <utility>

namespace genup {

namespace {

std::string NewSessionId() {
    std::random_device rd;
    const auto ticks = static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
    std::mt19937_64 gen((static_cast<std::uint64_t>(rd()) << 32) ^ rd() ^ ticks);
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(gen()));
    return buf;
}

constexpr std::chrono::milliseconds kSessionWaitPoll{20};

std::string CancelledWhy(const CancelToken& token, const std::string& during) {
    return std::string(token.Reason() == CancelReason::TimedOut ? "session timed out" : "session cancelled") +
           " during " + during;
}

class StepClock {
public:
    explicit StepClock(std::string name)
        : name_(std::move(name)), started_(std::chrono::system_clock::now()) {}

    StepResult Ok(std::string detail) const {
        return Make(StepStatus::Ok, std::nullopt, std::move(detail), false);
    }

    StepResult Failed(FailureClass fc, std::string detail, bool fatal = false) const {
        return Make(StepStatus::Failed, fc, std::move(detail), fatal);
    }

private:
    StepResult Make(StepStatus status, std::optional<FailureClass> fc, std::string detail, bool fatal) const {
        StepResult s;
        s.step_name = name_;
        s.started_at = started_;
        s.ended_at = std::chrono::system_clock::now();
        s.status = status;
        s.failure_class = fc;
        s.detail = std::move(detail);
        s.fatal = fatal;
        return s;
    }

    std::string name_;
    SystemTime started_;
};

const StepResult& Record(UpdateSession& session, StepResult step) {
    if (step.status == StepStatus::Ok) {
        LogInfo("Step %s ok: %s", step.step_name.c_str(), step.detail.c_str());
    } else if (step.fatal) {
        LogError("Step %s FATAL (%s): %s", step.step_name.c_str(),
                 step.failure_class ? ToString(*step.failure_class) : "-", step.detail.c_str());
    } else {
        LogWarn("Step %s failed (%s): %s", step.step_name.c_str(),
                step.failure_class ? ToString(*step.failure_class) : "-", step.detail.c_str());
    }
    session.steps.push_back(std::move(step));
    return session.steps.back();
}

// A switch failure leaves the target in a state nobody verified.
void MarkFatal(UpdateSession& session, FailureClass fc) {
    session.terminal_failure = fc;
    session.manual_action_required = true;
}

SessionOutcome OutcomeFor(SessionState terminal) {
    switch (terminal) {
        case SessionState::Done: return SessionOutcome::Success;
        case SessionState::RolledBack: return SessionOutcome::RolledBack;
        default: return SessionOutcome::Aborted;
    }
}

} // namespace

struct UpdateOrchestrator::Run {
    Run(UpdateSession& s, TargetState& t, const UpdatePolicy& p, CancelToken c, IBuilder& b,
        IIssueRegistry* registry, std::vector<RemediationEngine::RulePtr> rules)
        : session(s),
          target(t),
          policy(p),
          cancel(std::move(c)),
          builder(b),
          detector(registry, IssueDetector::Options{.auto_proceed_on_critical = p.auto_proceed_on_critical}),
          engine(std::move(rules), p.max_remediation_attempts) {}

    UpdateSession& session;
    TargetState& target;
    const UpdatePolicy& policy;
    CancelToken cancel;
    BuilderAdapter builder;
    IssueDetector detector;
    RemediationEngine engine;

    Revision revision;  // the candidate currently being built
    std::optional<BuildError> last_failure;
    std::string artifact;
    std::optional<Generation> staged;
    bool reached_activation = false;
    bool activated = false;
    std::optional<size_t> open_attempt;  // attempt waiting for its rebuild result
};

UpdateOrchestrator::UpdateOrchestrator(TargetRegistry& targets, Collaborators collaborators)
    : UpdateOrchestrator(targets, collaborators, CreateDefaultRemediationRules()) {}

UpdateOrchestrator::UpdateOrchestrator(TargetRegistry& targets,
                                       Collaborators collaborators,
                                       std::vector<RemediationEngine::RulePtr> rules)
    : targets_(targets), c_(collaborators), rules_(std::move(rules)) {
    if (!c_.source || !c_.builder || !c_.notifier)
        throw std::invalid_argument("UpdateOrchestrator needs a configuration source, a builder and a notifier");
}

UpdateSession UpdateOrchestrator::RunUpdate(const std::string& target_id,
                                            const UpdatePolicy& policy,
                                            const CancelToken& cancel) {
    UpdateSession session;
    session.session_id = NewSessionId();
    session.target_id = target_id;
    session.started_at = std::chrono::system_clock::now();

    ScopedLogContext log_context(target_id + "/" + session.session_id.substr(0, 8));

    StepClock open_step("open-target");
    auto target = targets_.Get(target_id);
    if (!target) {
        if (TargetRegistry::IsValidTargetId(target_id)) {
            Record(session, open_step.Failed(FailureClass::SwitchError, target.error(), true));
            MarkFatal(session, FailureClass::SwitchError);
        } else {
            Record(session, open_step.Failed(FailureClass::FetchError, target.error()));
            session.terminal_failure = FailureClass::FetchError;
        }
        Finish(session, SessionState::Aborted, nullptr);
        return session;
    }
    TargetState& state = **target;

    // The session timeout also covers waiting for another session on the same target.
    CancelToken token = policy.timeout.count() > 0 ? cancel.WithTimeout(policy.timeout) : cancel.Child();

    std::unique_lock<std::mutex> session_lock(state.session_mu, std::try_to_lock);
    if (!session_lock.owns_lock()) {
        LogInfo("Another session is running on %s, waiting", target_id.c_str());
        StepClock wait_step("wait-for-target");
        while (!session_lock.try_lock()) {
            if (token.IsCancelled()) {
                const std::string why = CancelledWhy(token, "wait for target");
                Record(session, wait_step.Failed(FailureClass::Cancelled, why));
                session.terminal_failure = FailureClass::Cancelled;
                session.notices.push_back(why);
                if (auto current = state.store.Current())
                    session.baseline_generation = current->id;
                Finish(session, SessionState::Aborted, &state);
                return session;
            }
            std::this_thread::sleep_for(kSessionWaitPoll);
        }
    }

    if (auto current = state.store.Current())
        session.baseline_generation = current->id;

    LogInfo("Update session %s started (baseline generation %s, max attempts %d, auto-proceed-on-critical %s)",
            session.session_id.c_str(),
            session.baseline_generation ? std::to_string(*session.baseline_generation).c_str() : "none",
            policy.max_remediation_attempts,
            policy.auto_proceed_on_critical ? "on" : "off");

    Run run(session, state, policy, token, *c_.builder, c_.issue_registry, rules_);

    SessionState st = SessionState::Fetching;
    while (!IsTerminal(st)) {
        if (st != SessionState::RollingBack && run.cancel.IsCancelled()) {
            st = OnCancelled(run, st);
            continue;
        }
        LogDebug("State %s", ToString(st));
        switch (st) {
            case SessionState::Fetching: st = Fetch(run); break;
            case SessionState::RiskCheck: st = CheckRisk(run); break;
            case SessionState::Building: st = BuildRevision(run); break;
            case SessionState::Remediating: st = Remediate(run); break;
            case SessionState::Activating: st = Activate(run); break;
            case SessionState::RollingBack: st = RollBack(run); break;
            case SessionState::Done:
            case SessionState::Aborted:
            case SessionState::RolledBack:
                break;
        }
    }

    Finish(session, st, &state);
    return session;
}

SessionState UpdateOrchestrator::Fetch(Run& run) {
    UpdateSession& session = run.session;
    StepClock step("fetch");

    std::expected<Revision, std::string> fetched;
    try {
        fetched = c_.source->FetchLatest(session.target_id, run.cancel);
    } catch (const std::exception& e) {
        fetched = std::unexpected(std::string("configuration source threw: ") + e.what());
    }
    if (!fetched) {
        if (run.cancel.IsCancelled())
            return SessionState::Fetching;  // reported by OnCancelled
        Record(session, step.Failed(FailureClass::FetchError, fetched.error()));
        session.terminal_failure = FailureClass::FetchError;
        return SessionState::Aborted;
    }
    if (fetched->id.empty()) {
        Record(session, step.Failed(FailureClass::FetchError, "configuration source returned a revision without id"));
        session.terminal_failure = FailureClass::FetchError;
        return SessionState::Aborted;
    }
    if (fetched->target_id.empty())
        fetched->target_id = session.target_id;
    NormalizeComponents(fetched->components);

    run.revision = std::move(*fetched);
    session.revision = run.revision;
    Record(session, step.Ok("revision " + run.revision.id + " with " +
                            std::to_string(run.revision.components.size()) + " component(s)" +
                            (run.revision.source_ref.empty() ? "" : " from " + run.revision.source_ref)));

    const auto current = run.target.store.Current();
    if (current && current->revision.DescendsFrom(run.revision.id)) {
        StepClock noop("up-to-date");
        Record(session, noop.Ok("revision " + run.revision.id + " is already active as generation " +
                                std::to_string(current->id)));
        session.revision = current->revision;
        return SessionState::Done;
    }
    return SessionState::RiskCheck;
}

SessionState UpdateOrchestrator::CheckRisk(Run& run) {
    UpdateSession& session = run.session;
    StepClock step("risk-check");

    RiskVerdict verdict = run.detector.Evaluate(run.revision, run.cancel);
    session.issues = verdict.reports;

    if (!verdict.assessed) {
        if (run.cancel.IsCancelled())
            return SessionState::RiskCheck;
        session.notices.push_back("risk assessment skipped: " + verdict.skip_reason);
        Record(session, step.Ok("skipped: " + verdict.skip_reason));
        return SessionState::Building;
    }

    if (verdict.blocking) {
        std::string detail = "critical issue(s) recommend aborting:";
        for (const auto& r : verdict.reports) {
            if (IsCriticalAbort(r))
                detail += " " + r.component + " (" + r.summary + ")";
        }
        Record(session, step.Failed(FailureClass::RiskAbortError, detail));
        session.terminal_failure = FailureClass::RiskAbortError;
        return SessionState::Aborted;
    }

    if (verdict.critical_abort)
        session.notices.push_back("proceeding despite critical issue(s): auto-proceed-on-critical is enabled");
    for (const auto& r : verdict.reports) {
        if (r.recommendation == Recommendation::Delay || r.recommendation == Recommendation::Caution) {
            session.notices.push_back(r.component + ": " + ToString(r.recommendation) + " (" +
                                      ToString(r.severity) + ") " + r.summary);
        }
    }

    Record(session, step.Ok(std::to_string(verdict.reports.size()) + " issue(s), worst severity " +
                            (verdict.worst ? ToString(*verdict.worst) : "none")));
    return SessionState::Building;
}

SessionState UpdateOrchestrator::BuildRevision(Run& run) {
    UpdateSession& session = run.session;
    StepClock step("build");

    std::expected<std::string, BuildError> built;
    try {
        built = run.builder.Build(run.revision, run.cancel);
    } catch (const std::exception& e) {
        BuildError err;
        err.log = std::string("builder threw: ") + e.what();
        ClassifyBuildFailure(err);
        built = std::unexpected(std::move(err));
    }

    auto close_attempt = [&run](const StepResult& result) {
        if (run.open_attempt) {
            run.session.attempts[*run.open_attempt].resulting_step = result;
            run.open_attempt.reset();
        }
    };

    if (built) {
        close_attempt(Record(session, step.Ok("revision " + run.revision.id + " -> " + *built)));
        run.artifact = std::move(*built);
        return SessionState::Activating;
    }

    if (built.error().cancelled && run.cancel.IsCancelled()) {
        close_attempt(Record(session, step.Failed(FailureClass::Cancelled,
                                                  "build of " + run.revision.id + " interrupted")));
        return SessionState::Building;  // OnCancelled decides where to go
    }

    close_attempt(Record(session, step.Failed(FailureClass::BuildError,
                                              run.revision.id + ": " + built.error().Summary())));
    run.last_failure = std::move(built.error());

    if (session.remediation_attempts >= run.engine.MaxAttempts()) {
        return Exhausted(run, "remediation attempt limit (" + std::to_string(run.engine.MaxAttempts()) +
                                  ") reached");
    }
    return SessionState::Remediating;
}

SessionState UpdateOrchestrator::Remediate(Run& run) {
    UpdateSession& session = run.session;
    StepClock step("remediate");

    const int attempt_number = session.remediation_attempts + 1;
    session.remediation_attempts = attempt_number;

    RemediationAttempt attempt;
    attempt.attempt_number = attempt_number;
    attempt.matched_failure_class = run.last_failure ? run.last_failure->failure_class : std::string();

    if (!run.last_failure) {
        attempt.resulting_step = Record(session, step.Failed(FailureClass::RemediationExhausted,
                                                             "no build failure to remediate"));
        session.attempts.push_back(std::move(attempt));
        return Exhausted(run, "no build failure to remediate");
    }

    auto fixed = run.engine.Remediate(run.revision, *run.last_failure, attempt_number);
    if (!fixed) {
        const std::string detail = std::string(ToString(fixed.error().reason)) + ": " + fixed.error().detail;
        attempt.resulting_step = Record(session, step.Failed(FailureClass::RemediationExhausted, detail));
        session.attempts.push_back(std::move(attempt));
        return Exhausted(run, detail);
    }

    attempt.transform_applied = fixed->rule;
    attempt.resulting_step = Record(session, step.Ok("attempt " + std::to_string(attempt_number) + ": " +
                                                         fixed->rule + " rewrote " + run.revision.id + " -> " +
                                                         fixed->revision.id));
    run.open_attempt = session.attempts.size();
    session.attempts.push_back(std::move(attempt));

    run.revision = std::move(fixed->revision);
    session.revision = run.revision;
    run.last_failure.reset();
    return SessionState::Building;
}

SessionState UpdateOrchestrator::Activate(Run& run) {
    UpdateSession& session = run.session;
    GenerationStore& store = run.target.store;
    run.reached_activation = true;

    {
        StepClock step("stage");
        auto staged = store.Stage(run.revision, run.artifact);
        if (!staged) {
            Record(session, step.Failed(FailureClass::SwitchError, "staging failed: " + staged.error(), true));
            MarkFatal(session, FailureClass::SwitchError);
            return SessionState::RollingBack;
        }
        run.staged = *staged;
        Record(session, step.Ok("generation " + std::to_string(staged->id) + " staged"));
    }

    if (c_.validator) {
        StepClock step("validate");
        Result r = c_.validator->Check(*run.staged, run.cancel);
        if (!r.ok) {
            const FailureClass fc = run.cancel.IsCancelled() ? FailureClass::Cancelled : FailureClass::ValidationError;
            Record(session, step.Failed(fc, r.msg));
            session.terminal_failure = fc;
            return SessionState::RollingBack;
        }
        Record(session, step.Ok("generation " + std::to_string(run.staged->id) + " passed validation"));
    }

    if (run.cancel.IsCancelled())
        return OnCancelled(run, SessionState::Activating);

    {
        StepClock step("activate");
        Result r = store.Activate(*run.staged);
        if (!r.ok) {
            Record(session, step.Failed(FailureClass::SwitchError, "activation failed: " + r.msg, true));
            MarkFatal(session, FailureClass::SwitchError);
            return SessionState::RollingBack;
        }
        run.activated = true;
        Record(session, step.Ok("generation " + std::to_string(run.staged->id) + " is active"));
    }

    if (c_.health_check) {
        StepClock step("health-check");
        Result r = c_.health_check->Check(*run.staged, run.cancel);
        if (!r.ok) {
            const FailureClass fc = run.cancel.IsCancelled() ? FailureClass::Cancelled : FailureClass::ValidationError;
            Record(session, step.Failed(fc, r.msg));
            session.terminal_failure = fc;
            return SessionState::RollingBack;
        }
        Record(session, step.Ok("generation " + std::to_string(run.staged->id) + " is healthy"));
    }
    return SessionState::Done;
}

SessionState UpdateOrchestrator::RollBack(Run& run) {
    UpdateSession& session = run.session;
    GenerationStore& store = run.target.store;
    StepClock step("rollback");

    if (run.activated) {
        Result r = store.Rollback();
        if (!r.ok) {
            Record(session, step.Failed(FailureClass::SwitchError,
                                        "could not restore the previous generation: " + r.msg, true));
            MarkFatal(session, FailureClass::SwitchError);
            return SessionState::RolledBack;
        }
        const auto current = store.Current();
        Record(session, step.Ok("restored generation " + (current ? std::to_string(current->id) : "none")));
        return SessionState::RolledBack;
    }

    std::string detail;
    if (run.staged) {
        Result r = store.Abandon(*run.staged);
        if (!r.ok) {
            LogWarn("Could not mark generation %llu rolled back: %s",
                    static_cast<unsigned long long>(run.staged->id), r.msg.c_str());
            detail = "generation " + std::to_string(run.staged->id) + " left pending (" + r.msg + "); ";
        } else {
            detail = "generation " + std::to_string(run.staged->id) + " discarded; ";
        }
    }
    detail += session.baseline_generation
                  ? "generation " + std::to_string(*session.baseline_generation) + " remains active"
                  : std::string("no generation was active");
    Record(session, step.Ok(detail));
    return SessionState::RolledBack;
}

SessionState UpdateOrchestrator::OnCancelled(Run& run, SessionState interrupted) {
    UpdateSession& session = run.session;
    StepClock step("cancel");

    const std::string why = CancelledWhy(run.cancel, ToString(interrupted));
    Record(session, step.Failed(FailureClass::Cancelled, why));
    if (!session.manual_action_required)
        session.terminal_failure = FailureClass::Cancelled;
    session.notices.push_back(why);

    return run.reached_activation ? SessionState::RollingBack : SessionState::Aborted;
}

SessionState UpdateOrchestrator::Exhausted(Run& run, const std::string& why) {
    run.session.terminal_failure = FailureClass::RemediationExhausted;
    LogWarn("Giving up on revision %s: %s", run.revision.id.c_str(), why.c_str());
    // Without an earlier generation there is nothing to roll back to.
    if (!run.session.baseline_generation)
        return SessionState::Aborted;
    return SessionState::RollingBack;
}

void UpdateOrchestrator::Finish(UpdateSession& session, SessionState terminal, TargetState* target) {
    if (target) {
        if (auto current = target->store.Current())
            session.result_generation = current->id;
    }
    session.ended_at = std::chrono::system_clock::now();
    session.outcome = OutcomeFor(terminal);

    LogInfo("Session finished: %s", Reporter::FormatOneLine(session).c_str());

    if (target) {
        Result r = target->archive.Append(session);
        if (!r.ok)
            LogError("Could not archive session %s: %s", session.session_id.c_str(), r.msg.c_str());
    }

    Reporter(*c_.notifier).Report(session);
}

} // namespace genup
