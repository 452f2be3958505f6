#include "update/reporter.hpp"

#include "util/logger.hpp"
#include "util/time_utils.hpp"

#include <chrono>
#include <cstdio>
#include <exception>

namespace genup {

namespace {

const char* OutcomeBanner(SessionOutcome o) {
    switch (o) {
        case SessionOutcome::Success: return "SUCCESS";
        case SessionOutcome::RolledBack: return "ROLLED BACK";
        case SessionOutcome::Aborted: return "ABORTED";
        case SessionOutcome::Pending: return "PENDING";
    }
    return "?";
}

std::chrono::milliseconds Elapsed(SystemTime from, SystemTime to) {
    if (to < from)
        return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from);
}

std::string GenerationText(const std::optional<GenerationId>& id) {
    return id ? std::to_string(*id) : std::string("none");
}

std::string Join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += sep;
        out += s;
    }
    return out;
}

void AppendStep(std::string& out, size_t n, const StepResult& s) {
    char num[16];
    std::snprintf(num, sizeof(num), "%3zu. ", n);
    out += num;
    out += s.status == StepStatus::Ok ? "[ok]     " : "[FAILED] ";
    out += s.step_name;
    out += " (" + FormatDuration(Elapsed(s.started_at, s.ended_at)) + ")";
    if (s.failure_class) {
        out += " ";
        out += ToString(*s.failure_class);
    }
    if (s.fatal)
        out += " FATAL";
    if (!s.detail.empty())
        out += ": " + s.detail;
    out += "\n";
}

} // namespace

std::string Reporter::FormatOneLine(const UpdateSession& session) {
    std::string line = session.target_id + " " + session.session_id + ": " + ToString(session.outcome);
    if (session.revision)
        line += " revision=" + session.revision->id;
    line += " generation=" + GenerationText(session.result_generation);
    if (session.terminal_failure) {
        line += " failure=";
        line += ToString(*session.terminal_failure);
    }
    if (session.remediation_attempts > 0)
        line += " attempts=" + std::to_string(session.remediation_attempts);
    if (session.manual_action_required)
        line += " MANUAL-ACTION-REQUIRED";
    return line;
}

std::string Reporter::FormatSummary(const UpdateSession& session) {
    std::string out;
    out += "genup update report: " + session.target_id + " " + OutcomeBanner(session.outcome) + "\n";

    if (session.manual_action_required) {
        out += "\n*** MANUAL ACTION REQUIRED ***\n";
        for (const auto& s : session.steps) {
            if (s.fatal)
                out += "  " + s.step_name + ": " + s.detail + "\n";
        }
        out += "\n";
    }

    out += "session:    " + session.session_id + "\n";
    out += "started:    " + FormatLocalTime(session.started_at) +
           " (took " + FormatDuration(Elapsed(session.started_at, session.ended_at)) + ")\n";
    if (session.revision) {
        const Revision& r = *session.revision;
        out += "revision:   " + r.id;
        if (!r.parent_id.empty())
            out += " (from " + r.parent_id + ")";
        out += "\n";
        if (!r.applied_fixes.empty())
            out += "fixes:      " + Join(r.applied_fixes, ", ") + "\n";
    }
    out += "generation: " + GenerationText(session.baseline_generation) + " -> " +
           GenerationText(session.result_generation) + "\n";
    if (session.terminal_failure) {
        out += "failure:    ";
        out += ToString(*session.terminal_failure);
        out += "\n";
    }

    if (!session.issues.empty()) {
        out += "issues:\n";
        for (const auto& i : session.issues) {
            out += "  - " + i.component + " [" + ToString(i.severity) + "/" + ToString(i.recommendation) + "] " +
                   i.summary + "\n";
        }
    }

    if (!session.notices.empty()) {
        out += "notices:\n";
        for (const auto& n : session.notices)
            out += "  - " + n + "\n";
    }

    out += "steps:\n";
    for (size_t i = 0; i < session.steps.size(); ++i)
        AppendStep(out, i + 1, session.steps[i]);

    if (!session.attempts.empty()) {
        out += "remediation attempts: " + std::to_string(session.remediation_attempts) + "\n";
        for (const auto& a : session.attempts) {
            out += "  #" + std::to_string(a.attempt_number) + " " +
                   (a.matched_failure_class.empty() ? std::string("unknown") : a.matched_failure_class) + " -> " +
                   (a.transform_applied.empty() ? std::string("no fix") : a.transform_applied) + ": ";
            out += a.resulting_step.step_name + " ";
            out += a.resulting_step.status == StepStatus::Ok ? "ok" : "failed";
            out += "\n";
        }
    }

    return out;
}

Reporter::Reporter(INotifier& notifier) : notifier_(notifier) {}

void Reporter::Report(const UpdateSession& session) const {
    if (!session.IsTerminal()) {
        LogError("Refusing to report unfinished session %s", session.session_id.c_str());
        return;
    }

    const std::string message = FormatSummary(session);
    Result r;
    try {
        r = notifier_.Send(message);
    } catch (const std::exception& e) {
        r = Result::Fail(-1, std::string("notifier threw: ") + e.what());
    }
    if (!r.ok) {
        LogWarn("Report delivery failed for session %s: %s", session.session_id.c_str(), r.msg.c_str());
        return;
    }
    LogDebug("Report delivered for session %s", session.session_id.c_str());
}

} // namespace genup
