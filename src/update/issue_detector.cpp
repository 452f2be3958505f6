#include "update/issue_detector.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <exception>

namespace genup {

IssueDetector::IssueDetector(IIssueRegistry* registry, Options opt) : registry_(registry), opt_(opt) {}

RiskVerdict IssueDetector::Evaluate(const Revision& revision, const CancelToken& cancel) const {
    RiskVerdict v;
    if (!registry_) {
        v.assessed = false;
        v.skip_reason = "no issue registry configured";
        return v;
    }

    std::expected<std::vector<IssueReport>, std::string> reports;
    try {
        reports = registry_->QueryIssues(revision.components, cancel);
    } catch (const std::exception& e) {
        reports = std::unexpected(std::string("issue registry threw: ") + e.what());
    }
    if (!reports) {
        v.assessed = false;
        v.skip_reason = reports.error();
        LogWarn("Risk assessment skipped: %s", v.skip_reason.c_str());
        return v;
    }

    for (auto& r : *reports) {
        if (!revision.HasComponent(r.component)) {
            LogDebug("Ignoring issue for unrelated component %s", r.component.c_str());
            continue;
        }
        const bool duplicate = std::any_of(v.reports.begin(), v.reports.end(), [&](const IssueReport& seen) {
            return seen.component == r.component && seen.severity == r.severity &&
                   seen.recommendation == r.recommendation && seen.summary == r.summary;
        });
        if (duplicate)
            continue;
        if (!v.worst || r.severity > *v.worst)
            v.worst = r.severity;
        if (IsCriticalAbort(r))
            v.critical_abort = true;
        v.reports.push_back(std::move(r));
    }
    std::stable_sort(v.reports.begin(), v.reports.end(), [](const IssueReport& a, const IssueReport& b) {
        return a.severity > b.severity;
    });

    v.blocking = v.critical_abort && !opt_.auto_proceed_on_critical;
    LogInfo("Risk assessment: %zu issue(s), worst=%s%s",
            v.reports.size(),
            v.worst ? ToString(*v.worst) : "none",
            v.blocking ? ", blocking" : "");
    return v;
}

} // namespace genup
