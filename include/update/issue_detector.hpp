#pragma once

#include "model/issue.hpp"
#include "model/revision.hpp"
#include "update/collaborators.hpp"

#include <optional>
#include <string>
#include <vector>

namespace genup {

struct RiskVerdict {
    std::vector<IssueReport> reports;  // components of the revision only, most severe first, no duplicates
    std::optional<Severity> worst;

    // False when the registry could not be consulted; the update then proceeds
    // and `skip_reason` says why.
    bool assessed = true;
    std::string skip_reason;

    bool critical_abort = false;  // some report is Critical with an Abort recommendation
    bool blocking = false;        // critical_abort and the policy does not override it
};

class IssueDetector {
public:
    struct Options {
        bool auto_proceed_on_critical = false;
    };

    // `registry` may be null, in which case every assessment is skipped.
    IssueDetector(IIssueRegistry* registry, Options opt);

    RiskVerdict Evaluate(const Revision& revision, const CancelToken& cancel) const;

private:
    IIssueRegistry* registry_;
    Options opt_;
};

} // namespace genup
