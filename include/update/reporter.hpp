#pragma once

#include "model/session.hpp"
#include "update/collaborators.hpp"

#include <string>

namespace genup {

class Reporter {
public:
    explicit Reporter(INotifier& notifier);

    // Human-readable report of a finished session. Fatal steps are repeated at
    // the top under a "MANUAL ACTION REQUIRED" banner.
    static std::string FormatSummary(const UpdateSession& session);

    // "<target> <session>: <outcome> revision=... generation=..."
    static std::string FormatOneLine(const UpdateSession& session);

    // Dispatches the report of a terminal session. Delivery failures are logged
    // and never change the session.
    void Report(const UpdateSession& session) const;

private:
    INotifier& notifier_;
};

} // namespace genup
