#include "update/remediation_engine.hpp"

#include "update/builder_adapter.hpp"
#include "update/remediation_rules.hpp"
#include "util/logger.hpp"

#include <utility>

namespace genup {

const char* ToString(RemediationEngine::MissReason reason) {
    switch (reason) {
        case RemediationEngine::MissReason::AttemptLimitReached: return "attempt-limit-reached";
        case RemediationEngine::MissReason::NoRuleMatched: return "no-rule-matched";
        case RemediationEngine::MissReason::TransformFailed: return "transform-failed";
    }
    return "unknown";
}

RemediationEngine::RemediationEngine(int max_attempts)
    : rules_(CreateDefaultRemediationRules()), max_attempts_(max_attempts) {}

RemediationEngine::RemediationEngine(std::vector<RulePtr> rules, int max_attempts)
    : rules_(std::move(rules)), max_attempts_(max_attempts) {}

std::expected<RemediationEngine::Remediation, RemediationEngine::Miss>
RemediationEngine::Remediate(const Revision& revision, const BuildError& failure, int attempt_number) const {
    if (attempt_number > max_attempts_) {
        return std::unexpected(Miss{MissReason::AttemptLimitReached,
                                    "attempt " + std::to_string(attempt_number) + " exceeds limit " +
                                        std::to_string(max_attempts_)});
    }

    for (const auto& rule : rules_) {
        if (!rule->Matches(failure))
            continue;

        LogInfo("Remediation attempt %d: rule %s matches %s",
                attempt_number, rule->Name(), failure.failure_class.c_str());
        auto fixed = rule->Apply(revision, failure);
        if (!fixed) {
            return std::unexpected(Miss{MissReason::TransformFailed,
                                        std::string("rule ") + rule->Name() + " could not transform revision " +
                                            revision.id});
        }
        if (fixed->id == revision.id) {
            return std::unexpected(Miss{MissReason::TransformFailed,
                                        std::string("rule ") + rule->Name() + " left revision " + revision.id +
                                            " unchanged"});
        }
        return Remediation{std::move(*fixed), rule->Name()};
    }

    const std::string cls = failure.failure_class.empty() ? std::string(kFailureUnknown) : failure.failure_class;
    return std::unexpected(Miss{MissReason::NoRuleMatched, "no rule for failure class " + cls});
}

std::vector<std::string> RemediationEngine::RuleNames() const {
    std::vector<std::string> names;
    names.reserve(rules_.size());
    for (const auto& r : rules_)
        names.emplace_back(r->Name());
    return names;
}

} // namespace genup
