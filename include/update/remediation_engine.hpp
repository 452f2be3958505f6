#pragma once

#include "model/revision.hpp"
#include "update/collaborators.hpp"

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace genup {

class RemediationEngine {
public:
    // A rule pairs a failure signature with a transform of the revision. Apply
    // returns nullopt when the transform cannot make progress (e.g. the fix is
    // already present).
    class IRule {
    public:
        virtual ~IRule() = default;
        virtual const char* Name() const = 0;
        virtual bool Matches(const BuildError& failure) const = 0;
        virtual std::optional<Revision> Apply(const Revision& revision, const BuildError& failure) const = 0;
    };

    using RulePtr = std::shared_ptr<const IRule>;

    struct Remediation {
        Revision revision;
        std::string rule;
    };

    enum class MissReason { AttemptLimitReached, NoRuleMatched, TransformFailed };

    struct Miss {
        MissReason reason = MissReason::NoRuleMatched;
        std::string detail;
    };

    explicit RemediationEngine(int max_attempts);
    RemediationEngine(std::vector<RulePtr> rules, int max_attempts);

    // First matching rule wins. `attempt_number` is 1-based; anything above the
    // configured maximum is a miss regardless of the failure.
    std::expected<Remediation, Miss> Remediate(const Revision& revision,
                                               const BuildError& failure,
                                               int attempt_number) const;

    int MaxAttempts() const { return max_attempts_; }
    std::vector<std::string> RuleNames() const;

private:
    std::vector<RulePtr> rules_;
    int max_attempts_;
};

const char* ToString(RemediationEngine::MissReason reason);

} // namespace genup
