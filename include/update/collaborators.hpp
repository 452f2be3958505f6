#pragma once

#include "model/generation.hpp"
#include "model/issue.hpp"
#include "model/revision.hpp"
#include "system/cancel_token.hpp"
#include "util/result.hpp"

#include <expected>
#include <map>
#include <string>
#include <vector>

namespace genup {

// Raw failure of one build attempt. `failure_class` and `hints` are filled by
// the builder itself when it knows better, otherwise by ClassifyBuildFailure.
struct BuildError {
    std::string log;
    int exit_code = -1;
    int exit_signal = 0;
    bool cancelled = false;
    std::string failure_class;  // e.g. "missing-dependency"; "unknown" when unclassified
    std::map<std::string, std::string> hints;

    std::string Summary() const;
};

class IConfigurationSource {
public:
    virtual ~IConfigurationSource() = default;
    virtual std::expected<Revision, std::string> FetchLatest(const std::string& target_id,
                                                             const CancelToken& cancel) = 0;
};

class IBuilder {
public:
    virtual ~IBuilder() = default;
    // Returns an opaque artifact reference on success.
    virtual std::expected<std::string, BuildError> Build(const Revision& revision,
                                                         const CancelToken& cancel) = 0;
};

class IIssueRegistry {
public:
    virtual ~IIssueRegistry() = default;
    virtual std::expected<std::vector<IssueReport>, std::string>
    QueryIssues(const std::vector<std::string>& components, const CancelToken& cancel) = 0;
};

class INotifier {
public:
    virtual ~INotifier() = default;
    virtual Result Send(const std::string& message) = 0;
};

// Pre-activation validation and post-activation health checks.
class IGenerationCheck {
public:
    virtual ~IGenerationCheck() = default;
    virtual Result Check(const Generation& generation, const CancelToken& cancel) = 0;
};

} // namespace genup
