#pragma once

#include "update/collaborators.hpp"

#include <expected>
#include <string>

namespace genup {

inline constexpr const char* kFailureMissingDependency = "missing-dependency";
inline constexpr const char* kFailureHashMismatch = "hash-mismatch";
inline constexpr const char* kFailureNoSpace = "no-space";
inline constexpr const char* kFailureObsoleteOption = "obsolete-option";
inline constexpr const char* kFailureUnknown = "unknown";

// Scans the build log for known failure signatures and fills `failure_class` and
// `hints`. A class already set by the builder is kept.
void ClassifyBuildFailure(BuildError& error);

// Wraps the external builder: logs, times and classifies each build.
class BuilderAdapter {
public:
    explicit BuilderAdapter(IBuilder& builder);

    std::expected<std::string, BuildError> Build(const Revision& revision, const CancelToken& cancel);

private:
    IBuilder& builder_;
};

} // namespace genup
