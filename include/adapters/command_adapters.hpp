#pragma once

#include "update/collaborators.hpp"

#include <string>

namespace genup {

// Runs BuildCommand through /bin/sh with
//   GENUP_TARGET, GENUP_REVISION_ID, GENUP_REVISION_FILE (payload JSON),
//   GENUP_COMPONENTS (space separated)
// The last non-empty output line is the artifact reference.
class CommandBuilder final : public IBuilder {
public:
    explicit CommandBuilder(std::string command, std::string temp_prefix = "/tmp/genup-revision");

    std::expected<std::string, BuildError> Build(const Revision& revision, const CancelToken& cancel) override;

private:
    std::string command_;
    std::string temp_prefix_;
};

// Validation or health probe: exit status 0 passes. The command sees
//   GENUP_TARGET, GENUP_GENERATION, GENUP_ARTIFACT, GENUP_REVISION_ID
class CommandGenerationCheck final : public IGenerationCheck {
public:
    CommandGenerationCheck(std::string name, std::string command);

    Result Check(const Generation& generation, const CancelToken& cancel) override;

private:
    std::string name_;
    std::string command_;
};

std::string JoinComponents(const std::vector<std::string>& components);

} // namespace genup
