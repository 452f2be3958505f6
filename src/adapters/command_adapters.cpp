#include "adapters/command_adapters.hpp"

#include "io/temp_file.hpp"
#include "system/process.hpp"
#include "util/logger.hpp"

#include <utility>

namespace genup {

std::string JoinComponents(const std::vector<std::string>& components) {
    std::string out;
    for (const auto& c : components) {
        if (!out.empty()) out += ' ';
        out += c;
    }
    return out;
}

CommandBuilder::CommandBuilder(std::string command, std::string temp_prefix)
    : command_(std::move(command)), temp_prefix_(std::move(temp_prefix)) {}

std::expected<std::string, BuildError> CommandBuilder::Build(const Revision& revision, const CancelToken& cancel) {
    BuildError err;

    TempFile payload;
    Result r = TempFile::Create(temp_prefix_, payload);
    if (r.ok)
        r = payload.WriteAndClose(revision.payload.dump(2) + "\n");
    if (!r.ok) {
        err.log = "cannot write revision payload: " + r.msg;
        return std::unexpected(std::move(err));
    }

    ProcessSpec spec;
    spec.command = command_;
    spec.env = {
        {"GENUP_TARGET", revision.target_id},
        {"GENUP_REVISION_ID", revision.id},
        {"GENUP_REVISION_FILE", payload.Path()},
        {"GENUP_COMPONENTS", JoinComponents(revision.components)},
    };

    ProcessResult pr;
    r = RunProcess(spec, cancel, pr);
    if (!r.ok) {
        err.log = "cannot start builder: " + r.msg;
        return std::unexpected(std::move(err));
    }
    LogDebug("Builder finished: %s", pr.Describe().c_str());

    if (!pr.Succeeded()) {
        err.log = std::move(pr.output);
        err.exit_code = pr.exit_code;
        err.exit_signal = pr.term_signal;
        err.cancelled = pr.cancelled;
        return std::unexpected(std::move(err));
    }

    std::string artifact = LastNonEmptyLine(pr.output);
    if (artifact.empty()) {
        err.log = pr.output + "\nbuilder succeeded but printed no artifact reference";
        err.exit_code = 0;
        return std::unexpected(std::move(err));
    }
    return artifact;
}

CommandGenerationCheck::CommandGenerationCheck(std::string name, std::string command)
    : name_(std::move(name)), command_(std::move(command)) {}

Result CommandGenerationCheck::Check(const Generation& generation, const CancelToken& cancel) {
    ProcessSpec spec;
    spec.command = command_;
    spec.output_limit = 64 * 1024;
    spec.env = {
        {"GENUP_TARGET", generation.revision.target_id},
        {"GENUP_GENERATION", std::to_string(generation.id)},
        {"GENUP_ARTIFACT", generation.artifact_ref},
        {"GENUP_REVISION_ID", generation.revision.id},
    };

    ProcessResult pr;
    Result r = RunProcess(spec, cancel, pr);
    if (!r.ok)
        return Result::Fail(r.err, name_ + ": cannot start: " + r.msg);
    if (!pr.Succeeded()) {
        std::string msg = name_ + " failed for generation " + std::to_string(generation.id) + ": " + pr.Describe();
        const std::string last = LastNonEmptyLine(pr.output);
        if (!last.empty())
            msg += ": " + last;
        return Result::Fail(-1, msg);
    }
    LogDebug("%s passed for generation %llu", name_.c_str(), static_cast<unsigned long long>(generation.id));
    return Result::Ok();
}

} // namespace genup
