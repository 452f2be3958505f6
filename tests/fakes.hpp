#pragma once

#include "model/revision.hpp"
#include "store/generation_store.hpp"
#include "update/collaborators.hpp"

#include <algorithm>
#include <cerrno>
#include <expected>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace testutil {

inline genup::Revision MakeRevision(std::vector<std::string> components,
                                    nlohmann::json payload = nlohmann::json::object(),
                                    const std::string& tag = "") {
    genup::Revision r;
    genup::NormalizeComponents(components);
    r.components = std::move(components);
    r.payload = std::move(payload);
    r.id = tag.empty() ? genup::ComputeRevisionId(r.components, r.payload) : tag;
    r.source_ref = "memory";
    return r;
}

inline genup::BuildError MissingDependencyFailure(const std::string& dep) {
    genup::BuildError e;
    e.exit_code = 1;
    e.log = "building...\nerror: missing dependency: " + dep + "\n";
    return e;
}

inline genup::BuildError OpaqueFailure(const std::string& log = "segmentation fault in linker") {
    genup::BuildError e;
    e.exit_code = 2;
    e.log = log;
    return e;
}

class FakeSource final : public genup::IConfigurationSource {
  public:
    explicit FakeSource(genup::Revision r) : result(std::move(r)) {}

    std::expected<genup::Revision, std::string> FetchLatest(const std::string& target_id,
                                                            const genup::CancelToken& cancel) override {
        ++calls;
        last_target = target_id;
        if (on_fetch) on_fetch(cancel);
        return result;
    }

    std::expected<genup::Revision, std::string> result;
    std::function<void(const genup::CancelToken&)> on_fetch;
    int calls = 0;
    std::string last_target;
};

// Plays back `outcomes` in order; the last one repeats.
class FakeBuilder final : public genup::IBuilder {
  public:
    FakeBuilder() = default;
    explicit FakeBuilder(std::vector<std::expected<std::string, genup::BuildError>> o) : outcomes(std::move(o)) {}

    std::expected<std::string, genup::BuildError> Build(const genup::Revision& revision,
                                                        const genup::CancelToken& cancel) override {
        built.push_back(revision);
        if (on_build) on_build(revision, cancel);
        if (outcomes.empty())
            return "artifact-" + revision.id;
        const size_t i = std::min(built.size() - 1, outcomes.size() - 1);
        return outcomes[i];
    }

    int Calls() const { return static_cast<int>(built.size()); }

    std::vector<std::expected<std::string, genup::BuildError>> outcomes;
    std::function<void(const genup::Revision&, const genup::CancelToken&)> on_build;
    std::vector<genup::Revision> built;
};

class FakeIssueRegistry final : public genup::IIssueRegistry {
  public:
    std::expected<std::vector<genup::IssueReport>, std::string>
    QueryIssues(const std::vector<std::string>& components, const genup::CancelToken&) override {
        ++calls;
        queried = components;
        return result;
    }

    std::expected<std::vector<genup::IssueReport>, std::string> result = std::vector<genup::IssueReport>{};
    std::vector<std::string> queried;
    int calls = 0;
};

class RecordingNotifier final : public genup::INotifier {
  public:
    genup::Result Send(const std::string& message) override {
        messages.push_back(message);
        if (fail)
            return genup::Result::Fail(-1, "notifier down");
        return genup::Result::Ok();
    }

    std::vector<std::string> messages;
    bool fail = false;
};

class FakeCheck final : public genup::IGenerationCheck {
  public:
    genup::Result Check(const genup::Generation& generation, const genup::CancelToken& cancel) override {
        checked.push_back(generation.id);
        if (on_check) on_check(generation, cancel);
        return result;
    }

    genup::Result result = genup::Result::Ok();
    std::function<void(const genup::Generation&, const genup::CancelToken&)> on_check;
    std::vector<genup::GenerationId> checked;
};

// In-memory store backend with failure injection. State survives the store
// object, so a second GenerationStore over the same backend sees what the first
// committed.
class MemoryBackend final : public genup::GenerationStore::IBackend {
  public:
    genup::Result Load(std::vector<genup::Generation>& generations, genup::PointerRecord& pointer) const override {
        generations.clear();
        for (const auto& [id, g] : records)
            generations.push_back(g);
        pointer = committed;
        return genup::Result::Ok();
    }

    genup::Result WriteGeneration(const genup::Generation& generation) override {
        if (fail_writes)
            return genup::Result::Fail(EIO, "injected write failure");
        if (records.count(generation.id))
            return genup::Result::Fail(EEXIST, "generation exists");
        records[generation.id] = generation;
        return genup::Result::Ok();
    }

    genup::Result CommitPointer(const genup::PointerRecord& pointer) override {
        ++commit_calls;
        if (fail_commits > 0) {
            --fail_commits;
            return genup::Result::Fail(EIO, "injected commit failure");
        }
        committed = pointer;
        return genup::Result::Ok();
    }

    std::map<genup::GenerationId, genup::Generation> records;
    genup::PointerRecord committed;
    int fail_commits = 0;  // number of upcoming commits to fail
    bool fail_writes = false;
    int commit_calls = 0;
};

} // namespace testutil
