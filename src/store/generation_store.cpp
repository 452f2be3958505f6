#include "store/generation_store.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>

namespace genup {

namespace {

constexpr const char kOpActivate[] = "activate";
constexpr const char kOpRollback[] = "rollback";

Result Corrupt(const std::string& what) {
    return Result::Fail(EIO, "generation store corrupt: " + what);
}

} // namespace

Result ValidatePointerRecord(const PointerRecord& pointer,
                             const std::map<GenerationId, Generation>& generations) {
    auto known = [&](GenerationId id) { return generations.find(id) != generations.end(); };

    int active_count = 0;
    for (const auto& [id, status] : pointer.statuses) {
        if (!known(id)) return Corrupt("status for unknown generation " + std::to_string(id));
        if (status == GenerationStatus::Active) ++active_count;
    }
    if (active_count > 1) return Corrupt("more than one active generation");

    if (pointer.active) {
        if (!known(*pointer.active))
            return Corrupt("active pointer to unknown generation " + std::to_string(*pointer.active));
        auto it = pointer.statuses.find(*pointer.active);
        if (it == pointer.statuses.end() || it->second != GenerationStatus::Active)
            return Corrupt("active generation " + std::to_string(*pointer.active) + " not marked active");
    } else if (active_count != 0) {
        return Corrupt("active status without active pointer");
    }

    for (GenerationId id : pointer.previous) {
        if (!known(id)) return Corrupt("history references unknown generation " + std::to_string(id));
        if (pointer.active && id == *pointer.active)
            return Corrupt("active generation " + std::to_string(id) + " listed in history");
    }
    return Result::Ok();
}

GenerationStore::GenerationStore(std::shared_ptr<IBackend> backend) : backend_(std::move(backend)) {}

Result GenerationStore::Load() {
    std::lock_guard<std::mutex> lk(mu_);
    if (!backend_) return Result::Fail(EINVAL, "generation store has no backend");

    std::vector<Generation> loaded;
    PointerRecord pointer;
    auto lr = backend_->Load(loaded, pointer);
    if (!lr.is_ok()) return lr;

    std::map<GenerationId, Generation> by_id;
    for (auto& g : loaded) {
        const GenerationId id = g.id;
        if (!by_id.emplace(id, std::move(g)).second)
            return Corrupt("duplicate generation " + std::to_string(id));
    }

    auto vr = ValidatePointerRecord(pointer, by_id);
    if (!vr.is_ok()) return vr;

    generations_ = std::move(by_id);
    pointer_ = std::move(pointer);
    next_id_ = generations_.empty() ? 1 : generations_.rbegin()->first + 1;
    loaded_ = true;

    LogDebug("Generation store loaded: %zu generations, active=%s",
             generations_.size(),
             pointer_.active ? std::to_string(*pointer_.active).c_str() : "none");
    return Result::Ok();
}

GenerationStatus GenerationStore::StatusLocked(GenerationId id) const {
    auto it = pointer_.statuses.find(id);
    return it == pointer_.statuses.end() ? GenerationStatus::Pending : it->second;
}

Generation GenerationStore::WithStatusLocked(const Generation& g) const {
    Generation out = g;
    out.status = StatusLocked(g.id);
    return out;
}

std::optional<Generation> GenerationStore::Current() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (!pointer_.active) return std::nullopt;
    auto it = generations_.find(*pointer_.active);
    if (it == generations_.end()) return std::nullopt;
    return WithStatusLocked(it->second);
}

std::expected<Generation, std::string> GenerationStore::Stage(const Revision& revision,
                                                              std::string artifact_ref) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!loaded_) return std::unexpected("generation store not loaded");

    Generation g;
    g.id = next_id_;
    g.revision = revision;
    g.artifact_ref = std::move(artifact_ref);
    g.status = GenerationStatus::Pending;
    g.created_at = std::chrono::system_clock::now();

    auto wr = backend_->WriteGeneration(g);
    if (!wr.is_ok()) return std::unexpected("stage generation " + std::to_string(g.id) + ": " + wr.msg);

    generations_.emplace(g.id, g);
    ++next_id_;
    LogInfo("Staged generation %llu (revision %s)", (unsigned long long)g.id, revision.id.c_str());
    return g;
}

Result GenerationStore::CommitLocked(PointerRecord next) {
    next.seq = pointer_.seq + 1;
    auto vr = ValidatePointerRecord(next, generations_);
    if (!vr.is_ok()) return vr;

    auto cr = backend_->CommitPointer(next);
    if (!cr.is_ok()) return cr;

    pointer_ = std::move(next);
    return Result::Ok();
}

Result GenerationStore::Activate(const Generation& generation) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!loaded_) return Result::Fail(EINVAL, "generation store not loaded");
    if (generations_.find(generation.id) == generations_.end())
        return Result::Fail(ENOENT, "unknown generation " + std::to_string(generation.id));

    const GenerationStatus status = StatusLocked(generation.id);
    if (status == GenerationStatus::Active) return Result::Ok();
    if (status == GenerationStatus::RolledBack)
        return Result::Fail(EINVAL, "generation " + std::to_string(generation.id) + " was rolled back");

    PointerRecord next = pointer_;
    if (next.active) {
        next.statuses[*next.active] = GenerationStatus::Superseded;
        next.previous.push_back(*next.active);
    }
    // Re-activating an older superseded generation takes it out of the history.
    next.previous.erase(std::remove(next.previous.begin(), next.previous.end(), generation.id),
                        next.previous.end());
    next.statuses[generation.id] = GenerationStatus::Active;
    next.active = generation.id;
    next.last_op = kOpActivate;

    auto cr = CommitLocked(std::move(next));
    if (!cr.is_ok()) {
        LogError("Activation of generation %llu failed, pointer unchanged: %s",
                 (unsigned long long)generation.id, cr.msg.c_str());
        return cr;
    }
    LogInfo("Activated generation %llu", (unsigned long long)generation.id);
    return Result::Ok();
}

Result GenerationStore::Rollback() {
    std::lock_guard<std::mutex> lk(mu_);
    if (!loaded_) return Result::Fail(EINVAL, "generation store not loaded");

    if (pointer_.last_op == kOpRollback) {
        LogInfo("Rollback: already rolled back, nothing to do");
        return Result::Ok();
    }
    if (!pointer_.active || pointer_.previous.empty()) {
        return Result::Fail(ENOENT, "no previous generation to roll back to");
    }

    const GenerationId failed = *pointer_.active;
    const GenerationId restore = pointer_.previous.back();

    PointerRecord next = pointer_;
    next.previous.pop_back();
    next.statuses[failed] = GenerationStatus::RolledBack;
    next.statuses[restore] = GenerationStatus::Active;
    next.active = restore;
    next.last_op = kOpRollback;

    auto cr = CommitLocked(std::move(next));
    if (!cr.is_ok()) {
        LogError("Rollback to generation %llu failed, pointer unchanged: %s",
                 (unsigned long long)restore, cr.msg.c_str());
        return cr;
    }
    LogInfo("Rolled back generation %llu, generation %llu active again",
            (unsigned long long)failed, (unsigned long long)restore);
    return Result::Ok();
}

Result GenerationStore::Abandon(const Generation& generation) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!loaded_) return Result::Fail(EINVAL, "generation store not loaded");
    if (generations_.find(generation.id) == generations_.end())
        return Result::Fail(ENOENT, "unknown generation " + std::to_string(generation.id));

    const GenerationStatus status = StatusLocked(generation.id);
    if (status == GenerationStatus::RolledBack) return Result::Ok();
    if (status != GenerationStatus::Pending)
        return Result::Fail(EINVAL, "generation " + std::to_string(generation.id) + " is " +
                                        ToString(status) + ", only pending generations can be abandoned");

    PointerRecord next = pointer_;
    // The pointer does not move, so last_op keeps describing the last pointer change.
    next.statuses[generation.id] = GenerationStatus::RolledBack;
    return CommitLocked(std::move(next));
}

std::vector<Generation> GenerationStore::List() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Generation> out;
    out.reserve(generations_.size());
    for (const auto& [id, g] : generations_) {
        out.push_back(WithStatusLocked(g));
    }
    return out;
}

std::optional<Generation> GenerationStore::Find(GenerationId id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = generations_.find(id);
    if (it == generations_.end()) return std::nullopt;
    return WithStatusLocked(it->second);
}

} // namespace genup
