#pragma once

#include "model/generation.hpp"
#include "model/revision.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace genup {

// The single mutable record of a store. Every status change is a new PointerRecord
// committed in one step, so an activation or rollback is either fully visible or
// not at all.
struct PointerRecord {
    std::optional<GenerationId> active;
    std::vector<GenerationId> previous;  // superseded ids, most recent last
    std::map<GenerationId, GenerationStatus> statuses;  // absent => Pending
    std::string last_op;
    std::uint64_t seq = 0;
};

class GenerationStore {
  public:
    class IBackend {
      public:
        virtual ~IBackend() = default;
        virtual Result Load(std::vector<Generation>& generations, PointerRecord& pointer) const = 0;
        // Generation records are written once; rewriting an existing id is an error.
        virtual Result WriteGeneration(const Generation& generation) = 0;
        // Must be all-or-nothing.
        virtual Result CommitPointer(const PointerRecord& pointer) = 0;
    };

    explicit GenerationStore(std::shared_ptr<IBackend> backend);
    GenerationStore(const GenerationStore&) = delete;
    GenerationStore& operator=(const GenerationStore&) = delete;

    // Reads and validates persisted state. Inconsistent state is store corruption.
    Result Load();

    std::optional<Generation> Current() const;

    std::expected<Generation, std::string> Stage(const Revision& revision, std::string artifact_ref);
    Result Activate(const Generation& generation);
    Result Rollback();

    // Marks a Pending generation that never became Active as RolledBack.
    Result Abandon(const Generation& generation);

    std::vector<Generation> List() const;
    std::optional<Generation> Find(GenerationId id) const;

  private:
    Generation WithStatusLocked(const Generation& g) const;
    GenerationStatus StatusLocked(GenerationId id) const;
    Result CommitLocked(PointerRecord next);

    mutable std::mutex mu_;
    std::shared_ptr<IBackend> backend_;
    std::map<GenerationId, Generation> generations_;
    PointerRecord pointer_;
    GenerationId next_id_ = 1;
    bool loaded_ = false;
};

// Validates the invariants of a pointer record against the known generation ids.
Result ValidatePointerRecord(const PointerRecord& pointer, const std::map<GenerationId, Generation>& generations);

} // namespace genup
