#pragma once

#include "model/revision.hpp"
#include "util/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace genup {

enum class GenerationStatus { Pending, Active, Superseded, RolledBack };

const char* ToString(GenerationStatus s);
std::optional<GenerationStatus> ParseGenerationStatus(std::string_view s);

using GenerationId = std::uint64_t;

// One built system state. The record itself never changes after staging; only the
// store's pointer record decides which status it currently has.
struct Generation {
    GenerationId id = 0;
    Revision revision;
    std::string artifact_ref;
    GenerationStatus status = GenerationStatus::Pending;
    SystemTime created_at{};
};

} // namespace genup
