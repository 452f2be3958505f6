#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace genup {

// A desired-state configuration input, immutable once fetched. Remediation never
// edits a Revision in place; it derives a new one whose parent_id is the old id.
struct Revision {
    std::string id;         // content hash, or a monotonic tag supplied by the source
    std::string target_id;
    std::string parent_id;  // set on remediated revisions
    std::string origin_id;  // id of the fetched revision a remediated one descends from
    std::vector<std::string> components;  // sorted, unique
    nlohmann::json payload = nlohmann::json::object();
    std::string source_ref;
    std::vector<std::string> applied_fixes;

    bool HasComponent(const std::string& name) const;
    // True for the fetched revision `fetched_id` itself and for anything derived from it.
    bool DescendsFrom(const std::string& fetched_id) const;
};

void NormalizeComponents(std::vector<std::string>& components);

// First 32 hex chars of SHA-256 over the canonical JSON of {components, payload}.
std::string ComputeRevisionId(const std::vector<std::string>& components,
                              const nlohmann::json& payload);

// Copy of `base` with new content: recomputes the id and records the lineage.
Revision DeriveRevision(const Revision& base,
                        std::vector<std::string> components,
                        nlohmann::json payload,
                        const std::string& fix_name);

} // namespace genup
