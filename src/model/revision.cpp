#include "model/revision.hpp"

#include "crypto/sha256.hpp"

#include <algorithm>
#include <string>

namespace genup {

namespace {
constexpr size_t kRevisionIdLength = 32;
} // namespace

bool Revision::HasComponent(const std::string& name) const {
    return std::find(components.begin(), components.end(), name) != components.end();
}

bool Revision::DescendsFrom(const std::string& fetched_id) const {
    return id == fetched_id || (!origin_id.empty() && origin_id == fetched_id);
}

void NormalizeComponents(std::vector<std::string>& components) {
    components.erase(std::remove(components.begin(), components.end(), std::string()),
                     components.end());
    std::sort(components.begin(), components.end());
    components.erase(std::unique(components.begin(), components.end()), components.end());
}

std::string ComputeRevisionId(const std::vector<std::string>& components,
                              const nlohmann::json& payload) {
    // nlohmann::json objects keep keys sorted, so dump() is canonical.
    ContentDigest digest;
    digest.AddField(std::to_string(components.size()));
    for (const auto& c : components)
        digest.AddField(c);
    digest.AddField(payload.dump());
    return digest.HexDigest().substr(0, kRevisionIdLength);
}

Revision DeriveRevision(const Revision& base,
                        std::vector<std::string> components,
                        nlohmann::json payload,
                        const std::string& fix_name) {
    Revision out;
    out.target_id = base.target_id;
    out.parent_id = base.id;
    out.origin_id = base.origin_id.empty() ? base.id : base.origin_id;
    out.source_ref = base.source_ref;
    NormalizeComponents(components);
    out.components = std::move(components);
    out.payload = std::move(payload);
    out.applied_fixes = base.applied_fixes;
    out.applied_fixes.push_back(fix_name);
    out.id = ComputeRevisionId(out.components, out.payload);
    return out;
}

} // namespace genup
