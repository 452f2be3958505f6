#pragma once

#include "update/collaborators.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <string>

namespace genup {

// Revision document:
//   {"tag": "2026.10.1", "components": ["nginx", "openssl"], "payload": {...}}
// "tag" is optional; without it the id is the content hash.
std::expected<Revision, std::string> ParseRevisionDocument(const nlohmann::json& doc,
                                                           const std::string& target_id,
                                                           const std::string& source_ref);

// Reads the latest revision from a file. "{target}" in the path template is
// replaced by the target id; a ".gz" file is decompressed on the fly.
class FileConfigurationSource final : public IConfigurationSource {
public:
    explicit FileConfigurationSource(std::string path_template);

    std::expected<Revision, std::string> FetchLatest(const std::string& target_id,
                                                     const CancelToken& cancel) override;

    std::string PathFor(const std::string& target_id) const;

private:
    std::string path_template_;
};

} // namespace genup
