#include "adapters/file_configuration_source.hpp"

#include "io/file_reader.hpp"
#include "util/json_utils.hpp"
#include "util/logger.hpp"

#include <string_view>
#include <utility>

namespace genup {

std::expected<Revision, std::string> ParseRevisionDocument(const nlohmann::json& doc,
                                                           const std::string& target_id,
                                                           const std::string& source_ref) {
    using json_utils::HasWrongType;
    using nlohmann::json;

    if (!doc.is_object())
        return std::unexpected("revision document must be a JSON object");
    if (HasWrongType(doc, "tag", json::value_t::string))
        return std::unexpected("revision tag must be a string");
    if (HasWrongType(doc, "payload", json::value_t::object))
        return std::unexpected("revision payload must be an object");

    Revision r;
    if (!json_utils::GetStringArrayIfPresent(doc, "components", r.components))
        return std::unexpected("revision needs a \"components\" array of strings");
    NormalizeComponents(r.components);
    if (auto it = doc.find("payload"); it != doc.end())
        r.payload = *it;

    std::string tag;
    (void)json_utils::GetStringIfPresent(doc, "tag", tag);
    r.id = tag.empty() ? ComputeRevisionId(r.components, r.payload) : tag;
    r.target_id = target_id;
    r.source_ref = source_ref;
    return r;
}

FileConfigurationSource::FileConfigurationSource(std::string path_template)
    : path_template_(std::move(path_template)) {}

std::string FileConfigurationSource::PathFor(const std::string& target_id) const {
    static constexpr std::string_view kPlaceholder = "{target}";
    std::string path = path_template_;
    for (size_t pos = path.find(kPlaceholder); pos != std::string::npos;
         pos = path.find(kPlaceholder, pos + target_id.size())) {
        path.replace(pos, kPlaceholder.size(), target_id);
    }
    return path;
}

std::expected<Revision, std::string> FileConfigurationSource::FetchLatest(const std::string& target_id,
                                                                          const CancelToken& cancel) {
    if (cancel.IsCancelled())
        return std::unexpected(std::string("fetch cancelled"));

    const std::string path = PathFor(target_id);
    LogDebug("Fetching revision for %s from %s", target_id.c_str(), path.c_str());

    std::string text;
    Result r = ReadFileToString(path, text);
    if (!r.ok)
        return std::unexpected("cannot read revision: " + r.msg);

    nlohmann::json doc;
    std::string err;
    if (!json_utils::ParseJsonObject(text, doc, err))
        return std::unexpected(path + ": " + err);

    auto rev = ParseRevisionDocument(doc, target_id, path);
    if (!rev)
        return std::unexpected(path + ": " + rev.error());
    return rev;
}

} // namespace genup
