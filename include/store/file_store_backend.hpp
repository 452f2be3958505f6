#pragma once

#include "store/generation_store.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <string>

namespace genup {

// On-disk layout under `dir`:
//   generations/<id>.json   immutable generation records
//   current.json            pointer record, replaced atomically
class FileStoreBackend final : public GenerationStore::IBackend {
  public:
    explicit FileStoreBackend(std::string dir);

    Result Load(std::vector<Generation>& generations, PointerRecord& pointer) const override;
    Result WriteGeneration(const Generation& generation) override;
    Result CommitPointer(const PointerRecord& pointer) override;

    const std::string& Dir() const { return dir_; }

  private:
    std::string GenerationsDir() const;
    std::string PointerPath() const;

    std::string dir_;
};

nlohmann::json PointerRecordToJson(const PointerRecord& pointer);
std::expected<PointerRecord, std::string> PointerRecordFromJson(const nlohmann::json& j);

} // namespace genup
