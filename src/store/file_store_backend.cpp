#include "store/file_store_backend.hpp"

#include "io/atomic_file.hpp"
#include "model/model_json.hpp"
#include "util/json_utils.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <charconv>
#include <filesystem>

namespace genup {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::optional<GenerationId> IdFromFileName(const fs::path& p) {
    if (p.extension() != ".json") return std::nullopt;
    const std::string stem = p.stem().string();
    GenerationId id = 0;
    auto [ptr, ec] = std::from_chars(stem.data(), stem.data() + stem.size(), id);
    if (ec != std::errc() || ptr != stem.data() + stem.size() || id == 0) return std::nullopt;
    return id;
}

} // namespace

json PointerRecordToJson(const PointerRecord& pointer) {
    json j = json::object();
    j["active"] = pointer.active ? json(*pointer.active) : json(nullptr);
    j["previous"] = pointer.previous;
    json statuses = json::object();
    for (const auto& [id, status] : pointer.statuses) {
        statuses[std::to_string(id)] = ToString(status);
    }
    j["statuses"] = std::move(statuses);
    j["last_op"] = pointer.last_op;
    j["seq"] = pointer.seq;
    return j;
}

std::expected<PointerRecord, std::string> PointerRecordFromJson(const json& j) {
    if (!j.is_object()) return std::unexpected("pointer record must be an object");
    PointerRecord p;
    try {
        if (auto it = j.find("active"); it != j.end() && !it->is_null()) {
            if (!it->is_number_unsigned()) return std::unexpected("pointer 'active' must be an id");
            p.active = it->get<GenerationId>();
        }
        if (auto it = j.find("previous"); it != j.end()) {
            p.previous = it->get<std::vector<GenerationId>>();
        }
        if (auto it = j.find("statuses"); it != j.end()) {
            if (!it->is_object()) return std::unexpected("pointer 'statuses' must be an object");
            for (const auto& [key, val] : it->items()) {
                GenerationId id = 0;
                auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), id);
                if (ec != std::errc() || ptr != key.data() + key.size())
                    return std::unexpected("bad generation id in statuses: " + key);
                if (!val.is_string()) return std::unexpected("status must be a string: " + key);
                auto st = ParseGenerationStatus(val.get<std::string>());
                if (!st) return std::unexpected("unknown status for " + key);
                p.statuses[id] = *st;
            }
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::string("pointer record: ") + e.what());
    }
    (void)json_utils::GetStringIfPresent(j, "last_op", p.last_op);
    (void)json_utils::GetU64IfPresent(j, "seq", p.seq);
    return p;
}

FileStoreBackend::FileStoreBackend(std::string dir) : dir_(std::move(dir)) {}

std::string FileStoreBackend::GenerationsDir() const { return (fs::path(dir_) / "generations").string(); }

std::string FileStoreBackend::PointerPath() const { return (fs::path(dir_) / "current.json").string(); }

Result FileStoreBackend::Load(std::vector<Generation>& generations, PointerRecord& pointer) const {
    generations.clear();
    pointer = PointerRecord{};

    auto dr = EnsureDirectory(GenerationsDir());
    if (!dr.is_ok()) return dr;

    std::error_code ec;
    for (fs::directory_iterator it(GenerationsDir(), ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path p = it->path();
        auto id = IdFromFileName(p.filename());
        if (!id) {
            // Leftover "<id>.json.tmp" from an interrupted write is not a generation.
            LogDebug("Ignoring %s", p.string().c_str());
            continue;
        }

        json j;
        std::string err;
        if (!json_utils::LoadJsonObjectFromFile(p.string(), j, err))
            return Result::Fail(EIO, "generation store corrupt: " + err);
        auto g = GenerationRecordFromJson(j);
        if (!g) return Result::Fail(EIO, "generation store corrupt: " + p.string() + ": " + g.error());
        if (g->id != *id)
            return Result::Fail(EIO, "generation store corrupt: id mismatch in " + p.string());
        generations.push_back(std::move(*g));
    }
    if (ec) return Result::Fail(ec.value(), "cannot list " + GenerationsDir() + ": " + ec.message());

    if (!fs::exists(PointerPath(), ec)) {
        return Result::Ok();
    }

    json j;
    std::string err;
    if (!json_utils::LoadJsonObjectFromFile(PointerPath(), j, err))
        return Result::Fail(EIO, "generation store corrupt: " + err);
    auto parsed = PointerRecordFromJson(j);
    if (!parsed) return Result::Fail(EIO, "generation store corrupt: " + parsed.error());
    pointer = std::move(*parsed);
    return Result::Ok();
}

Result FileStoreBackend::WriteGeneration(const Generation& generation) {
    auto dr = EnsureDirectory(GenerationsDir());
    if (!dr.is_ok()) return dr;

    const fs::path path = fs::path(GenerationsDir()) / (std::to_string(generation.id) + ".json");
    std::error_code ec;
    if (fs::exists(path, ec)) {
        return Result::Fail(EEXIST, "generation record already exists: " + path.string());
    }
    return AtomicFile::Write(path.string(), GenerationRecordToJson(generation).dump(2) + "\n");
}

Result FileStoreBackend::CommitPointer(const PointerRecord& pointer) {
    return AtomicFile::Write(PointerPath(), PointerRecordToJson(pointer).dump(2) + "\n");
}

} // namespace genup
