#include "store/session_archive.hpp"

#include "io/atomic_file.hpp"
#include "io/file_reader.hpp"
#include "model/model_json.hpp"
#include "util/json_utils.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <memory>
#include <unistd.h>

namespace genup {

namespace fs = std::filesystem;

namespace {

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

struct ArchiveEntryDeleter {
    void operator()(archive_entry* e) const {
        if (e) archive_entry_free(e);
    }
};

std::string ArchiveErr(archive* a) {
    const char* s = archive_error_string(a);
    return s ? s : "unknown libarchive error";
}

std::string EntryFileName(const UpdateSession& session) {
    char ms[32]{};
    std::snprintf(ms, sizeof(ms), "%013lld", static_cast<long long>(ToEpochMillis(session.started_at)));
    return std::string(ms) + "-" + session.session_id + ".json";
}

// Writes the named entries of `dir` as a gzip-compressed tar at `path`.
Result WriteBundle(const std::string& dir, const std::vector<std::string>& names, const std::string& path) {
    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_new());
    if (!aw) return Result::Fail(-1, "archive_write_new failed");
    if (archive_write_add_filter_gzip(aw.get()) != ARCHIVE_OK)
        return Result::Fail(-1, "archive_write_add_filter_gzip: " + ArchiveErr(aw.get()));
    if (archive_write_set_format_pax_restricted(aw.get()) != ARCHIVE_OK)
        return Result::Fail(-1, "archive_write_set_format_pax_restricted: " + ArchiveErr(aw.get()));
    if (archive_write_open_filename(aw.get(), path.c_str()) != ARCHIVE_OK)
        return Result::Fail(-1, "archive_write_open_filename: " + ArchiveErr(aw.get()));

    const std::time_t now = std::time(nullptr);
    for (const auto& name : names) {
        std::string contents;
        auto rr = ReadFileToString((fs::path(dir) / name).string(), contents);
        if (!rr.is_ok()) return rr;

        std::unique_ptr<archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
        if (!entry) return Result::Fail(-1, "archive_entry_new failed");
        const std::string entry_path = "sessions/" + name;
        archive_entry_set_pathname(entry.get(), entry_path.c_str());
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), 0644);
        archive_entry_set_size(entry.get(), static_cast<la_int64_t>(contents.size()));
        archive_entry_set_mtime(entry.get(), now, 0);

        if (archive_write_header(aw.get(), entry.get()) != ARCHIVE_OK)
            return Result::Fail(-1, "archive_write_header: " + ArchiveErr(aw.get()));
        if (!contents.empty() &&
            archive_write_data(aw.get(), contents.data(), contents.size()) < 0)
            return Result::Fail(-1, "archive_write_data: " + ArchiveErr(aw.get()));
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK)
        return Result::Fail(-1, "archive_write_close: " + ArchiveErr(aw.get()));
    return Result::Ok();
}

} // namespace

SessionArchive::SessionArchive(std::string dir) : dir_(std::move(dir)) {}

Result SessionArchive::Append(const UpdateSession& session) {
    if (!session.IsTerminal()) {
        return Result::Fail(EINVAL, "refusing to archive unfinished session " + session.session_id);
    }
    auto dr = EnsureDirectory(dir_);
    if (!dr.is_ok()) return dr;

    const fs::path path = fs::path(dir_) / EntryFileName(session);
    auto wr = AtomicFile::Write(path.string(), ToJson(session).dump(2) + "\n");
    if (!wr.is_ok()) return wr;
    LogDebug("Archived session %s to %s", session.session_id.c_str(), path.string().c_str());
    return Result::Ok();
}

std::expected<std::vector<std::string>, std::string> SessionArchive::EntryNames() const {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::exists(dir_, ec)) return names;

    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path p = it->path();
        if (p.extension() == ".json" && it->is_regular_file(ec)) {
            names.push_back(p.filename().string());
        }
    }
    if (ec) return std::unexpected("cannot list " + dir_ + ": " + ec.message());
    std::sort(names.begin(), names.end());
    return names;
}

std::expected<std::vector<UpdateSession>, std::string> SessionArchive::ListRecent(std::size_t limit) const {
    auto names = EntryNames();
    if (!names) return std::unexpected(names.error());

    std::vector<UpdateSession> out;
    for (auto it = names->rbegin(); it != names->rend() && out.size() < limit; ++it) {
        const std::string path = (fs::path(dir_) / *it).string();
        nlohmann::json j;
        std::string err;
        if (!json_utils::LoadJsonObjectFromFile(path, j, err)) {
            LogWarn("Skipping archived session: %s", err.c_str());
            continue;
        }
        std::expected<UpdateSession, std::string> session = std::unexpected("not parsed");
        try {
            session = SessionFromJson(j);
        } catch (const nlohmann::json::exception& e) {
            session = std::unexpected(e.what());
        }
        if (!session) {
            LogWarn("Skipping archived session %s: %s", path.c_str(), session.error().c_str());
            continue;
        }
        out.push_back(std::move(*session));
    }
    return out;
}

Result SessionArchive::ExportBundle(const std::string& out_path) const {
    auto names = EntryNames();
    if (!names) return Result::Fail(EIO, names.error());

    // Written beside the destination and renamed into place on success.
    const std::string tmp_path = out_path + ".tmp";
    auto wr = WriteBundle(dir_, *names, tmp_path);
    if (!wr.is_ok()) {
        ::unlink(tmp_path.c_str());
        return wr;
    }
    if (::rename(tmp_path.c_str(), out_path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::FromErrno(err, "rename " + tmp_path + " -> " + out_path);
    }

    LogInfo("Exported %zu sessions to %s", names->size(), out_path.c_str());
    return Result::Ok();
}

} // namespace genup
