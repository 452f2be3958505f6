#include "io/atomic_file.hpp"

#include "io/fd.hpp"
#include "io/file_writer.hpp"

#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>

namespace genup {

namespace fs = std::filesystem;

namespace {

Result FsyncDirectory(const fs::path& dir) {
    const std::string d = dir.empty() ? std::string(".") : dir.string();
    Fd fd;
    if (auto r = Fd::Open(d, O_RDONLY | O_DIRECTORY, fd); !r.ok)
        return r;
    if (::fsync(fd.Get()) != 0)
        return Result::FromErrno(errno, "fsync " + d);
    return fd.Close().Within(d);
}

} // namespace

Result AtomicFile::Write(const std::string& path, const std::string& contents) {
    const std::string tmp_path = path + ".tmp";

    FileWriter writer;
    auto open_res = FileWriter::Open(tmp_path, writer);
    if (!open_res.is_ok()) return open_res;

    auto write_res = writer.WriteAll(contents);
    if (write_res.is_ok())
        write_res = writer.Sync();
    if (auto close_res = writer.Close(); write_res.is_ok())
        write_res = close_res;
    if (!write_res.is_ok()) {
        ::unlink(tmp_path.c_str());
        return write_res;
    }

    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::FromErrno(err, "rename " + tmp_path + " -> " + path);
    }

    return FsyncDirectory(fs::path(path).parent_path());
}

Result EnsureDirectory(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "create_directories failed: " + dir + ": " + ec.message());
    }
    return Result::Ok();
}

} // namespace genup
