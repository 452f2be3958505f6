#include "io/file_reader.hpp"

#include "io/gzip_reader.hpp"

#include <array>
#include <cerrno>
#include <fcntl.h>
#include <memory>
#include <sys/stat.h>
#include <unistd.h>

namespace genup {

Result FileReader::Open(const std::string& path, FileReader& out) {
    Fd fd;
    if (auto r = Fd::Open(path, O_RDONLY, fd); !r.ok)
        return r;

    struct stat st{};
    if (::fstat(fd.Get(), &st) != 0)
        return Result::FromErrno(errno, "stat " + path);
    if (S_ISDIR(st.st_mode))
        return Result::Fail(EISDIR, path + " is a directory");

    out.fd_ = std::move(fd);
    out.size_ = S_ISREG(st.st_mode) ? std::optional<std::uint64_t>(static_cast<std::uint64_t>(st.st_size)) : std::nullopt;
    return Result::Ok();
}

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    ssize_t n;
    do {
        n = ::read(fd_.Get(), out.data(), out.size());
    } while (n < 0 && errno == EINTR);
    return n;
}

Result ReadAllToString(IReader& reader, std::string& out, std::uint64_t limit) {
    out.clear();
    if (auto size = reader.TotalSize(); size && *size > limit)
        return Result::Fail(EFBIG, "input exceeds " + std::to_string(limit) + " bytes");

    std::array<std::uint8_t, 16 * 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(buf);
        if (n == 0)
            return Result::Ok();
        if (n < 0)
            return Result::FromErrno(errno, "read failed");
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
        if (out.size() > limit)
            return Result::Fail(EFBIG, "input exceeds " + std::to_string(limit) + " bytes");
    }
}

Result ReadFileToString(const std::string& path, std::string& out) {
    auto file = std::make_unique<FileReader>();
    if (auto r = FileReader::Open(path, *file); !r.ok)
        return r;

    if (!path.ends_with(".gz"))
        return ReadAllToString(*file, out).Within(path);

    GzipReader gz(std::move(file));
    Result r = ReadAllToString(gz, out);
    if (!r.ok && !gz.Error().empty())
        r = Result::Fail(r.err, gz.Error());
    return r.Within(path);
}

} // namespace genup
