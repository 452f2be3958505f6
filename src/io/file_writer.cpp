#include "io/file_writer.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace genup {

Result FileWriter::Open(std::string path, FileWriter& out, Mode mode) {
    const int flags = O_WRONLY | O_CREAT | (mode == Mode::Append ? O_APPEND : O_TRUNC);
    Fd fd;
    if (auto r = Fd::Open(path, flags, fd); !r.ok)
        return r;
    out.fd_ = std::move(fd);
    out.path_ = std::move(path);
    return Result::Ok();
}

Result WriteFully(int fd, std::span<const std::uint8_t> in, const std::string& name) {
    while (!in.empty()) {
        const ssize_t n = ::write(fd, in.data(), in.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::FromErrno(errno, "write " + name);
        }
        in = in.subspan(static_cast<size_t>(n));
    }
    return Result::Ok();
}

Result WriteFully(int fd, std::string_view in, const std::string& name) {
    return WriteFully(fd, std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(in.data()), in.size()), name);
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    return WriteFully(fd_.Get(), in, path_);
}

Result FileWriter::WriteAll(std::string_view in) {
    return WriteFully(fd_.Get(), in, path_);
}

Result FileWriter::Sync() {
    if (::fsync(fd_.Get()) != 0)
        return Result::FromErrno(errno, "fsync " + path_);
    return Result::Ok();
}

} // namespace genup
