#include "io/fd.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace genup {

Result Fd::Open(const std::string& path, int flags, Fd& out, mode_t mode) {
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0)
        return Result::FromErrno(errno, "open " + path);
    out.Reset(fd);
    return Result::Ok();
}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other)
        Reset(other.Release());
    return *this;
}

void Fd::Reset(int fd) {
    if (fd_ >= 0 && fd_ != fd)
        (void)::close(fd_);
    fd_ = fd;
}

Result Fd::Close() {
    if (fd_ < 0)
        return Result::Ok();
    const int fd = std::exchange(fd_, -1);
    // Linux releases the descriptor even when close() reports EINTR.
    if (::close(fd) != 0 && errno != EINTR)
        return Result::FromErrno(errno, "close");
    return Result::Ok();
}

} // namespace genup
