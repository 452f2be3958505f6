#pragma once

#include "util/result.hpp"

#include <string>
#include <sys/types.h>
#include <utility>

namespace genup {

// Owning POSIX file descriptor.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}

    // open(2) with O_CLOEXEC added to `flags`.
    static Result Open(const std::string& path, int flags, Fd& out, mode_t mode = 0644);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    Fd& operator=(Fd&& other) noexcept;
    ~Fd() { Reset(); }

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    // Drops the current descriptor without checking close(2) and adopts `fd`.
    void Reset(int fd = -1);
    int Release() { return std::exchange(fd_, -1); }

    // Closes and reports a close(2) failure. The descriptor is gone either way.
    Result Close();

  private:
    int fd_{-1};
};

} // namespace genup
