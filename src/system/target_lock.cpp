#include "system/target_lock.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/file.h>

namespace genup {

Result TargetLock::Acquire(const std::string& lock_path, TargetLock& out) {
    out.Release();

    Fd fd;
    if (auto r = Fd::Open(lock_path, O_RDWR | O_CREAT, fd); !r.ok)
        return r.Within("lock file");

    while (::flock(fd.Get(), LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        if (err == EINTR) continue;
        if (err == EWOULDBLOCK) {
            return Result::Fail(err, "target is busy (lock held): " + lock_path);
        }
        return Result::FromErrno(err, "flock " + lock_path);
    }

    out.fd_ = std::move(fd);
    return Result::Ok();
}

} // namespace genup
