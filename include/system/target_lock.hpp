#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <string>

namespace genup {

// Exclusive advisory lock (flock) on a per-target lock file. Held for the lifetime
// of the object; a second holder, in this or another process, is refused instead
// of blocking.
class TargetLock {
  public:
    static Result Acquire(const std::string& lock_path, TargetLock& out);

    TargetLock() = default;
    TargetLock(const TargetLock&) = delete;
    TargetLock& operator=(const TargetLock&) = delete;
    TargetLock(TargetLock&&) noexcept = default;
    TargetLock& operator=(TargetLock&&) noexcept = default;
    ~TargetLock() = default;

    bool Held() const { return fd_.Valid(); }
    void Release() { fd_.Reset(); }

  private:
    Fd fd_;
};

} // namespace genup
