#include "system/signals.hpp"

#include <cerrno>
#include <csignal>
#include <string>

namespace genup {

std::atomic_bool g_cancel{false};
std::atomic_int g_cancel_signal{0};

namespace {

void OnCancelSignal(int sig) {
    g_cancel_signal.store(sig, std::memory_order_relaxed);
    g_cancel.store(true, std::memory_order_relaxed);
}

Result Install(int sig, void (*handler)(int)) {
    struct sigaction sa{};
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    if (::sigaction(sig, &sa, nullptr) != 0)
        return Result::FromErrno(errno, "sigaction " + std::to_string(sig));
    return Result::Ok();
}

} // namespace

Result InstallSignalHandlers() {
    static_assert(std::atomic_bool::is_always_lock_free && std::atomic_int::is_always_lock_free);
    for (int sig : {SIGINT, SIGTERM}) {
        if (auto r = Install(sig, OnCancelSignal); !r.ok)
            return r;
    }
    return Install(SIGPIPE, SIG_IGN);
}

} // namespace genup
