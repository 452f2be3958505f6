#pragma once

#include "util/result.hpp"

#include <atomic>

namespace genup {

// Set by SIGINT/SIGTERM. Link it into a CancelToken to cancel a running session.
extern std::atomic_bool g_cancel;
// The signal that set g_cancel, 0 while none has arrived.
extern std::atomic_int g_cancel_signal;

// Routes SIGINT/SIGTERM into g_cancel and ignores SIGPIPE (notifier and builder
// children may exit before reading their stdin). Interrupted syscalls are not
// restarted, so blocking waits notice the cancel promptly.
Result InstallSignalHandlers();

} // namespace genup
