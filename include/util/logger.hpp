#pragma once

#include <atomic>
#include <cstdarg>
#include <functional>
#include <mutex>
#include <string>

namespace genup {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn"/"warning", "error", "none" (case-insensitive).
bool ParseLogLevel(const std::string& s, LogLevel& out);
const char* ToString(LogLevel lvl);

// Process-wide logger. Each record is formatted completely before it reaches
// the sink, so lines from concurrent sessions never interleave.
class Logger {
public:
    // Receives one formatted line without the trailing newline.
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& Instance();

    void SetLevel(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }
    LogLevel Level() const { return level_.load(std::memory_order_relaxed); }
    bool Enabled(LogLevel lvl) const { return lvl != LogLevel::None && lvl >= Level(); }

    // Null restores the stderr sink. Returns the previous sink.
    Sink SetSink(Sink sink);

    void Write(LogLevel lvl, const char* file, int line, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));

private:
    Logger() = default;
    void VWrite(LogLevel lvl, const char* file, int line, const char* fmt, va_list ap);

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex sink_mu_;
    Sink sink_;
};

// Tags every line logged by the current thread with "[<context>]" while alive.
// The orchestrator uses "<target>/<session-id>" so interleaved sessions stay readable.
class ScopedLogContext {
public:
    explicit ScopedLogContext(std::string context);
    ScopedLogContext(const ScopedLogContext&) = delete;
    ScopedLogContext& operator=(const ScopedLogContext&) = delete;
    ~ScopedLogContext();

private:
    std::string prev_;
};

#define GENUP_LOG(lvl, ...)                                                         \
    do {                                                                            \
        auto& genup_logger_ = ::genup::Logger::Instance();                          \
        if (genup_logger_.Enabled(lvl))                                             \
            genup_logger_.Write(lvl, __FILE__, __LINE__, __VA_ARGS__);              \
    } while (0)

#define LogDebug(...) GENUP_LOG(::genup::LogLevel::Debug, __VA_ARGS__)
#define LogInfo(...)  GENUP_LOG(::genup::LogLevel::Info, __VA_ARGS__)
#define LogWarn(...)  GENUP_LOG(::genup::LogLevel::Warn, __VA_ARGS__)
#define LogError(...) GENUP_LOG(::genup::LogLevel::Error, __VA_ARGS__)

} // namespace genup
