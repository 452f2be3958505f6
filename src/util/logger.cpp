#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <utility>

namespace genup {

namespace {

thread_local std::string t_context;

// "2026-01-31 12:00:00.123"
std::string Timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    if (localtime_r(&secs, &tm) == nullptr)
        return {};
    char buf[32];
    const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
    return buf;
}

void AppendV(std::string& out, const char* fmt, va_list ap) {
    va_list copy;
    va_copy(copy, ap);
    const int n = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (n <= 0)
        return;
    const size_t old = out.size();
    out.resize(old + static_cast<size_t>(n) + 1);
    std::vsnprintf(out.data() + old, static_cast<size_t>(n) + 1, fmt, ap);
    out.resize(old + static_cast<size_t>(n));
}

void WriteStderr(LogLevel, const std::string& line) {
    std::string buf = line;
    buf.push_back('\n');
    std::fwrite(buf.data(), 1, buf.size(), stderr);
}

} // namespace

bool ParseLogLevel(const std::string& s, LogLevel& out) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (v == "debug") { out = LogLevel::Debug; return true; }
    if (v == "info")  { out = LogLevel::Info;  return true; }
    if (v == "warn" || v == "warning") { out = LogLevel::Warn; return true; }
    if (v == "error") { out = LogLevel::Error; return true; }
    if (v == "none")  { out = LogLevel::None;  return true; }
    return false;
}

const char* ToString(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::None:  break;
    }
    return "LOG";
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

Logger::Sink Logger::SetSink(Sink sink) {
    std::lock_guard<std::mutex> lk(sink_mu_);
    return std::exchange(sink_, std::move(sink));
}

void Logger::Write(LogLevel lvl, const char* file, int line, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VWrite(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VWrite(LogLevel lvl, const char* file, int line, const char* fmt, va_list ap) {
    if (!Enabled(lvl))
        return;

    std::string out;
    out.reserve(128);
    if (const std::string ts = Timestamp(); !ts.empty())
        out += "[" + ts + "] ";
    out += "[";
    out += ToString(lvl);
    out += "] ";
    if (file && line > 0) {
        const char* slash = std::strrchr(file, '/');
        out += "[";
        out += slash ? slash + 1 : file;
        out += ":" + std::to_string(line) + "] ";
    }
    if (!t_context.empty())
        out += "[" + t_context + "] ";
    AppendV(out, fmt, ap);

    std::lock_guard<std::mutex> lk(sink_mu_);
    if (sink_)
        sink_(lvl, out);
    else
        WriteStderr(lvl, out);
}

ScopedLogContext::ScopedLogContext(std::string context) : prev_(std::move(t_context)) {
    t_context = std::move(context);
}

ScopedLogContext::~ScopedLogContext() { t_context = std::move(prev_); }

} // namespace genup
