#include "util/time_utils.hpp"

#include <cstdio>
#include <ctime>

namespace genup {

std::int64_t ToEpochMillis(SystemTime t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

SystemTime FromEpochMillis(std::int64_t ms) {
    return SystemTime(std::chrono::duration_cast<SystemTime::duration>(std::chrono::milliseconds(ms)));
}

std::string FormatLocalTime(SystemTime t) {
    const std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    if (localtime_r(&tt, &tm) == nullptr) return {};
    char buf[32]{};
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

std::string FormatCompactUtc(SystemTime t) {
    const std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    if (gmtime_r(&tt, &tm) == nullptr) return {};
    char buf[32]{};
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

std::string FormatDuration(std::chrono::milliseconds d) {
    const long long ms = d.count() < 0 ? 0 : d.count();
    char buf[32]{};
    if (ms < 60 * 1000) {
        std::snprintf(buf, sizeof(buf), "%lld.%03llds", ms / 1000, ms % 1000);
    } else if (ms < 60LL * 60 * 1000) {
        std::snprintf(buf, sizeof(buf), "%lldm%02llds", ms / 60000, (ms / 1000) % 60);
    } else {
        std::snprintf(buf, sizeof(buf), "%lldh%02lldm", ms / 3600000, (ms / 60000) % 60);
    }
    return buf;
}

} // namespace genup
