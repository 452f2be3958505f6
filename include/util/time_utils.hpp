#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace genup {

using SystemTime = std::chrono::system_clock::time_point;

std::int64_t ToEpochMillis(SystemTime t);
SystemTime FromEpochMillis(std::int64_t ms);

// "2026-10-19 14:03:07" in local time.
std::string FormatLocalTime(SystemTime t);
// "20261019T140307Z", sortable, safe in file names.
std::string FormatCompactUtc(SystemTime t);
// "1.250s", "2m05s", "1h02m".
std::string FormatDuration(std::chrono::milliseconds d);

} // namespace genup
