#pragma once

#include <string>

namespace tradegate {
namespace utils {

long long nowMs();

// Calendar date (YYYY-MM-DD) of ts_ms shifted by a fixed UTC offset.
// Daily-loss accounting is keyed by this string.
std::string tradeDateFor(long long ts_ms, int utc_offset_minutes = 0);

// UTC ISO-8601 rendering, e.g. 2026-10-19T14:03:07.125Z
std::string formatUtcIso(long long ts_ms);

// Compact local-free stamp used in draft filenames: yyyymmdd_HHMMSS (UTC)
std::string formatFileStamp(long long ts_ms);

} // namespace utils
} // namespace tradegate
