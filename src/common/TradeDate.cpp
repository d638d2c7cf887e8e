#include "common/TradeDate.h"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace tradegate {
namespace utils {

namespace {
std::tm toUtcTm(long long seconds) {
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm out{};
#ifdef _WIN32
    gmtime_s(&out, &t);
#else
    gmtime_r(&t, &out);
#endif
    return out;
}

long long floorDiv(long long value, long long divisor) {
    long long q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --q;
    }
    return q;
}
} // namespace

long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string tradeDateFor(long long ts_ms, int utc_offset_minutes) {
    const long long shifted_ms = ts_ms + static_cast<long long>(utc_offset_minutes) * 60LL * 1000LL;
    const std::tm tm = toUtcTm(floorDiv(shifted_ms, 1000));
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    return buffer;
}

std::string formatUtcIso(long long ts_ms) {
    const long long seconds = floorDiv(ts_ms, 1000);
    const int millis = static_cast<int>(ts_ms - seconds * 1000);
    const std::tm tm = toUtcTm(seconds);
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buffer;
}

std::string formatFileStamp(long long ts_ms) {
    const std::tm tm = toUtcTm(floorDiv(ts_ms, 1000));
    char buffer[24];
    std::snprintf(buffer, sizeof(buffer), "%04d%02d%02d_%02d%02d%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buffer;
}

} // namespace utils
} // namespace tradegate
