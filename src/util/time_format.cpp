#include "util/time_format.h"
#include <ctime>

namespace util {

std::string formatLocalTime(std::chrono::system_clock::time_point tp, const char* fmt) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);

    char buf[64];
    const size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

std::string motionMessage(std::chrono::system_clock::time_point tp) {
    return "Motion detected at " + formatLocalTime(tp, "%Y-%m-%d %H:%M:%S");
}

std::string snapshotFileName(std::chrono::system_clock::time_point tp) {
    return "event_" + formatLocalTime(tp, "%Y%m%d_%H%M%S") + ".jpg";
}

} // namespace util
