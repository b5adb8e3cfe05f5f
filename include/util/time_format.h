#pragma once
#include <chrono>
#include <string>

namespace util {

// strftime-формат по локальному времени, например "%Y-%m-%d %H:%M:%S".
std::string formatLocalTime(std::chrono::system_clock::time_point tp, const char* fmt);

// "Motion detected at 2024-05-01 13:45:10"
std::string motionMessage(std::chrono::system_clock::time_point tp);

// "event_20240501_134510.jpg"
std::string snapshotFileName(std::chrono::system_clock::time_point tp);

} // namespace util
