#pragma once

#include <cstdint>
#include <format>
#include <string>

namespace timestamp {

//  500 -> 00:00:05.000
// 6000 -> 00:01:00.000
inline std::string format(int64_t centiseconds, bool comma = false) {
    int64_t msec = centiseconds * 10;
    int64_t hr = msec / (1000 * 60 * 60);
    msec -= hr * (1000 * 60 * 60);
    int64_t min = msec / (1000 * 60);
    msec -= min * (1000 * 60);
    int64_t sec = msec / 1000;
    msec -= sec * 1000;

    return std::format("{:02}:{:02}:{:02}{}{:03}", hr, min, sec, comma ? ',' : '.', msec);
}

} // namespace timestamp
