#pragma once

#include <chrono>
#include <cstdint>

namespace rummi::core {

// Wall clock so persisted time stamps stay meaningful across restarts.
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;

inline std::int64_t ToEpochMs(TimePoint point) {
    return std::chrono::duration_cast<Millis>(point.time_since_epoch()).count();
}

inline TimePoint FromEpochMs(std::int64_t ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(Millis(ms)));
}

}  // namespace rummi::core
