/**
 * @file Clock.hpp
 * @brief Time aliases shared by every analysis component.
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace worldpulse::domain {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/** @brief Milliseconds since the Unix epoch, used for ids and persistence. */
inline std::int64_t ToEpochMillis(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

inline Timestamp FromEpochMillis(std::int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace worldpulse::domain
