#pragma once

/**
 * @file mediatime_utils.hpp
 * @brief Convenience header for frame timing utilities
 *
 * Primary types:
 * - FrameClock: PTS generator for fixed-duration frames
 * - StartTime: Deferred start specification (now, next second, absolute, zero)
 *
 * Helpers:
 * - frame_duration_from_rate(): exact tick duration for a rational frame rate
 */

#include "utils/frame_clock.hpp"
#include "utils/start_time.hpp"

namespace mediatime {

template <WallClock Clock = std::chrono::system_clock>
using FrameClock = utils::FrameClock<Clock>;

using StartTime = utils::StartTime;

} // namespace mediatime
