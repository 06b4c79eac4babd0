#pragma once

#include "mediatime/detail/time_math.hpp"

#include <optional>

#include <cstdint>

namespace mediatime {

/**
 * Convert a nanosecond count into an integer timescale (ticks per second).
 *
 * Whole seconds and the sub-second remainder are scaled separately, so the
 * intermediate product never exceeds |remainder| * timescale < 10^9 * timescale.
 * A direct nanoseconds * timescale would overflow after about 28 hours at 90 kHz.
 *
 * Results are exact for multiples of the tick period and truncated toward
 * zero otherwise.
 *
 * @param nanoseconds Value to convert (full int64_t range)
 * @param timescale Target ticks per second, must be in (0, NANOS_PER_SECOND]
 * @return Value in ticks of the target timescale
 */
[[nodiscard]] constexpr int64_t rescale(int64_t nanoseconds, int64_t timescale) noexcept {
    return detail::scale_split(nanoseconds, NANOS_PER_SECOND, timescale);
}

/**
 * rescale() for any timescale.
 *
 * @return Value in ticks, or nullopt if timescale <= 0 or the result overflows
 */
[[nodiscard]] constexpr std::optional<int64_t> checked_rescale(int64_t nanoseconds,
                                                               int64_t timescale) noexcept {
    return detail::checked_scale_split(nanoseconds, NANOS_PER_SECOND, timescale);
}

/**
 * Inverse of rescale(): convert ticks of a timescale back into nanoseconds.
 *
 * Same split as rescale() with the roles of timescale and NANOS_PER_SECOND
 * swapped. Scaling up can leave the int64_t range, hence the optional.
 *
 * @return Nanoseconds, or nullopt if timescale <= 0 or the result overflows
 */
[[nodiscard]] constexpr std::optional<int64_t>
checked_rescale_to_nanoseconds(int64_t ticks, int64_t timescale) noexcept {
    return detail::checked_scale_split(ticks, timescale, NANOS_PER_SECOND);
}

} // namespace mediatime
