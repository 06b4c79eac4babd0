// include/mediatime/detail/time_math.hpp
#pragma once

#include <limits>
#include <optional>
#include <utility>

#include <cstdint>

namespace mediatime {

inline constexpr int64_t NANOS_PER_MICROSECOND = 1'000;
inline constexpr int64_t NANOS_PER_MILLISECOND = 1'000'000;
inline constexpr int64_t NANOS_PER_SECOND = 1'000'000'000;
inline constexpr int64_t NANOS_PER_MINUTE = NANOS_PER_SECOND * 60;
inline constexpr int64_t NANOS_PER_HOUR = NANOS_PER_MINUTE * 60;

/// H264 clock rate: ticks per second
inline constexpr int64_t CODEC_TIMESCALE = 90'000;
inline constexpr int64_t CODEC_TICKS_PER_MILLISECOND = CODEC_TIMESCALE / 1'000;

} // namespace mediatime

namespace mediatime::detail {

/**
 * Centralized integer arithmetic for Span, Instant and their codec counterparts.
 *
 * Overflow policy:
 * - Every operation that can leave the int64_t range returns std::nullopt
 * - Nothing saturates and nothing wraps
 * - Division and remainder by zero return std::nullopt, as does INT64_MIN / -1
 */

constexpr std::optional<int64_t> checked_add(int64_t a, int64_t b) noexcept {
    int64_t result = 0;
    if (__builtin_add_overflow(a, b, &result)) {
        return std::nullopt;
    }
    return result;
}

constexpr std::optional<int64_t> checked_sub(int64_t a, int64_t b) noexcept {
    int64_t result = 0;
    if (__builtin_sub_overflow(a, b, &result)) {
        return std::nullopt;
    }
    return result;
}

constexpr std::optional<int64_t> checked_mul(int64_t a, int64_t b) noexcept {
    int64_t result = 0;
    if (__builtin_mul_overflow(a, b, &result)) {
        return std::nullopt;
    }
    return result;
}

constexpr std::optional<int64_t> checked_div(int64_t a, int64_t b) noexcept {
    if (b == 0 || (a == std::numeric_limits<int64_t>::min() && b == -1)) {
        return std::nullopt;
    }
    return a / b;
}

constexpr std::optional<int64_t> checked_rem(int64_t a, int64_t b) noexcept {
    if (b == 0 || (a == std::numeric_limits<int64_t>::min() && b == -1)) {
        return std::nullopt;
    }
    return a % b;
}

constexpr std::optional<int64_t> checked_neg(int64_t a) noexcept {
    if (a == std::numeric_limits<int64_t>::min()) {
        return std::nullopt;
    }
    return -a;
}

/**
 * Split a nanosecond count into (seconds, nanoseconds) with floor semantics.
 *
 * The remainder is always in [0, 10^9), so -1.5s splits into {-2, 500'000'000}.
 * Cannot overflow: the seconds component of any int64_t fits with room to spare.
 */
constexpr auto floor_split(int64_t nanos) noexcept -> std::pair<int64_t, uint32_t> {
    int64_t sec = nanos / NANOS_PER_SECOND;
    int64_t rem = nanos % NANOS_PER_SECOND;
    if (rem < 0) {
        sec -= 1;
        rem += NANOS_PER_SECOND;
    }
    return {sec, static_cast<uint32_t>(rem)};
}

/**
 * Convert a count at from_rate units/second into to_rate units/second.
 *
 * The value is split into whole seconds and a remainder before scaling:
 *
 *   (value / from_rate) * to_rate + ((value % from_rate) * to_rate) / from_rate
 *
 * Both divisions truncate toward zero, so the remainder carries the sign of the
 * value and the result is rounded toward zero. Only the whole-seconds product
 * can grow with the value; the remainder product is bounded by from_rate * to_rate.
 *
 * Unchecked: caller guarantees the result fits (to_rate <= from_rate always does).
 */
constexpr int64_t scale_split(int64_t value, int64_t from_rate, int64_t to_rate) noexcept {
    int64_t whole = value / from_rate;
    int64_t rem = value % from_rate;
    return (whole * to_rate) + ((rem * to_rate) / from_rate);
}

/// Checked scale_split; nullopt on non-positive rates or when the result overflows
constexpr std::optional<int64_t> checked_scale_split(int64_t value, int64_t from_rate,
                                                     int64_t to_rate) noexcept {
    if (from_rate <= 0 || to_rate <= 0) {
        return std::nullopt;
    }
    int64_t whole = value / from_rate;
    int64_t rem = value % from_rate;

    auto scaled_whole = checked_mul(whole, to_rate);
    if (!scaled_whole) {
        return std::nullopt;
    }
    // |rem| < from_rate, so the quotient is below to_rate and fits int64_t
    auto scaled_rem = static_cast<int64_t>(static_cast<__int128_t>(rem) *
                                           static_cast<__int128_t>(to_rate) /
                                           static_cast<__int128_t>(from_rate));
    return checked_add(*scaled_whole, scaled_rem);
}

} // namespace mediatime::detail
