#pragma once

#include "mediatime/detail/time_math.hpp"

#include <chrono>
#include <concepts>
#include <exception>
#include <optional>
#include <type_traits>

#include <cstdint>
#include <cstdio>
#include <fmt/core.h>

namespace mediatime {

namespace detail {

template <typename T>
struct is_sys_time : std::false_type {};

template <typename Duration>
struct is_sys_time<std::chrono::sys_time<Duration>> : std::true_type {};

} // namespace detail

/**
 * Concept for wall-clock sources read by Instant::now() and friends
 *
 * A wall clock has a static now() returning a system_clock time point of any
 * resolution. std::chrono::system_clock satisfies it and is the default
 * everywhere. Tests substitute a type whose now() returns a fixed time point.
 */
template <typename C>
concept WallClock = requires {
    { C::now() };
} && detail::is_sys_time<std::remove_cvref_t<decltype(C::now())>>::value;

namespace detail {

/**
 * Report a broken wall clock and terminate.
 *
 * A clock before the epoch or beyond the 64-bit nanosecond range violates
 * the environment every timestamp in the process depends on. There is no
 * value to return that keeps later arithmetic meaningful.
 */
[[noreturn]] inline void clock_fault(const char* reason, int64_t epoch_seconds) noexcept {
    fmt::print(stderr, "mediatime: fatal clock fault: {} (clock reports {} s since epoch)\n",
               reason, epoch_seconds);
    std::terminate();
}

/**
 * Nanoseconds since the epoch for any time point; nullopt if it does not fit int64_t
 *
 * Seconds are truncated toward zero so the sub-second part carries the sign of
 * the value. The whole-second product then never overshoots the final result,
 * which keeps INT64_MIN nanoseconds representable.
 */
template <typename Duration>
std::optional<int64_t> time_point_to_nanoseconds(std::chrono::sys_time<Duration> tp) noexcept {
    auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto subsec = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);

    auto whole = checked_mul(static_cast<int64_t>(secs.count()), NANOS_PER_SECOND);
    if (!whole) {
        return std::nullopt;
    }
    return checked_add(*whole, static_cast<int64_t>(subsec.count()));
}

/// Read Clock as nanoseconds since the epoch; terminates on a corrupt clock
template <WallClock Clock>
int64_t read_wall_clock() noexcept {
    auto tp = Clock::now();
    auto since_epoch = tp.time_since_epoch();
    auto epoch_seconds =
        static_cast<int64_t>(std::chrono::floor<std::chrono::seconds>(since_epoch).count());

    if (since_epoch < decltype(since_epoch)::zero()) {
        clock_fault("time went backwards past the epoch", epoch_seconds);
    }
    auto nanos = time_point_to_nanoseconds(tp);
    if (!nanos) {
        clock_fault("timestamp does not fit 64-bit nanoseconds", epoch_seconds);
    }
    return *nanos;
}

} // namespace detail

} // namespace mediatime
