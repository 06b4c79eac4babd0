#pragma once

#include "mediatime/clock.hpp"
#include "mediatime/detail/time_math.hpp"
#include "mediatime/rescale.hpp"
#include "mediatime/span.hpp"

#include <chrono>
#include <limits>
#include <optional>

#include <cstdint>

namespace mediatime {

/**
 * Broken-down time handed to calendar and formatting collaborators.
 *
 * Floor semantics: nanoseconds is always in [0, 10^9), so 0.5s before the
 * epoch is {seconds: -1, nanoseconds: 500'000'000}.
 */
struct CalendarTime {
    int64_t seconds{0};
    uint32_t nanoseconds{0};

    constexpr bool operator==(const CalendarTime&) const noexcept = default;
};

/**
 * Absolute wall-clock time: signed nanoseconds since 1970-01-01T00:00:00Z.
 *
 * ## Range
 * Approximately 1677-09-21 to 2262-04-11. Negative values are valid and
 * represent instants before the epoch.
 *
 * ## Serialization
 * nanoseconds() and from_nanoseconds() expose the exact internal value; an
 * Instant encoded as a signed 64-bit integer round-trips bit for bit.
 *
 * ## Overflow Policy
 * Arithmetic with Span is checked and returns std::nullopt on overflow.
 * Reading a clock that is before the epoch or beyond the nanosecond range
 * terminates the process (see detail::clock_fault).
 */
class Instant {
public:
    /// Latest representable instant, used as a "never expires" sentinel
    static constexpr Instant max() noexcept {
        return Instant(std::numeric_limits<int64_t>::max());
    }

    // Default construction - the epoch
    constexpr Instant() noexcept = default;

    static constexpr Instant from_nanoseconds(int64_t ns) noexcept { return Instant(ns); }

    /// Current wall-clock time; terminates if Clock is before the epoch or out of range
    template <WallClock Clock = std::chrono::system_clock>
    static Instant now() noexcept {
        return Instant(detail::read_wall_clock<Clock>());
    }

    /// Convert any system_clock time point; nullopt if it does not fit
    static std::optional<Instant> from_chrono(std::chrono::system_clock::time_point tp) noexcept {
        auto ns = detail::time_point_to_nanoseconds(tp);
        if (!ns) {
            return std::nullopt;
        }
        return Instant(*ns);
    }

    std::chrono::system_clock::time_point to_chrono() const noexcept {
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::nanoseconds(nanos_)));
    }

    constexpr int64_t nanoseconds() const noexcept { return nanos_; }

    // Checked arithmetic with Span
    constexpr std::optional<Instant> checked_add(Span span) const noexcept {
        return wrap(detail::checked_add(nanos_, span.nanoseconds()));
    }

    constexpr std::optional<Instant> checked_sub(Span span) const noexcept {
        return wrap(detail::checked_sub(nanos_, span.nanoseconds()));
    }

    /// Span from other to this instant (this - other); nullopt on overflow
    constexpr std::optional<Span> difference(Instant other) const noexcept {
        auto ns = detail::checked_sub(nanos_, other.nanos_);
        if (!ns) {
            return std::nullopt;
        }
        return Span::from_nanoseconds(*ns);
    }

    /// Reports whether this instant is strictly after other
    constexpr bool after(Instant other) const noexcept { return nanos_ > other.nanos_; }

    /// Reports whether this instant is strictly before other
    constexpr bool before(Instant other) const noexcept { return nanos_ < other.nanos_; }

    // Every int64_t nanosecond count is inside the calendar range
    constexpr CalendarTime to_calendar() const noexcept {
        auto [sec, nanos] = detail::floor_split(nanos_);
        return CalendarTime{sec, nanos};
    }

    constexpr bool operator==(const Instant&) const noexcept = default;

private:
    int64_t nanos_{0};

    constexpr explicit Instant(int64_t ns) noexcept : nanos_(ns) {}

    static constexpr std::optional<Instant> wrap(std::optional<int64_t> ns) noexcept {
        if (!ns) {
            return std::nullopt;
        }
        return Instant(*ns);
    }
};

/**
 * Absolute time in 90 kHz ticks since the Unix epoch.
 *
 * Codec samples are stamped with this type. It is derived from the wall clock
 * by rescaling, never by a second clock reading.
 *
 * ## Range
 * The tick range spans roughly 11'000 times more time than Instant, so
 * conversion to Instant (and to calendar time) is checked. Conversion from
 * Instant always succeeds.
 */
class CodecInstant {
public:
    static constexpr int64_t TICKS_PER_SECOND = CODEC_TIMESCALE;

    // Default construction - the epoch
    constexpr CodecInstant() noexcept = default;

    static constexpr CodecInstant from_ticks(int64_t ticks) noexcept {
        return CodecInstant(ticks);
    }

    /// Rescale a wall-clock instant into ticks (truncates toward zero)
    static constexpr CodecInstant from_instant(Instant instant) noexcept {
        return CodecInstant(rescale(instant.nanoseconds(), TICKS_PER_SECOND));
    }

    template <WallClock Clock = std::chrono::system_clock>
    static CodecInstant now() noexcept {
        return from_instant(Instant::now<Clock>());
    }

    constexpr int64_t ticks() const noexcept { return ticks_; }

    /// Offset from the epoch as a span
    constexpr CodecSpan since_epoch() const noexcept { return CodecSpan::from_ticks(ticks_); }

    // Checked arithmetic with CodecSpan
    constexpr std::optional<CodecInstant> checked_add(CodecSpan span) const noexcept {
        return wrap(detail::checked_add(ticks_, span.ticks()));
    }

    constexpr std::optional<CodecInstant> checked_sub(CodecSpan span) const noexcept {
        return wrap(detail::checked_sub(ticks_, span.ticks()));
    }

    /// Span from other to this instant (this - other); nullopt on overflow
    constexpr std::optional<CodecSpan> difference(CodecInstant other) const noexcept {
        auto ticks = detail::checked_sub(ticks_, other.ticks_);
        if (!ticks) {
            return std::nullopt;
        }
        return CodecSpan::from_ticks(*ticks);
    }

    constexpr bool after(CodecInstant other) const noexcept { return ticks_ > other.ticks_; }
    constexpr bool before(CodecInstant other) const noexcept { return ticks_ < other.ticks_; }

    /**
     * Convert back to wall-clock nanoseconds.
     *
     * Whole seconds and remainder ticks are scaled separately, so the result is
     * exact for every tick count whose nanosecond value fits in int64_t.
     *
     * @return Instant, or nullopt if the value is outside the Instant range
     */
    constexpr std::optional<Instant> to_instant() const noexcept {
        auto ns = checked_rescale_to_nanoseconds(ticks_, TICKS_PER_SECOND);
        if (!ns) {
            return std::nullopt;
        }
        return Instant::from_nanoseconds(*ns);
    }

    constexpr std::optional<CalendarTime> to_calendar() const noexcept {
        auto instant = to_instant();
        if (!instant) {
            return std::nullopt;
        }
        return instant->to_calendar();
    }

    constexpr bool operator==(const CodecInstant&) const noexcept = default;

private:
    int64_t ticks_{0};

    constexpr explicit CodecInstant(int64_t ticks) noexcept : ticks_(ticks) {}

    static constexpr std::optional<CodecInstant> wrap(std::optional<int64_t> ticks) noexcept {
        if (!ticks) {
            return std::nullopt;
        }
        return CodecInstant(*ticks);
    }
};

// Define Span::until after Instant is complete
template <WallClock Clock>
std::optional<Span> Span::until(Instant deadline) noexcept {
    return deadline.difference(Instant::now<Clock>());
}

} // namespace mediatime
