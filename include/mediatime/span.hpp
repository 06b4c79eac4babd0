#pragma once

#include "mediatime/clock.hpp"
#include "mediatime/conversion_error.hpp"
#include "mediatime/detail/time_math.hpp"
#include "mediatime/expected.hpp"
#include "mediatime/rescale.hpp"

#include <chrono>
#include <cmath>
#include <compare>
#include <limits>
#include <optional>

#include <cstdint>

namespace mediatime {

// Forward declarations
class Instant;
class CodecSpan;

/**
 * Signed wall-clock time interval with nanosecond resolution.
 *
 * ## Storage
 * A single int64_t nanosecond count, approximately +/-292 years.
 *
 * ## Overflow Policy
 * Arithmetic is checked and returns std::nullopt when the result leaves the
 * int64_t range. Nothing saturates or wraps.
 *
 * Unit factories taking uint32_t milliseconds or seconds cannot overflow and
 * return a Span directly. UINT32_MAX minutes or hours do not fit, so those
 * factories are checked.
 *
 * This is a core library type: noexcept, no allocation.
 */
class Span {
public:
    static constexpr Span zero() noexcept { return Span(0); }

    // Default construction - zero span
    constexpr Span() noexcept = default;

    static constexpr Span from_nanoseconds(int64_t ns) noexcept { return Span(ns); }

    /// Truncates toward zero; nullopt for non-finite input or values outside int64_t
    static std::optional<Span> from_nanoseconds_f64(double ns) noexcept {
        if (!std::isfinite(ns)) {
            return std::nullopt;
        }
        // 2^63 is exact in a double; int64_t covers [-2^63, 2^63)
        constexpr double limit = 9'223'372'036'854'775'808.0;
        double whole = std::trunc(ns);
        if (whole < -limit || whole >= limit) {
            return std::nullopt;
        }
        return Span(static_cast<int64_t>(whole));
    }

    static constexpr Span from_milliseconds(uint32_t ms) noexcept {
        return Span(static_cast<int64_t>(ms) * NANOS_PER_MILLISECOND);
    }

    static constexpr Span from_seconds(uint32_t s) noexcept {
        static_assert(static_cast<int64_t>(std::numeric_limits<uint32_t>::max()) <=
                          std::numeric_limits<int64_t>::max() / NANOS_PER_SECOND,
                      "uint32_t seconds must fit in int64_t nanoseconds");
        return Span(static_cast<int64_t>(s) * NANOS_PER_SECOND);
    }

    static constexpr std::optional<Span> from_minutes(uint32_t minutes) noexcept {
        return from_units(minutes, NANOS_PER_MINUTE);
    }

    static constexpr std::optional<Span> from_hours(uint32_t hours) noexcept {
        return from_units(hours, NANOS_PER_HOUR);
    }

    /**
     * Time remaining until deadline, measured against Clock.
     *
     * Defined in instant.hpp, which this header pulls in after Span is complete.
     *
     * @return deadline - now, or nullopt if the subtraction overflows
     */
    template <WallClock Clock = std::chrono::system_clock>
    static std::optional<Span> until(Instant deadline) noexcept;

    constexpr int64_t nanoseconds() const noexcept { return nanos_; }

    // Predicates
    constexpr bool is_zero() const noexcept { return nanos_ == 0; }
    constexpr bool is_negative() const noexcept { return nanos_ < 0; }

    // Checked arithmetic
    constexpr std::optional<Span> checked_add(Span other) const noexcept {
        return wrap(detail::checked_add(nanos_, other.nanos_));
    }

    constexpr std::optional<Span> checked_sub(Span other) const noexcept {
        return wrap(detail::checked_sub(nanos_, other.nanos_));
    }

    constexpr std::optional<Span> checked_neg() const noexcept {
        return wrap(detail::checked_neg(nanos_));
    }

    /// Convert to 90 kHz ticks (truncates toward zero, cannot overflow)
    constexpr CodecSpan to_codec_span() const noexcept;

    /// Convert to std::chrono; nullopt for negative spans
    constexpr std::optional<std::chrono::nanoseconds> to_std_duration() const noexcept {
        if (nanos_ < 0) {
            return std::nullopt;
        }
        return std::chrono::nanoseconds(nanos_);
    }

    // Comparison
    constexpr auto operator<=>(const Span&) const noexcept = default;
    constexpr bool operator==(const Span&) const noexcept = default;

private:
    int64_t nanos_{0};

    constexpr explicit Span(int64_t ns) noexcept : nanos_(ns) {}

    static constexpr std::optional<Span> wrap(std::optional<int64_t> ns) noexcept {
        if (!ns) {
            return std::nullopt;
        }
        return Span(*ns);
    }

    static constexpr std::optional<Span> from_units(uint32_t count, int64_t unit) noexcept {
        return wrap(detail::checked_mul(static_cast<int64_t>(count), unit));
    }
};

/**
 * Signed time interval in 90 kHz codec ticks.
 *
 * H264 presentation and decode timestamps are computed in this unit: frame
 * duration accumulation, PTS/DTS offsets and cadence checks all use the full
 * set of checked operations below.
 *
 * ## Conversions
 * - to_milliseconds() is exact and cannot overflow (the target rate is lower)
 * - to_nanoseconds() / to_span() scale up and are checked
 * - to_i32() / to_u32() narrow for 32-bit container fields
 * - to_seconds() is lossy; use it for logging and metrics only
 *
 * This is a core library type: noexcept, no allocation.
 */
class CodecSpan {
public:
    static constexpr int64_t TICKS_PER_SECOND = CODEC_TIMESCALE;
    static constexpr int64_t TICKS_PER_MILLISECOND = CODEC_TICKS_PER_MILLISECOND;

    static constexpr CodecSpan zero() noexcept { return CodecSpan(0); }

    // Default construction - zero span
    constexpr CodecSpan() noexcept = default;

    static constexpr CodecSpan from_ticks(int64_t ticks) noexcept { return CodecSpan(ticks); }

    constexpr int64_t ticks() const noexcept { return ticks_; }

    // Predicates
    constexpr bool is_zero() const noexcept { return ticks_ == 0; }
    constexpr bool is_negative() const noexcept { return ticks_ < 0; }

    // Checked arithmetic - nullopt on overflow or division by zero
    constexpr std::optional<CodecSpan> checked_add(CodecSpan other) const noexcept {
        return wrap(detail::checked_add(ticks_, other.ticks_));
    }

    constexpr std::optional<CodecSpan> checked_sub(CodecSpan other) const noexcept {
        return wrap(detail::checked_sub(ticks_, other.ticks_));
    }

    constexpr std::optional<CodecSpan> checked_mul(int64_t factor) const noexcept {
        return wrap(detail::checked_mul(ticks_, factor));
    }

    constexpr std::optional<CodecSpan> checked_div(int64_t divisor) const noexcept {
        return wrap(detail::checked_div(ticks_, divisor));
    }

    /// Ratio of two spans, truncated toward zero
    constexpr std::optional<int64_t> checked_div(CodecSpan divisor) const noexcept {
        return detail::checked_div(ticks_, divisor.ticks_);
    }

    constexpr std::optional<CodecSpan> checked_rem(CodecSpan divisor) const noexcept {
        return wrap(detail::checked_rem(ticks_, divisor.ticks_));
    }

    // Lossy conversion to seconds, for logging only
    constexpr double to_seconds() const noexcept {
        int64_t sec = ticks_ / TICKS_PER_SECOND;
        int64_t rem = ticks_ % TICKS_PER_SECOND;
        return static_cast<double>(sec) +
               static_cast<double>(rem) / static_cast<double>(TICKS_PER_SECOND);
    }

    constexpr int64_t to_milliseconds() const noexcept {
        return detail::scale_split(ticks_, TICKS_PER_SECOND, 1'000);
    }

    constexpr std::optional<int64_t> to_nanoseconds() const noexcept {
        return checked_rescale_to_nanoseconds(ticks_, TICKS_PER_SECOND);
    }

    constexpr std::optional<Span> to_span() const noexcept {
        auto ns = to_nanoseconds();
        if (!ns) {
            return std::nullopt;
        }
        return Span::from_nanoseconds(*ns);
    }

    // Narrowing for 32-bit codec fields
    expected<int32_t, ConversionError> to_i32() const noexcept {
        if (ticks_ < std::numeric_limits<int32_t>::min() ||
            ticks_ > std::numeric_limits<int32_t>::max()) {
            return make_unexpected(ConversionError{ConversionError::Kind::out_of_range, ticks_});
        }
        return static_cast<int32_t>(ticks_);
    }

    expected<uint32_t, ConversionError> to_u32() const noexcept {
        if (ticks_ < 0) {
            return make_unexpected(ConversionError{ConversionError::Kind::negative, ticks_});
        }
        if (ticks_ > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
            return make_unexpected(ConversionError{ConversionError::Kind::out_of_range, ticks_});
        }
        return static_cast<uint32_t>(ticks_);
    }

    // Comparison
    constexpr auto operator<=>(const CodecSpan&) const noexcept = default;
    constexpr bool operator==(const CodecSpan&) const noexcept = default;

private:
    int64_t ticks_{0};

    constexpr explicit CodecSpan(int64_t ticks) noexcept : ticks_(ticks) {}

    static constexpr std::optional<CodecSpan> wrap(std::optional<int64_t> ticks) noexcept {
        if (!ticks) {
            return std::nullopt;
        }
        return CodecSpan(*ticks);
    }
};

// Define Span::to_codec_span after CodecSpan is complete
constexpr CodecSpan Span::to_codec_span() const noexcept {
    return CodecSpan::from_ticks(rescale(nanos_, CODEC_TIMESCALE));
}

} // namespace mediatime

// Instant and the definition of Span::until need the complete span types
#include "mediatime/instant.hpp"
