#pragma once

#include "mediatime/clock.hpp"
#include "mediatime/instant.hpp"
#include "mediatime/span.hpp"

#include <chrono>
#include <optional>

#include <cstdint>

namespace mediatime::utils {

/**
 * @brief Where a FrameClock places its first presentation timestamp
 *
 * A capture pipeline usually knows the frame rate up front but not the PTS of
 * frame zero: it may want the current wall clock, a whole-second boundary so
 * that several encoders line up, or a fixed value replayed from a recording.
 * StartTime holds that choice as data and turns it into a CodecInstant only
 * when resolve() is called.
 *
 * Offsets are CodecSpan values and are added in ticks after the base is
 * chosen. A default StartTime resolves to the epoch, which is what most
 * container muxers expect for the first sample.
 *
 * resolve() reads Clock afresh for the now and next_second bases, so a
 * FrameClock::reset() picks up the current time again.
 *
 * @code
 *   auto frame = *utils::frame_duration_from_rate(30'000, 1'001);
 *   FrameClock<> live(frame, StartTime::now());
 *   FrameClock<> aligned(frame, StartTime::at_next_second_plus(CodecSpan::from_ticks(3'003)));
 *   FrameClock<> replay(frame, StartTime::absolute(CodecInstant::from_ticks(first_pts)));
 * @endcode
 */
struct StartTime {
    enum class Base : uint8_t {
        now,         ///< Codec time of the wall clock at resolve()
        next_second, ///< Ceiling of that time to a multiple of 90'000 ticks
        absolute,    ///< Fixed CodecInstant, clock not read
        zero         ///< Tick 0
    };

    constexpr StartTime() noexcept = default;

    static constexpr StartTime now() noexcept { return StartTime{Base::now, {}, {}}; }

    /// Leave the encoder some lead time before the first frame is due
    static constexpr StartTime now_plus(CodecSpan offset) noexcept {
        return StartTime{Base::now, {}, offset};
    }

    static constexpr StartTime absolute(CodecInstant time) noexcept {
        return StartTime{Base::absolute, time, {}};
    }

    static constexpr StartTime zero() noexcept { return StartTime{Base::zero, {}, {}}; }

    /// A tick count already on a second boundary is kept as is
    static constexpr StartTime at_next_second() noexcept {
        return StartTime{Base::next_second, {}, {}};
    }

    static constexpr StartTime at_next_second_plus(CodecSpan offset) noexcept {
        return StartTime{Base::next_second, {}, offset};
    }

    /**
     * PTS of frame zero for this specification
     *
     * @return nullopt when base + offset leaves the tick range
     */
    template <WallClock Clock = std::chrono::system_clock>
    std::optional<CodecInstant> resolve() const noexcept {
        if (base_ == Base::absolute) {
            return absolute_time_;
        }
        if (base_ == Base::zero) {
            return CodecInstant{};
        }

        auto wall = CodecInstant::now<Clock>();
        auto base = base_ == Base::next_second ? next_second_boundary(wall)
                                               : std::optional<CodecInstant>(wall);
        if (!base) {
            return std::nullopt;
        }
        return base->checked_add(offset_);
    }

    constexpr Base base() const noexcept { return base_; }

    /// Zero for the absolute and zero bases
    constexpr CodecSpan offset() const noexcept { return offset_; }

private:
    constexpr StartTime(Base base, CodecInstant fixed, CodecSpan offset) noexcept
        : base_(base),
          absolute_time_(fixed),
          offset_(offset) {}

    // Smallest multiple of TICKS_PER_SECOND not less than t
    static constexpr std::optional<CodecInstant> next_second_boundary(CodecInstant t) noexcept {
        int64_t rem = t.ticks() % CodecInstant::TICKS_PER_SECOND;
        if (rem > 0) {
            return t.checked_add(CodecSpan::from_ticks(CodecInstant::TICKS_PER_SECOND - rem));
        }
        // Truncating remainder: for negative ticks, subtracting it rounds up
        return CodecInstant::from_ticks(t.ticks() - rem);
    }

    Base base_{Base::zero};
    CodecInstant absolute_time_{};
    CodecSpan offset_{};
};

} // namespace mediatime::utils
