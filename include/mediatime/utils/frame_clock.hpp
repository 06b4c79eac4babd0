#pragma once

#include "mediatime/clock.hpp"
#include "mediatime/instant.hpp"
#include "mediatime/span.hpp"
#include "mediatime/utils/start_time.hpp"

#include <chrono>
#include <limits>
#include <optional>
#include <stdexcept>

#include <cstdint>

namespace mediatime::utils {

/**
 * @brief Exact frame duration in 90 kHz ticks for a rational frame rate
 *
 * @param num Frames
 * @param den Seconds those frames span (30000/1001 for NTSC 29.97)
 * @return Duration, or nullopt if either argument is zero or 90000 * den / num
 *         is not an integer number of ticks
 */
inline std::optional<CodecSpan> frame_duration_from_rate(uint32_t num, uint32_t den) noexcept {
    if (num == 0 || den == 0) {
        return std::nullopt;
    }
    int64_t numerator = CodecSpan::TICKS_PER_SECOND * static_cast<int64_t>(den);
    if (numerator % num != 0) {
        return std::nullopt;
    }
    return CodecSpan::from_ticks(numerator / num);
}

/**
 * @brief Presentation timestamp generator for fixed-duration frames
 *
 * Each tick() advances by a whole number of frames and returns the new PTS.
 * The PTS is always start + frame_duration * elapsed_frames, computed in
 * integer ticks, so there is no drift over long recordings.
 *
 * ## Overflow Policy
 * tick() returns std::nullopt when the next PTS would leave the int64_t tick
 * range, and leaves the clock unchanged.
 *
 * @note Thread safety: const methods are safe for concurrent reads. Non-const
 *       methods require external synchronization.
 *
 * @tparam Clock Wall clock used to resolve StartTime::now and at_next_second
 */
template <WallClock Clock = std::chrono::system_clock>
class FrameClock {
public:
    /**
     * @brief Construct a frame clock with the given frame duration and start time
     * @param frame_duration Ticks per frame, must be positive
     * @param start_spec StartTime specification (resolved now, stored for reset)
     * @throws std::invalid_argument if frame_duration is not positive or the start
     *         time cannot be resolved
     *
     * Example:
     * @code
     *   auto frame = *frame_duration_from_rate(30, 1);  // 3000 ticks
     *   FrameClock<> clock(frame, StartTime::at_next_second());
     * @endcode
     */
    explicit FrameClock(CodecSpan frame_duration, StartTime start_spec = {})
        : frame_duration_(validate(frame_duration)),
          start_spec_(start_spec) {
        resolve_start();
    }

    /// Convenience constructor for an absolute start time
    explicit FrameClock(CodecSpan frame_duration, CodecInstant start)
        : FrameClock(frame_duration, StartTime::absolute(start)) {}

    /// PTS of the current frame without advancing
    CodecInstant now() const noexcept { return current_; }

    /// PTS of frame zero
    CodecInstant start() const noexcept { return start_; }

    std::optional<CodecInstant> tick() noexcept { return tick(1); }

    /// Advance by N frames and return the new PTS; nullopt (and no change) on overflow
    std::optional<CodecInstant> tick(uint64_t frames) noexcept {
        if (frames > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        auto delta = frame_duration_.checked_mul(static_cast<int64_t>(frames));
        if (!delta) {
            return std::nullopt;
        }
        auto elapsed = elapsed_.checked_add(*delta);
        if (!elapsed) {
            return std::nullopt;
        }
        auto next = start_.checked_add(*elapsed);
        if (!next) {
            return std::nullopt;
        }

        frames_ += frames;
        elapsed_ = *elapsed;
        current_ = *next;
        return current_;
    }

    /// Reset elapsed frames and re-resolve the start time from the stored spec
    void reset() {
        frames_ = 0;
        elapsed_ = CodecSpan::zero();
        resolve_start();
    }

    CodecSpan frame_duration() const noexcept { return frame_duration_; }

    /// Number of frames elapsed since construction or last reset
    uint64_t elapsed_frames() const noexcept { return frames_; }

    /// Time elapsed since construction or last reset
    CodecSpan elapsed() const noexcept { return elapsed_; }

private:
    void resolve_start() {
        auto resolved = start_spec_.resolve<Clock>();
        if (!resolved) {
            throw std::invalid_argument("start time offset overflows the tick range");
        }
        start_ = *resolved;
        current_ = *resolved;
    }

    static CodecSpan validate(CodecSpan frame_duration) {
        if (frame_duration.ticks() <= 0) {
            throw std::invalid_argument("frame duration must be positive");
        }
        return frame_duration;
    }

    CodecSpan frame_duration_{};
    StartTime start_spec_{};
    CodecInstant start_{};
    CodecInstant current_{};
    CodecSpan elapsed_{};
    uint64_t frames_{0};
};

} // namespace mediatime::utils
