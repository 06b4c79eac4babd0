#pragma once

/**
 * @file format.hpp
 * @brief fmt formatters for log output
 *
 * Formats produced:
 * - Instant:      2023-11-03T08:26:40.500000000Z (RFC 3339, UTC, nanoseconds)
 * - Span:         1500000000ns
 * - CodecSpan:    135000 ticks
 * - CodecInstant: 153000000000 ticks (1970-01-20T16:13:20.000000000Z)
 *
 * CodecInstant values outside the Instant range print the tick count only.
 */

#include "mediatime/instant.hpp"
#include "mediatime/span.hpp"

#include <chrono>

#include <fmt/format.h>

namespace mediatime::detail {

template <typename OutputIt>
OutputIt format_rfc3339(OutputIt out, CalendarTime cal) {
    using namespace std::chrono;

    sys_seconds tp{seconds{cal.seconds}};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    hh_mm_ss<seconds> hms{tp - day};

    return fmt::format_to(out, "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:09}Z",
                          static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                          static_cast<unsigned>(ymd.day()), hms.hours().count(),
                          hms.minutes().count(), hms.seconds().count(), cal.nanoseconds);
}

} // namespace mediatime::detail

template <>
struct fmt::formatter<mediatime::Instant> {
    constexpr auto parse(fmt::format_parse_context& ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const mediatime::Instant& t, FormatContext& ctx) const -> decltype(ctx.out()) {
        return mediatime::detail::format_rfc3339(ctx.out(), t.to_calendar());
    }
};

template <>
struct fmt::formatter<mediatime::Span> {
    constexpr auto parse(fmt::format_parse_context& ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const mediatime::Span& s, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}ns", s.nanoseconds());
    }
};

template <>
struct fmt::formatter<mediatime::CodecSpan> {
    constexpr auto parse(fmt::format_parse_context& ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const mediatime::CodecSpan& s, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{} ticks", s.ticks());
    }
};

template <>
struct fmt::formatter<mediatime::CodecInstant> {
    constexpr auto parse(fmt::format_parse_context& ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const mediatime::CodecInstant& t, FormatContext& ctx) const
        -> decltype(ctx.out()) {
        auto out = fmt::format_to(ctx.out(), "{} ticks", t.ticks());
        auto cal = t.to_calendar();
        if (!cal) {
            return out;
        }
        out = fmt::format_to(out, " (");
        out = mediatime::detail::format_rfc3339(out, *cal);
        return fmt::format_to(out, ")");
    }
};
