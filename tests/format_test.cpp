#include <limits>
#include <string>

#include <cstdint>
#include <gtest/gtest.h>
#include <mediatime.hpp>
#include <mediatime/format.hpp>

using namespace mediatime;

class FormatTest : public ::testing::Test {};

TEST_F(FormatTest, InstantRfc3339) {
    auto t = Instant::from_nanoseconds(1'699'000'000'500'000'000);
    EXPECT_EQ(fmt::format("{}", t), "2023-11-03T08:26:40.500000000Z");
}

TEST_F(FormatTest, InstantEpoch) {
    EXPECT_EQ(fmt::format("{}", Instant{}), "1970-01-01T00:00:00.000000000Z");
}

TEST_F(FormatTest, InstantBeforeEpoch) {
    EXPECT_EQ(fmt::format("{}", Instant::from_nanoseconds(-500'000'000)),
              "1969-12-31T23:59:59.500000000Z");
}

TEST_F(FormatTest, InstantExtremes) {
    EXPECT_EQ(fmt::format("{}", Instant::max()), "2262-04-11T23:47:16.854775807Z");
    EXPECT_EQ(fmt::format("{}", Instant::from_nanoseconds(std::numeric_limits<int64_t>::min())),
              "1677-09-21T00:12:43.145224192Z");
}

TEST_F(FormatTest, SpanNanoseconds) {
    EXPECT_EQ(fmt::format("{}", Span::from_milliseconds(1'500)), "1500000000ns");
    EXPECT_EQ(fmt::format("{}", Span::from_nanoseconds(-42)), "-42ns");
}

TEST_F(FormatTest, CodecSpanTicks) {
    EXPECT_EQ(fmt::format("{}", CodecSpan::from_ticks(135'000)), "135000 ticks");
    EXPECT_EQ(fmt::format("{}", CodecSpan::zero()), "0 ticks");
}

TEST_F(FormatTest, CodecInstantWithCalendar) {
    EXPECT_EQ(fmt::format("{}", CodecInstant::from_ticks(153'000'000'000)),
              "153000000000 ticks (1970-01-20T16:13:20.000000000Z)");
}

TEST_F(FormatTest, CodecInstantOutOfCalendarRange) {
    auto t = CodecInstant::from_ticks(std::numeric_limits<int64_t>::max());
    EXPECT_EQ(fmt::format("{}", t), "9223372036854775807 ticks");
}

TEST_F(FormatTest, EmbeddedInLogLine) {
    auto pts = CodecInstant::from_ticks(3003);
    auto frame = CodecSpan::from_ticks(3003);
    std::string line = fmt::format("pts={} frame={}", pts, frame);
    EXPECT_EQ(line, "pts=3003 ticks (1970-01-01T00:00:00.033366666Z) frame=3003 ticks");
}
