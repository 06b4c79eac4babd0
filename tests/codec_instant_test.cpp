#include <limits>

#include <cstdint>
#include <gtest/gtest.h>
#include <mediatime.hpp>

#include "test_clocks.hpp"

using namespace mediatime;

class CodecInstantTest : public ::testing::Test {
protected:
    static constexpr int64_t MAX_TICKS = std::numeric_limits<int64_t>::max();
    static constexpr int64_t MIN_TICKS = std::numeric_limits<int64_t>::min();

    // 2023-11-03T08:26:40.5Z
    static constexpr int64_t test_nanos = 1'699'000'000'500'000'000;
    static constexpr int64_t test_ticks = 152'910'000'045'000;

    // Largest tick count that still converts to an Instant
    static constexpr int64_t LAST_CONVERTIBLE = 830'103'483'316'929;

    void SetUp() override { FixedClock::nanos_since_epoch = test_nanos; }

    static CodecInstant at(int64_t t) { return CodecInstant::from_ticks(t); }
};

// ==============================================================================
// Construction
// ==============================================================================

TEST_F(CodecInstantTest, DefaultConstructionIsEpoch) {
    CodecInstant t;
    EXPECT_EQ(t.ticks(), 0);
    EXPECT_EQ(t.to_instant(), Instant{});
}

TEST_F(CodecInstantTest, FromInstant) {
    EXPECT_EQ(CodecInstant::from_instant(Instant::from_nanoseconds(test_nanos)).ticks(),
              test_ticks);
    EXPECT_EQ(CodecInstant::from_instant(Instant::max()).ticks(), LAST_CONVERTIBLE);
}

TEST_F(CodecInstantTest, NowIsRescaledWallClock) {
    EXPECT_EQ(CodecInstant::now<FixedClock>().ticks(), test_ticks);
}

TEST_F(CodecInstantTest, NowTruncatesSubTickNanoseconds) {
    // 11'111 ns is just under one tick
    FixedClock::nanos_since_epoch = NANOS_PER_SECOND + 11'111;
    EXPECT_EQ(CodecInstant::now<FixedClock>().ticks(), 90'000);
}

using CodecInstantDeathTest = CodecInstantTest;

TEST_F(CodecInstantDeathTest, NowBeforeEpochIsFatal) {
    EXPECT_DEATH((void)CodecInstant::now<PreEpochClock>(), "time went backwards past the epoch");
}

TEST_F(CodecInstantTest, NowSystemClockMatchesInstant) {
    auto wall = Instant::now();
    auto codec = CodecInstant::now();
    auto wall_after = Instant::now();

    EXPECT_FALSE(codec.before(CodecInstant::from_instant(wall)));
    EXPECT_FALSE(codec.after(CodecInstant::from_instant(wall_after)));
}

// ==============================================================================
// Arithmetic
// ==============================================================================

TEST_F(CodecInstantTest, CheckedAddSub) {
    auto frame = CodecSpan::from_ticks(3003);
    EXPECT_EQ(at(test_ticks).checked_add(frame), at(test_ticks + 3003));
    EXPECT_EQ(at(test_ticks).checked_sub(frame), at(test_ticks - 3003));
}

TEST_F(CodecInstantTest, CheckedAddSubOverflow) {
    EXPECT_FALSE(at(MAX_TICKS).checked_add(CodecSpan::from_ticks(1)).has_value());
    EXPECT_FALSE(at(MIN_TICKS).checked_sub(CodecSpan::from_ticks(1)).has_value());
    EXPECT_FALSE(at(MIN_TICKS).checked_add(CodecSpan::from_ticks(-1)).has_value());
}

TEST_F(CodecInstantTest, DifferenceIsSpan) {
    auto pts = at(test_ticks + 6006);
    auto dts = at(test_ticks);
    auto offset = pts.difference(dts);
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(*offset, CodecSpan::from_ticks(6006));
    EXPECT_EQ(dts.difference(pts), CodecSpan::from_ticks(-6006));
}

TEST_F(CodecInstantTest, DifferenceOverflow) {
    EXPECT_FALSE(at(MAX_TICKS).difference(at(-1)).has_value());
    EXPECT_FALSE(at(MIN_TICKS).difference(at(1)).has_value());
}

TEST_F(CodecInstantTest, SinceEpoch) {
    EXPECT_EQ(at(test_ticks).since_epoch(), CodecSpan::from_ticks(test_ticks));
    EXPECT_EQ(at(-5).since_epoch(), CodecSpan::from_ticks(-5));
}

TEST_F(CodecInstantTest, Ordering) {
    EXPECT_TRUE(at(2).after(at(1)));
    EXPECT_FALSE(at(1).after(at(1)));
    EXPECT_FALSE(at(1).after(at(2)));
    EXPECT_TRUE(at(1).before(at(2)));
    EXPECT_FALSE(at(2).before(at(2)));
}

// ==============================================================================
// Conversion back to wall clock
// ==============================================================================

TEST_F(CodecInstantTest, ToInstant) {
    auto t = at(test_ticks).to_instant();
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->nanoseconds(), test_nanos);
}

TEST_F(CodecInstantTest, ToInstantSubSecond) {
    // 1 tick is 11111.1 ns, truncated
    EXPECT_EQ(at(1).to_instant(), Instant::from_nanoseconds(11'111));
    EXPECT_EQ(at(-1).to_instant(), Instant::from_nanoseconds(-11'111));
    EXPECT_EQ(at(90'001).to_instant(), Instant::from_nanoseconds(1'000'011'111));
}

TEST_F(CodecInstantTest, ToInstantRange) {
    auto last = at(LAST_CONVERTIBLE).to_instant();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->nanoseconds(), 9'223'372'036'854'766'666);

    EXPECT_FALSE(at(LAST_CONVERTIBLE + 1).to_instant().has_value());
    EXPECT_FALSE(at(-LAST_CONVERTIBLE - 1).to_instant().has_value());
    EXPECT_FALSE(at(MAX_TICKS).to_instant().has_value());
}

TEST_F(CodecInstantTest, RoundTripWithinOneTick) {
    for (int64_t ns : {test_nanos, int64_t{1}, int64_t{123'456'789}, int64_t{-987'654'321},
                       std::numeric_limits<int64_t>::max()}) {
        auto back = CodecInstant::from_instant(Instant::from_nanoseconds(ns)).to_instant();
        ASSERT_TRUE(back.has_value()) << "ns=" << ns;
        auto error = Instant::from_nanoseconds(ns).difference(*back);
        ASSERT_TRUE(error.has_value());
        int64_t magnitude = error->nanoseconds() < 0 ? -error->nanoseconds() : error->nanoseconds();
        EXPECT_LE(magnitude, 11'111) << "ns=" << ns;
    }
}

TEST_F(CodecInstantTest, ToCalendar) {
    auto cal = at(test_ticks).to_calendar();
    ASSERT_TRUE(cal.has_value());
    EXPECT_EQ(cal->seconds, 1'699'000'000);
    EXPECT_EQ(cal->nanoseconds, 500'000'000u);
}

TEST_F(CodecInstantTest, ToCalendarBeforeEpoch) {
    // Half a second before the epoch
    auto cal = at(-45'000).to_calendar();
    ASSERT_TRUE(cal.has_value());
    EXPECT_EQ(*cal, (CalendarTime{-1, 500'000'000u}));
}

TEST_F(CodecInstantTest, ToCalendarOutOfRange) {
    EXPECT_FALSE(at(MAX_TICKS).to_calendar().has_value());
    EXPECT_FALSE(at(MIN_TICKS).to_calendar().has_value());
}
