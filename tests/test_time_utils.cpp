#include <gtest/gtest.h>
#include <core/time_utils.hpp>

using std::chrono::milliseconds;

TEST(TimeUtils, FormatDurationMillis) {
    EXPECT_EQ(format_duration(milliseconds(0)), "0ms");
    EXPECT_EQ(format_duration(milliseconds(350)), "350ms");
}

TEST(TimeUtils, FormatDurationSeconds) {
    EXPECT_EQ(format_duration(milliseconds(1000)), "1.0s");
    EXPECT_EQ(format_duration(milliseconds(8240)), "8.2s");
    EXPECT_EQ(format_duration(milliseconds(45000)), "45.0s");
}

TEST(TimeUtils, FormatDurationMinutes) {
    // 5 minutes 30 seconds
    EXPECT_EQ(format_duration(milliseconds(330000)), "5m30s");
}

TEST(TimeUtils, FormatDurationHours) {
    // 2 hours 15 minutes
    EXPECT_EQ(format_duration(milliseconds(8100000)), "2h15m");
}

TEST(TimeUtils, FormatDurationNegativeClamps) {
    EXPECT_EQ(format_duration(milliseconds(-5)), "0ms");
}

TEST(TimeUtils, FormatTimeout) {
    EXPECT_EQ(format_timeout(std::nullopt), "none");
    EXPECT_EQ(format_timeout(milliseconds(30000)), "30.0s");
}

TEST(TimeUtils, ParseTimeoutNone) {
    for (const char* text : {"none", "NONE", "off", "", "  "}) {
        auto r = parse_timeout(text);
        ASSERT_TRUE(r.is_ok()) << text;
        EXPECT_FALSE(r.value.has_value()) << text;
    }
}

TEST(TimeUtils, ParseTimeoutSeconds) {
    auto r = parse_timeout("30");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(*r.value, milliseconds(30000));

    auto frac = parse_timeout(" 1.5 ");
    ASSERT_TRUE(frac.is_ok());
    EXPECT_EQ(*frac.value, milliseconds(1500));

    auto zero = parse_timeout("0");
    ASSERT_TRUE(zero.is_ok());
    EXPECT_EQ(*zero.value, milliseconds(0));
}

TEST(TimeUtils, ParseTimeoutRejectsGarbage) {
    EXPECT_TRUE(parse_timeout("-1").is_err());
    EXPECT_TRUE(parse_timeout("ten").is_err());
    EXPECT_TRUE(parse_timeout("10s").is_err());
    EXPECT_TRUE(parse_timeout("nan").is_err());
}

TEST(TimeUtils, HugeTimeoutsAreClamped) {
    auto parsed = parse_timeout("1e10");
    ASSERT_TRUE(parsed.is_ok()) << parsed.error;
    ASSERT_TRUE(parsed.value.has_value());
    EXPECT_EQ(*parsed.value, max_timeout());

    auto absurd = parse_timeout("1e300");
    ASSERT_TRUE(absurd.is_ok()) << absurd.error;
    EXPECT_EQ(*absurd.value, max_timeout());

    EXPECT_EQ(*clamp_timeout(std::chrono::milliseconds::max()), max_timeout());
    EXPECT_EQ(clamp_timeout(std::chrono::milliseconds(1500))->count(), 1500);
    EXPECT_FALSE(clamp_timeout(std::nullopt).has_value());
}

TEST(TimeUtils, MaxTimeoutFitsSteadyClock) {
    auto now = std::chrono::steady_clock::now();
    EXPECT_GT(now + max_timeout(), now);
}
