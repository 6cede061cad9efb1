// EQUORUM - Time Utilities Tests
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include <gtest/gtest.h>

#include "equorum/util/time.h"

namespace equorum {
namespace util {
namespace test {

class MockTimeTest : public ::testing::Test {
protected:
    void TearDown() override {
        DisableMockTime();
    }
};

TEST_F(MockTimeTest, RealClockIsRecent) {
    // 2023-11-14
    EXPECT_GT(GetTime(), 1700000000);
}

TEST_F(MockTimeTest, MockClockIsControllable) {
    EnableMockTime();
    SetMockTime(1000);
    EXPECT_TRUE(IsMockTimeEnabled());
    EXPECT_EQ(GetTime(), 1000);

    AdvanceMockTime(3600);
    EXPECT_EQ(GetTime(), 4600);
    EXPECT_EQ(GetMockTime(), 4600);

    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_GT(GetTime(), 4600);
}

TEST(TimeFormatTest, ISO8601) {
    EXPECT_EQ(FormatISO8601(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(1700000000), "2023-11-14T22:13:20Z");
}

TEST(TimeFormatTest, Duration) {
    EXPECT_EQ(FormatDuration(0), "0s");
    EXPECT_EQ(FormatDuration(45), "45s");
    EXPECT_EQ(FormatDuration(3661), "1h 1m 1s");
    EXPECT_EQ(FormatDuration(2 * 86400), "2d 0h 0m 0s");
    EXPECT_EQ(FormatDuration(-60), "-1m 0s");
}

TEST(TimeParseTest, AcceptsSuffixes) {
    EXPECT_EQ(ParseDuration("30").value_or(-1), 30);
    EXPECT_EQ(ParseDuration("30s").value_or(-1), 30);
    EXPECT_EQ(ParseDuration("5m").value_or(-1), 300);
    EXPECT_EQ(ParseDuration("48h").value_or(-1), 172800);
    EXPECT_EQ(ParseDuration("7d").value_or(-1), 604800);
    EXPECT_EQ(ParseDuration("1W").value_or(-1), 604800);
    EXPECT_EQ(ParseDuration(" 2d ").value_or(-1), 172800);
}

TEST(TimeParseTest, RejectsGarbage) {
    EXPECT_FALSE(ParseDuration("").has_value());
    EXPECT_FALSE(ParseDuration("d").has_value());
    EXPECT_FALSE(ParseDuration("-5s").has_value());
    EXPECT_FALSE(ParseDuration("5x").has_value());
    EXPECT_FALSE(ParseDuration("5dd").has_value());
    EXPECT_FALSE(ParseDuration("99999999999999999999").has_value());
}

} // namespace test
} // namespace util
} // namespace equorum
