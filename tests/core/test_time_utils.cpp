// tests/core/test_time_utils.cpp
#include <gtest/gtest.h>
#include <ctime>
#include <regex>
#include "papertrade/core/time_utils.hpp"

using namespace papertrade;
using namespace papertrade::core;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, SafeGmtimeEpoch) {
    std::time_t epoch = 0;
    std::tm result;

    std::tm* ret = safe_gmtime(&epoch, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret, &result);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
}

TEST_F(TimeUtilsTest, SafeLocaltimeValidInput) {
    std::time_t now = std::time(nullptr);
    std::tm result;

    std::tm* ret = safe_localtime(&now, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_GE(result.tm_year, 100);
    EXPECT_LE(result.tm_mon, 11);
}

TEST_F(TimeUtilsTest, FormattedTimeMatchesPattern) {
    std::string stamp = get_formatted_time("%Y%m%d_%H%M%S");
    EXPECT_TRUE(std::regex_match(stamp, std::regex(R"(\d{8}_\d{6})"))) << stamp;
}

TEST_F(TimeUtilsTest, ParseDateTime) {
    auto ts = parse_timestamp("2024-03-01 12:30:45");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(format_timestamp(*ts), "2024-03-01 12:30:45");
}

TEST_F(TimeUtilsTest, ParseIsoSeparator) {
    auto spaced = parse_timestamp("2024-03-01 00:05:00");
    auto iso = parse_timestamp("2024-03-01T00:05:00");
    ASSERT_TRUE(spaced.has_value());
    ASSERT_TRUE(iso.has_value());
    EXPECT_EQ(*spaced, *iso);
}

TEST_F(TimeUtilsTest, ParseDateOnly) {
    auto ts = parse_timestamp("2024-01-02");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(to_epoch_ms(*ts), 1704153600000LL);
}

TEST_F(TimeUtilsTest, ParseRejectsGarbage) {
    EXPECT_FALSE(parse_timestamp("yesterday").has_value());
    EXPECT_FALSE(parse_timestamp("").has_value());
}

TEST_F(TimeUtilsTest, EpochMillisecondsRoundTrip) {
    Timestamp ts = from_epoch_ms(1700000000123LL);
    EXPECT_EQ(to_epoch_ms(ts), 1700000000123LL);
}
