#include "fts/core/time.hpp"

#include <gtest/gtest.h>

using fts::format_iso8601;
using fts::from_unix_millis;
using fts::parse_iso8601;
using fts::to_unix_millis;

TEST(TimeTest, FormatsWholeSecondsWithoutFraction) {
    EXPECT_EQ(format_iso8601(from_unix_millis(1714640403000)), "2024-05-02T09:00:03Z");
}

TEST(TimeTest, FormatsMilliseconds) {
    EXPECT_EQ(format_iso8601(from_unix_millis(1714640403250)), "2024-05-02T09:00:03.250Z");
}

TEST(TimeTest, ParsesFormattedValue) {
    auto parsed = parse_iso8601("2024-05-02T09:00:03.250Z");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(to_unix_millis(parsed.value()), 1714640403250);
}

TEST(TimeTest, ParsesShortFraction) {
    auto parsed = parse_iso8601("2024-05-02T09:00:03.5Z");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(to_unix_millis(parsed.value()) % 1000, 500);
}

TEST(TimeTest, RejectsNonUtcOffsets) {
    EXPECT_TRUE(parse_iso8601("2024-05-02T09:00:03+02:00").is_error());
    EXPECT_TRUE(parse_iso8601("2024-05-02T09:00:03").is_error());
}

TEST(TimeTest, RejectsMalformedInput) {
    EXPECT_TRUE(parse_iso8601("").is_error());
    EXPECT_TRUE(parse_iso8601("2024/05/02 09:00:03Z").is_error());
    EXPECT_TRUE(parse_iso8601("2024-13-02T09:00:03Z").is_error());
    EXPECT_TRUE(parse_iso8601("2024-05-02T09:00:03.Z").is_error());
}
