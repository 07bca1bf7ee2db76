#include <gtest/gtest.h>
#include "orca/core/ids.hpp"
#include "orca/core/time.hpp"

#include <chrono>

using namespace orca;

TEST(Ids, RandomUuidsAreDistinct) {
    auto a = new_uuid();
    auto b = new_uuid();

    EXPECT_TRUE(is_uuid(a));
    EXPECT_TRUE(is_uuid(b));
    EXPECT_NE(a, b);
}

TEST(Ids, NameBasedUuidIsStable) {
    auto a = uuid_from_name("firing:auto-1|prefect.resource.id=x#event:1");
    auto b = uuid_from_name("firing:auto-1|prefect.resource.id=x#event:1");
    auto c = uuid_from_name("firing:auto-1|prefect.resource.id=x#event:2");

    EXPECT_TRUE(is_uuid(a));
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(a[14], '5');  // version nibble
}

TEST(Ids, IsUuidRejectsOtherText) {
    EXPECT_FALSE(is_uuid(""));
    EXPECT_FALSE(is_uuid("not-a-uuid"));
    EXPECT_FALSE(is_uuid("6f1c2a9e-1b7d-4c55-9a0e-2d7f0c6b8e1z"));
}

TEST(Time, FormatsUtcWithMicroseconds) {
    TimePoint tp{std::chrono::seconds(1714566600) + std::chrono::microseconds(42)};
    EXPECT_EQ(format_timestamp(tp), "2024-05-01T12:30:00.000042Z");
}

TEST(Time, ParsesWhatItFormats) {
    auto tp = now();
    auto parsed = parse_timestamp(format_timestamp(tp));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, tp);
}

TEST(Time, ParsesOffsetsAndShortFractions) {
    auto utc = parse_timestamp("2024-05-01T12:30:00Z");
    auto offset = parse_timestamp("2024-05-01T14:30:00+02:00");
    auto spaced = parse_timestamp("2024-05-01 12:30:00.5");

    ASSERT_TRUE(utc.has_value());
    ASSERT_TRUE(offset.has_value());
    ASSERT_TRUE(spaced.has_value());
    EXPECT_EQ(*utc, *offset);
    EXPECT_EQ(*spaced - *utc, std::chrono::milliseconds(500));
}

TEST(Time, RejectsMalformedTimestamps) {
    EXPECT_FALSE(parse_timestamp("").has_value());
    EXPECT_FALSE(parse_timestamp("2024-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(parse_timestamp("2024-05-01").has_value());
    EXPECT_FALSE(parse_timestamp("2024-05-01T12:30:00Q").has_value());
    EXPECT_FALSE(parse_timestamp("2024-05-01T12:30:00.Z").has_value());
}

TEST(Time, SecondsConversion) {
    EXPECT_EQ(from_seconds(1.5), Duration(1500000));
    EXPECT_DOUBLE_EQ(to_seconds(std::chrono::minutes(10)), 600.0);
}
