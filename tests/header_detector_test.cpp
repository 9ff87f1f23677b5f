#include "gtest/gtest.h"

#include "workout/HeaderDetector.hpp"
#include "workout/Models.hpp"

using namespace workout;

TEST(DetectSection, WarmupAliases) {
    for (const char* s : {"wu", "WU", "warm up", "Warm-Up", "warmup", "  Warmup  "}) {
        const auto label = detect_section(s);
        ASSERT_TRUE(label.has_value()) << s;
        EXPECT_EQ(*label, labels::kWarmup) << s;
    }
}

TEST(DetectSection, RequiresBoundaryAfterAlias) {
    EXPECT_FALSE(detect_section("warmdownstuff").has_value());
    EXPECT_FALSE(detect_section("mslowly").has_value());
    EXPECT_FALSE(detect_section("cdx 200").has_value());
}

TEST(DetectSection, PrefixWithTrailingText) {
    EXPECT_EQ(detect_section("Main Set:").value_or(""), labels::kMainSet);
    EXPECT_EQ(detect_section("Post Set - Pull").value_or(""), labels::kPostSet);
    EXPECT_EQ(detect_section("CD \xE2\x80\x93 easy").value_or(""), labels::kCooldown);
    EXPECT_EQ(detect_section("cd\xE2\x80\x93" "easy").value_or(""), labels::kCooldown);
}

TEST(DetectSection, CanonicalLabels) {
    EXPECT_EQ(detect_section("MS").value_or(""), labels::kMainSet);
    EXPECT_EQ(detect_section("preset").value_or(""), labels::kPreSet);
    EXPECT_EQ(detect_section("Warm down").value_or(""), labels::kCooldown);
    EXPECT_EQ(detect_section("Reset").value_or(""), labels::kPostSet);
    EXPECT_EQ(detect_section("Drills").value_or(""), labels::kPostSet);
    EXPECT_EQ(detect_section("recovery").value_or(""), labels::kPostSet);
}

TEST(DetectSection, SetLinesAreNotHeaders) {
    EXPECT_FALSE(detect_section("4x100 free @ 1:30").has_value());
    EXPECT_FALSE(detect_section("").has_value());
    EXPECT_FALSE(detect_section("200 easy").has_value());
}

TEST(RoundCount, Forms) {
    EXPECT_EQ(extract_round_count("2x thru").value_or(0), 2);
    EXPECT_EQ(extract_round_count("2 x through:").value_or(0), 2);
    EXPECT_EQ(extract_round_count("3 rounds").value_or(0), 3);
    EXPECT_EQ(extract_round_count("5 Rounds").value_or(0), 5);
    EXPECT_EQ(extract_round_count("1 round").value_or(0), 1);
    EXPECT_EQ(extract_round_count("4x:").value_or(0), 4);
    EXPECT_EQ(extract_round_count("2\xC3\x97thru").value_or(0), 2);
}

TEST(RoundCount, RejectsSetLinesAndZero) {
    EXPECT_FALSE(extract_round_count("4x100 free").has_value());
    EXPECT_FALSE(extract_round_count("0x thru").has_value());
    EXPECT_FALSE(extract_round_count("free").has_value());
}

TEST(RoundCount, ClockTimesAreNotHeaders) {
    EXPECT_FALSE(extract_round_count("1:30 easy").has_value());
    EXPECT_FALSE(extract_round_count("10:00 swim").has_value());
}
