#include "gtest/gtest.h"

#include "workout/LineParser.hpp"

using namespace workout;

static Line only_line(const std::string& raw) {
    const auto parsed = parse_line(raw);
    EXPECT_TRUE(parsed.has_value()) << raw;
    if (!parsed || parsed->set.lines.size() != 1) return Line{};
    EXPECT_EQ(parsed->set.repeat_count, 1);
    return parsed->set.lines.front();
}

TEST(LineParser, BlankIsNothing) {
    EXPECT_FALSE(parse_line("").has_value());
    EXPECT_FALSE(parse_line("   \t").has_value());
}

TEST(LineParser, RepsDistanceStrokeSendoff) {
    const Line l = only_line("4x100 free @ 1:30");
    EXPECT_EQ(l.reps, 4);
    EXPECT_EQ(l.distance, 100);
    EXPECT_EQ(l.stroke, Stroke::Freestyle);
    EXPECT_EQ(l.interval_seconds, 90);
    EXPECT_EQ(l.interval_kind, IntervalKind::Sendoff);
    EXPECT_FALSE(l.mode.has_value());
    EXPECT_FALSE(l.effort.has_value());
    EXPECT_EQ(l.text, "");
}

TEST(LineParser, NestedRepeatCollapses) {
    const Line l = only_line("3x (4x25 @ :25)");
    EXPECT_EQ(l.reps, 12);
    EXPECT_EQ(l.distance, 25);
    EXPECT_EQ(l.interval_seconds, 25);
    EXPECT_EQ(l.interval_kind, IntervalKind::Sendoff);
    EXPECT_EQ(l.text, "");
}

TEST(LineParser, EffortAndLeftoverText) {
    const Line l = only_line("8x50 @ :50 easy/fast by 25");
    EXPECT_EQ(l.reps, 8);
    EXPECT_EQ(l.distance, 50);
    EXPECT_EQ(l.interval_seconds, 50);
    EXPECT_EQ(l.effort, Effort::Easy);
    EXPECT_EQ(l.text, "/fast by 25");
}

TEST(LineParser, ModeAndNotes) {
    const Line l = only_line("4x100 free drill (fins) @ 1:40");
    EXPECT_EQ(l.stroke, Stroke::Freestyle);
    EXPECT_EQ(l.mode, Mode::Drill);
    EXPECT_EQ(l.interval_seconds, 100);
    EXPECT_EQ(l.text, "fins");
}

TEST(LineParser, LeadingNoteBeforeDistance) {
    const Line l = only_line("(light) 200 free");
    EXPECT_EQ(l.distance, 200);
    EXPECT_EQ(l.stroke, Stroke::Freestyle);
    EXPECT_EQ(l.text, "light");
}

TEST(LineParser, RestInterval) {
    const Line l = only_line("6x50 kick :15 rest");
    EXPECT_EQ(l.mode, Mode::Kick);
    EXPECT_EQ(l.interval_seconds, 15);
    EXPECT_EQ(l.interval_kind, IntervalKind::Rest);
    EXPECT_EQ(l.text, "");
}

TEST(LineParser, RepeatedStrokeWordIsNotText) {
    EXPECT_EQ(only_line("4x100 free free").text, "");
}

TEST(LineParser, DescendRangeStaysAsText) {
    const Line l = only_line("4x100 descend 1-4 @ 1:30");
    EXPECT_EQ(l.effort, Effort::Descend);
    EXPECT_EQ(l.interval_seconds, 90);
    EXPECT_EQ(l.text, "1-4");
}

TEST(LineParser, WholeWordKeywords) {
    const Line l = only_line("200 swimmers choice");
    EXPECT_EQ(l.stroke, Stroke::Choice);
    EXPECT_FALSE(l.mode.has_value());
    EXPECT_EQ(l.text, "swimmers");
}

TEST(LineParser, LetterLabelIsStripped) {
    const Line l = only_line("A. 400 pull");
    EXPECT_EQ(l.distance, 400);
    EXPECT_EQ(l.mode, Mode::Pull);
}

TEST(LineParser, TotalLine) {
    const Line l = only_line("Total: 600");
    EXPECT_EQ(l.reps, 1);
    EXPECT_EQ(l.distance, 600);
    EXPECT_EQ(l.text, "Total: 600");
}

TEST(LineParser, TextOnlyKeepsWholeLine) {
    const auto parsed = parse_line("Focus on streamline off every wall");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed->is_descriptor());
    const Line& l = parsed->set.lines.front();
    EXPECT_TRUE(l.is_text_only());
    EXPECT_EQ(l.text, "Focus on streamline off every wall");
}

TEST(LineParser, DashWithoutNumbersIsDescriptor) {
    const auto parsed = parse_line("\xE2\x80\x93 notes about previous set");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->started_with_dash);
    EXPECT_TRUE(parsed->is_descriptor());
    EXPECT_EQ(parsed->stripped_text, "notes about previous set");
}

TEST(LineParser, DashWithNumbersIsASet) {
    const auto parsed = parse_line("- 200 easy");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed->is_descriptor());
    const Line& l = parsed->set.lines.front();
    EXPECT_EQ(l.distance, 200);
    EXPECT_EQ(l.effort, Effort::Easy);
}

TEST(LineParser, OverflowingIntervalStaysInText) {
    const Line l = only_line("4x100 @ 40000000:00");
    EXPECT_EQ(l.reps, 4);
    EXPECT_FALSE(l.interval_seconds.has_value());
    EXPECT_EQ(l.interval_kind, IntervalKind::None);
    EXPECT_EQ(l.text, "@ 40000000:00");
}

TEST(LineParser, VeryLongLineIsPlainText) {
    const std::string raw = "200 free (" + std::string(kMaxPatternLineLength, 'a') + ")";
    const Line l = only_line(raw);
    EXPECT_TRUE(l.is_text_only());
    EXPECT_EQ(l.text, raw);
}
