#include "gtest/gtest.h"

#include "io/JsonIO.hpp"
#include "workout/PracticeTemplate.hpp"
#include "workout/WorkoutParser.hpp"

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace workout;

static json legacy_document() {
    return json::parse(R"({
        "id": "A1",
        "title": "Old Sprint",
        "poolInfo": "25 Yards",
        "tag": "sprint day",
        "createdAt": 0,
        "lastEditedAt": 10,
        "sections": [{
            "id": "S1",
            "label": "Main Set",
            "sets": [{
                "id": "T1",
                "repeatCount": 2,
                "lines": [
                    {"id": "L1", "reps": 4, "distance": 100, "stroke": "freestyle",
                     "interval": "1:30", "intervalType": "interval", "text": "drill focus",
                     "patterns": {"pace": "descend", "focus": []}},
                    {"id": "L2", "reps": 8, "distance": 50, "stroke": "kick",
                     "interval": ":15", "intervalType": "rest", "text": "", "patterns": {}},
                    {"id": "L3", "text": "streamline", "intervalType": "interval", "patterns": {}}
                ]
            }]
        }]
    })");
}

static std::string error_of(const json& j) {
    try {
        practice_template_from_json(j);
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

TEST(JsonIO, MigratesMobileAppDocument) {
    const PracticeTemplate t = practice_template_from_json(legacy_document());

    EXPECT_EQ(t.title, "Old Sprint");
    EXPECT_EQ(t.pool_info.value_or(""), "25 Yards");
    EXPECT_EQ(t.tag, PracticeTag::Sprint);
    EXPECT_EQ(t.created_at, 978307200);
    EXPECT_EQ(t.last_edited_at, 978307210);

    ASSERT_EQ(t.sections.size(), 1u);
    ASSERT_EQ(t.sections[0].sets.size(), 1u);
    const Set& s = t.sections[0].sets[0];
    EXPECT_EQ(s.repeat_count, 2);
    ASSERT_EQ(s.lines.size(), 3u);

    EXPECT_EQ(s.lines[0].stroke, Stroke::Freestyle);
    EXPECT_EQ(s.lines[0].mode, Mode::Drill);
    EXPECT_EQ(s.lines[0].interval_seconds, 90);
    EXPECT_EQ(s.lines[0].interval_kind, IntervalKind::Sendoff);
    EXPECT_EQ(s.lines[0].effort, Effort::Descend);

    EXPECT_FALSE(s.lines[1].stroke.has_value());
    EXPECT_EQ(s.lines[1].mode, Mode::Kick);
    EXPECT_EQ(s.lines[1].interval_seconds, 15);
    EXPECT_EQ(s.lines[1].interval_kind, IntervalKind::Rest);

    EXPECT_TRUE(s.lines[2].is_text_only());
    EXPECT_FALSE(s.lines[2].interval_seconds.has_value());
    EXPECT_EQ(s.lines[2].interval_kind, IntervalKind::None);
    EXPECT_FALSE(s.lines[2].mode.has_value());

    EXPECT_EQ(t.total_yards(), (400 + 400) * 2);
}

TEST(JsonIO, MigrationStampsCurrentVersion) {
    const json j = migrate_template_json(legacy_document());
    EXPECT_EQ(j.at("schema_version").get<int>(), kTemplateSchemaVersion);
    EXPECT_FALSE(j.contains("poolInfo"));
    EXPECT_FALSE(j["sections"][0]["sets"][0]["lines"][0].contains("patterns"));
}

TEST(JsonIO, RejectsNewerSchema) {
    json j = legacy_document();
    j["schema_version"] = 99;
    EXPECT_THROW(migrate_template_json(j), std::runtime_error);
}

TEST(JsonIO, MissingFieldNamesThePath) {
    json j = migrate_template_json(legacy_document());
    j["sections"][0].erase("sets");
    EXPECT_EQ(error_of(j), "root.sections[0] missing required field: sets");
}

TEST(JsonIO, UnknownEnumValueIsAnError) {
    json j = migrate_template_json(legacy_document());
    j["sections"][0]["sets"][0]["lines"][1]["stroke"] = "sidestroke";
    EXPECT_EQ(error_of(j), "root.sections[0].sets[0].lines[1].stroke unknown value: sidestroke");
}

TEST(JsonIO, WrongTypeIsAnError) {
    json j = migrate_template_json(legacy_document());
    j["sections"][0]["sets"][0]["lines"][0]["reps"] = "four";
    EXPECT_EQ(error_of(j), "root.sections[0].sets[0].lines[0].reps must be an integer");
}

TEST(JsonIO, OutOfRangeIntegersAreErrors) {
    json j = migrate_template_json(legacy_document());
    j["sections"][0]["sets"][0]["lines"][0]["reps"] = 4294967396LL;
    EXPECT_EQ(error_of(j), "root.sections[0].sets[0].lines[0].reps out of range");

    j["sections"][0]["sets"][0]["lines"][0]["reps"] = std::uint64_t{18446744073709551615ULL};
    EXPECT_EQ(error_of(j), "root.sections[0].sets[0].lines[0].reps out of range");

    j["sections"][0]["sets"][0]["lines"][0]["reps"] = 4;
    j["sections"][0]["sets"][0]["repeat_count"] = 4294967298LL;
    EXPECT_EQ(error_of(j), "root.sections[0].sets[0].repeat_count out of range");
}

TEST(JsonIO, NegativeDistanceIsAnError) {
    json j = migrate_template_json(legacy_document());
    j["sections"][0]["sets"][0]["lines"][1]["distance"] = -50;
    EXPECT_EQ(error_of(j), "root.sections[0].sets[0].lines[1].distance must be >= 0");
}

TEST(JsonIO, HugeLegacyDateIsAnError) {
    json j = legacy_document();
    j["createdAt"] = 1e300;
    try {
        migrate_template_json(j);
        FAIL() << "expected an error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "root.createdAt out of range");
    }
}

TEST(JsonIO, OverflowingLegacyIntervalIsDropped) {
    json j = legacy_document();
    j["sections"][0]["sets"][0]["lines"][0]["interval"] = "99999999:00";
    const PracticeTemplate t = practice_template_from_json(j);
    const Line& l = t.sections[0].sets[0].lines[0];
    EXPECT_FALSE(l.interval_seconds.has_value());
    EXPECT_EQ(l.interval_kind, IntervalKind::None);
}

TEST(JsonIO, WrittenTemplateLoadsBack) {
    const std::string raw = "Thursday\nWU\n400 swim\nMS\n3 rounds\n  4x50 kick :10 rest\n  100 free @ 1:30 (bilateral)";
    TemplateOptions opts;
    opts.id = "tmpl-7";
    opts.now = 1792433100;
    opts.pool_info = "25 Yards";
    opts.tag = PracticeTag::Threshold;
    const PracticeTemplate written = make_template(parse(raw), raw, opts);

    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "swimset_json_io_test" / "template.json";
    written.write_to(path);
    const PracticeTemplate loaded = load_practice_template(path.string());
    std::filesystem::remove_all(path.parent_path());

    EXPECT_EQ(loaded.id, "tmpl-7");
    EXPECT_EQ(loaded.title, "Thursday");
    EXPECT_EQ(loaded.tag, PracticeTag::Threshold);
    EXPECT_EQ(loaded.raw_text.value_or(""), raw);
    EXPECT_EQ(loaded.created_at, 1792433100);
    EXPECT_EQ(loaded.total_yards(), written.total_yards());

    ASSERT_EQ(loaded.sections.size(), 2u);
    const Set& rounds = loaded.sections[1].sets[0];
    EXPECT_EQ(rounds.repeat_count, 3);
    ASSERT_EQ(rounds.lines.size(), 2u);
    EXPECT_EQ(rounds.lines[0].interval_kind, IntervalKind::Rest);
    EXPECT_EQ(rounds.lines[1].text, "bilateral");
}

TEST(JsonIO, MissingFileIsAnError) {
    EXPECT_THROW(load_practice_template("/nonexistent/swimset/template.json"), std::runtime_error);
}

TEST(MakeTemplate, GeneratedIdIsUuidV4) {
    const PracticeTemplate t = make_template(parse("WU\n200 free"), "WU\n200 free");
    ASSERT_EQ(t.id.size(), 36u);
    EXPECT_EQ(t.id[14], '4');
    EXPECT_EQ(t.title, "Untitled Practice");
}

TEST(MakeTemplate, TagFromLooseText) {
    EXPECT_EQ(practice_tag_from_string("IM"), PracticeTag::IM);
    EXPECT_EQ(practice_tag_from_string("Sprint Day"), PracticeTag::Sprint);
    EXPECT_EQ(practice_tag_from_string("drills"), PracticeTag::Skills);
    EXPECT_FALSE(practice_tag_from_string("tuesday").has_value());
}
