#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace workout {

// canonical section labels
namespace labels {
inline const char* const kWarmup = "Warmup";
inline const char* const kPreSet = "Pre-Set";
inline const char* const kMainSet = "Main Set";
inline const char* const kPostSet = "Post-Set / Technique";
inline const char* const kCooldown = "Cooldown";
}  // namespace labels

// Lines longer than this skip pattern matching and are kept as plain text.
inline constexpr std::size_t kMaxPatternLineLength = 512;

enum class Stroke {
    Freestyle,
    Backstroke,
    Breaststroke,
    Butterfly,
    IM,
    Choice
};

enum class Mode {
    Swim,
    Kick,
    Pull,
    Drill,
    Scull,
    Technique
};

enum class IntervalKind {
    Sendoff,  // "@ 1:10"
    Rest,     // ":10 rest"
    None
};

enum class Effort {
    Easy,
    Cruise,
    Moderate,
    Fast,
    Sprint,
    Descend,
    Ascend,
    Build,
    NegativeSplit,
    EvenPace,
    BestAverage,
    HoldPace,
    RacePace,
    Threshold
};

struct Line {
    std::string id;
    std::optional<int> reps;         // 4 from "4x50"
    std::optional<int> distance;     // 50 from "4x50"
    std::optional<Stroke> stroke;
    std::optional<Mode> mode;
    std::optional<int> interval_seconds;
    IntervalKind interval_kind = IntervalKind::None;
    std::optional<Effort> effort;
    std::string text;                // free-form remainder as it should appear on the sheet
    std::optional<int> yardage_override;  // never set by the parser

    // no reps and no distance: a permissive note line worth 0 yards
    bool is_text_only() const { return !reps && !distance; }
};

struct Set {
    std::string id;
    std::optional<std::string> title;
    int repeat_count = 1;
    std::vector<Line> lines;
};

struct Section {
    std::string id;
    std::string label;
    std::vector<Set> sets;
};

struct ParseResult {
    std::vector<Section> sections;
    std::optional<std::string> title;
    std::vector<std::string> warnings;
};

// Raw names are the persisted spelling ("freestyle", "negative_split").
const char* stroke_name(Stroke s);
const char* stroke_display(Stroke s);   // "Free", "Back", ...
std::optional<Stroke> stroke_from_name(const std::string& name);

const char* mode_name(Mode m);
const char* mode_display(Mode m);       // "Kick", "Drill", ...
std::optional<Mode> mode_from_name(const std::string& name);

const char* interval_kind_name(IntervalKind k);
std::optional<IntervalKind> interval_kind_from_name(const std::string& name);

const char* effort_name(Effort e);
const char* effort_code(Effort e);      // short sheet code: "EZ", "DESC", ...
std::optional<Effort> effort_from_name(const std::string& name);

}  // namespace workout
