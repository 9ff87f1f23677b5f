#include "workout/Models.hpp"

#include "textutil/TextUtil.hpp"

#include <array>
#include <utility>

namespace workout {

static const std::array<Stroke, 6> kStrokes = {
    Stroke::Freestyle, Stroke::Backstroke, Stroke::Breaststroke,
    Stroke::Butterfly, Stroke::IM, Stroke::Choice,
};

static const std::array<Mode, 6> kModes = {
    Mode::Swim, Mode::Kick, Mode::Pull, Mode::Drill, Mode::Scull, Mode::Technique,
};

static const std::array<Effort, 14> kEfforts = {
    Effort::Easy, Effort::Cruise, Effort::Moderate, Effort::Fast, Effort::Sprint,
    Effort::Descend, Effort::Ascend, Effort::Build, Effort::NegativeSplit,
    Effort::EvenPace, Effort::BestAverage, Effort::HoldPace, Effort::RacePace,
    Effort::Threshold,
};

const char* stroke_name(Stroke s) {
    switch (s) {
        case Stroke::Freestyle: return "freestyle";
        case Stroke::Backstroke: return "backstroke";
        case Stroke::Breaststroke: return "breaststroke";
        case Stroke::Butterfly: return "butterfly";
        case Stroke::IM: return "im";
        case Stroke::Choice: return "choice";
        default: return "unknown";
    }
}

const char* stroke_display(Stroke s) {
    switch (s) {
        case Stroke::Freestyle: return "Free";
        case Stroke::Backstroke: return "Back";
        case Stroke::Breaststroke: return "Breast";
        case Stroke::Butterfly: return "Fly";
        case Stroke::IM: return "IM";
        case Stroke::Choice: return "Choice";
        default: return "Other";
    }
}

std::optional<Stroke> stroke_from_name(const std::string& name) {
    const std::string n = textutil::to_lower_ascii(textutil::trim(name));
    for (Stroke s : kStrokes) {
        if (n == stroke_name(s)) return s;
    }
    return std::nullopt;
}

const char* mode_name(Mode m) {
    switch (m) {
        case Mode::Swim: return "swim";
        case Mode::Kick: return "kick";
        case Mode::Pull: return "pull";
        case Mode::Drill: return "drill";
        case Mode::Scull: return "scull";
        case Mode::Technique: return "technique";
        default: return "unknown";
    }
}

const char* mode_display(Mode m) {
    switch (m) {
        case Mode::Swim: return "Swim";
        case Mode::Kick: return "Kick";
        case Mode::Pull: return "Pull";
        case Mode::Drill: return "Drill";
        case Mode::Scull: return "Scull";
        case Mode::Technique: return "Technique";
        default: return "Other";
    }
}

std::optional<Mode> mode_from_name(const std::string& name) {
    const std::string n = textutil::to_lower_ascii(textutil::trim(name));
    for (Mode m : kModes) {
        if (n == mode_name(m)) return m;
    }
    return std::nullopt;
}

const char* interval_kind_name(IntervalKind k) {
    switch (k) {
        case IntervalKind::Sendoff: return "sendoff";
        case IntervalKind::Rest: return "rest";
        case IntervalKind::None: return "none";
        default: return "none";
    }
}

std::optional<IntervalKind> interval_kind_from_name(const std::string& name) {
    const std::string n = textutil::to_lower_ascii(textutil::trim(name));
    if (n == "sendoff") return IntervalKind::Sendoff;
    if (n == "rest") return IntervalKind::Rest;
    if (n == "none") return IntervalKind::None;
    return std::nullopt;
}

const char* effort_name(Effort e) {
    switch (e) {
        case Effort::Easy: return "easy";
        case Effort::Cruise: return "cruise";
        case Effort::Moderate: return "moderate";
        case Effort::Fast: return "fast";
        case Effort::Sprint: return "sprint";
        case Effort::Descend: return "descend";
        case Effort::Ascend: return "ascend";
        case Effort::Build: return "build";
        case Effort::NegativeSplit: return "negative_split";
        case Effort::EvenPace: return "even_pace";
        case Effort::BestAverage: return "best_average";
        case Effort::HoldPace: return "hold_pace";
        case Effort::RacePace: return "race_pace";
        case Effort::Threshold: return "threshold";
        default: return "unknown";
    }
}

const char* effort_code(Effort e) {
    switch (e) {
        case Effort::Easy: return "EZ";
        case Effort::Cruise: return "Cruise";
        case Effort::Moderate: return "Mod";
        case Effort::Fast: return "Fast";
        case Effort::Sprint: return "Sp";
        case Effort::Descend: return "DESC";
        case Effort::Ascend: return "ASC";
        case Effort::Build: return "Bld";
        case Effort::NegativeSplit: return "N/S";
        case Effort::EvenPace: return "Even";
        case Effort::BestAverage: return "Best avg";
        case Effort::HoldPace: return "Hold";
        case Effort::RacePace: return "Race pace";
        case Effort::Threshold: return "Threshold";
        default: return "";
    }
}

std::optional<Effort> effort_from_name(const std::string& name) {
    const std::string n = textutil::to_lower_ascii(textutil::trim(name));
    for (Effort e : kEfforts) {
        if (n == effort_name(e)) return e;
    }
    // the mobile app wrote camelCase raw values
    static const std::pair<const char*, Effort> legacy[] = {
        {"negativesplit", Effort::NegativeSplit},
        {"evenpace", Effort::EvenPace},
        {"bestaverage", Effort::BestAverage},
        {"holdpace", Effort::HoldPace},
        {"racepace", Effort::RacePace},
    };
    for (const auto& [key, effort] : legacy) {
        if (n == key) return effort;
    }
    return std::nullopt;
}

}  // namespace workout
