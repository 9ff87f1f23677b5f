#pragma once

#include <optional>
#include <string>

#include "workout/Models.hpp"

namespace workout {

// Each extractor takes the current remainder of a line and returns what it found plus the
// text left for the next extractor. Nothing is mutated in place.
template <typename T>
struct Extracted {
    std::optional<T> value;
    std::string remainder;
};

struct RepsDistance {
    int reps = 1;
    int distance = 0;
};

struct Interval {
    int seconds = 0;
    IntervalKind kind = IntervalKind::None;
};

struct DashPrefix {
    bool had_dash = false;
    std::string remainder;
};

// "- notes" / "– 3x (4x25 @ :25)" -> had_dash + text after the dash
DashPrefix strip_dash_prefix(const std::string& line);

// "A. Kick focus" -> "Kick focus", "1-2: Fly" -> "Fly"
std::string strip_label(const std::string& line);

// All "(...)" groups removed from the remainder, joined with ", ".
Extracted<std::string> extract_parenthetical_notes(const std::string& s);

// Priority: nested "A x (B x C" (reps A*B), simple "A x B", then a bare leading distance.
Extracted<RepsDistance> extract_reps_distance(const std::string& s);

Extracted<Stroke> extract_stroke(const std::string& s);
Extracted<Mode> extract_mode(const std::string& s);

// Sendoff "@ 1:30", "@ :50", "@ :55-1:05" (lower bound kept), or rest ":15 rest".
Extracted<Interval> extract_interval(const std::string& s);

Extracted<Effort> extract_effort(const std::string& s);

// "Total: 600", "Preset: 1000" or a bare number of 3+ digits
std::optional<int> extract_total(const std::string& s);

}  // namespace workout
