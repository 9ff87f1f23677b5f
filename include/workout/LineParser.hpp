#pragma once

#include <optional>
#include <string>

#include "workout/Models.hpp"

namespace workout {

struct ParsedLine {
    Set set;                   // always one Line, repeat_count 1; grouping is the caller's job
    bool started_with_dash = false;
    std::string stripped_text; // trimmed line with any dash prefix removed

    bool has_numeric_data() const;

    // "- notes about previous set": no reps, no distance, dash prefix.
    // Merge stripped_text into the previous Line instead of appending a new Set.
    bool is_descriptor() const { return started_with_dash && !has_numeric_data(); }
};

// Turn one physical line into a single-line Set. Returns nullopt only for blank input;
// anything else produces at least a text-only Line.
std::optional<ParsedLine> parse_line(const std::string& raw_line);

}  // namespace workout
