#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "workout/Models.hpp"

namespace workout {

// Category a Line's yards are credited to in stroke rollups.
struct YardageCategory {
    std::optional<Stroke> stroke;
    std::optional<Mode> mode;

    std::string display() const;
    bool operator<(const YardageCategory& o) const;
    bool operator==(const YardageCategory& o) const;
};

std::int64_t line_yards(const Line& line);
std::int64_t set_yards(const Set& set);
std::int64_t section_yards(const Section& section);
std::int64_t total_yards(const std::vector<Section>& sections);
std::int64_t total_yards(const ParseResult& result);

// Which category a Line counts under:
//   mode + stroke -> the mode, except swim which defers to the stroke ("free swim" is free)
//   mode only     -> the mode
//   stroke only   -> the stroke
//   neither       -> not counted
std::optional<YardageCategory> yardage_category(const Line& line);

std::map<YardageCategory, std::int64_t> stroke_yards(const std::vector<Section>& sections);

// ":50", "1:30"; ":00" for missing or non-positive values
std::string format_interval(std::optional<int> seconds);

// keypad digits -> seconds: "50" = 50, "130" = 90, "1005" = 605
int parse_interval_digits(const std::string& digits);

}  // namespace workout
