#include "workout/Yardage.hpp"

#include <cctype>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace workout {

std::string YardageCategory::display() const {
    if (mode) return mode_display(*mode);
    if (stroke) return stroke_display(*stroke);
    return "Other";
}

// strokes sort before modes, each in declaration order
bool YardageCategory::operator<(const YardageCategory& o) const {
    const int a = mode ? 100 + static_cast<int>(*mode) : (stroke ? static_cast<int>(*stroke) : 200);
    const int b = o.mode ? 100 + static_cast<int>(*o.mode) : (o.stroke ? static_cast<int>(*o.stroke) : 200);
    return a < b;
}

bool YardageCategory::operator==(const YardageCategory& o) const {
    return stroke == o.stroke && mode == o.mode;
}

static const std::int64_t kMaxYards = std::numeric_limits<std::int64_t>::max();

// yards are never negative; sums and products saturate at kMaxYards
static std::int64_t add_yards(std::int64_t a, std::int64_t b) {
    if (b > 0 && a > kMaxYards - b) return kMaxYards;
    return a + b;
}

static std::int64_t mul_yards(std::int64_t a, std::int64_t b) {
    if (a <= 0 || b <= 0) return 0;
    if (a > kMaxYards / b) return kMaxYards;
    return a * b;
}

std::int64_t line_yards(const Line& line) {
    if (line.yardage_override) return *line.yardage_override;
    if (!line.distance) return 0;
    return mul_yards(*line.distance, line.reps.value_or(1));
}

std::int64_t set_yards(const Set& set) {
    std::int64_t sum = 0;
    for (const auto& l : set.lines) sum = add_yards(sum, line_yards(l));
    return mul_yards(sum, set.repeat_count);
}

std::int64_t section_yards(const Section& section) {
    std::int64_t sum = 0;
    for (const auto& s : section.sets) sum = add_yards(sum, set_yards(s));
    return sum;
}

std::int64_t total_yards(const std::vector<Section>& sections) {
    std::int64_t sum = 0;
    for (const auto& sec : sections) sum = add_yards(sum, section_yards(sec));
    return sum;
}

std::int64_t total_yards(const ParseResult& result) {
    return total_yards(result.sections);
}

std::optional<YardageCategory> yardage_category(const Line& line) {
    if (line.mode && line.stroke) {
        if (*line.mode == Mode::Swim) return YardageCategory{line.stroke, std::nullopt};
        return YardageCategory{std::nullopt, line.mode};
    }
    if (line.mode) return YardageCategory{std::nullopt, line.mode};
    if (line.stroke) return YardageCategory{line.stroke, std::nullopt};
    return std::nullopt;
}

std::map<YardageCategory, std::int64_t> stroke_yards(const std::vector<Section>& sections) {
    std::map<YardageCategory, std::int64_t> out;
    for (const auto& sec : sections) {
        for (const auto& set : sec.sets) {
            for (const auto& line : set.lines) {
                const auto cat = yardage_category(line);
                if (!cat) continue;
                out[*cat] = add_yards(out[*cat], mul_yards(line_yards(line), set.repeat_count));
            }
        }
    }
    return out;
}

std::string format_interval(std::optional<int> seconds) {
    if (!seconds || *seconds <= 0) return ":00";

    const int mins = *seconds / 60;
    const int secs = *seconds % 60;

    char buf[32];
    if (mins == 0) std::snprintf(buf, sizeof(buf), ":%02d", secs);
    else std::snprintf(buf, sizeof(buf), "%d:%02d", mins, secs);
    return buf;
}

int parse_interval_digits(const std::string& digits) {
    if (digits.empty()) return 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return 0;
    }

    try {
        if (digits.size() <= 2) return std::stoi(digits);
        const long long secs = std::stoi(digits.substr(digits.size() - 2));
        const long long mins = std::stoi(digits.substr(0, digits.size() - 2));
        const long long total = mins * 60 + secs;
        if (total > std::numeric_limits<int>::max()) return 0;
        return static_cast<int>(total);
    } catch (const std::out_of_range&) {
        return 0;
    }
}

}  // namespace workout
