#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "workout/Models.hpp"

namespace workout {

enum class PracticeTag {
    Sprint,
    Distance,
    IM,
    Recovery,
    Threshold,
    Skills
};

const char* practice_tag_name(PracticeTag t);   // "Sprint", "IM", ...

// Exact raw value first, then loose containment ("sprint day" -> Sprint, "drills" -> Skills).
std::optional<PracticeTag> practice_tag_from_string(const std::string& s);

inline constexpr int kTemplateSchemaVersion = 2;

struct PracticeTemplate {
    std::string id;
    std::string title;                    // "Monday AM Sprinters"
    std::optional<std::string> notes;     // "Team Practice"
    std::optional<std::string> pool_info; // "25 Yards"
    std::optional<PracticeTag> tag;

    std::vector<Section> sections;
    std::optional<std::string> raw_text;  // the typed workout the sections came from

    std::int64_t created_at = 0;          // unix seconds
    std::int64_t last_edited_at = 0;

    std::int64_t total_yards() const;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

// Caller-supplied metadata layered over a parse result.
struct TemplateOptions {
    std::string title;                    // overrides the parsed title when non-empty
    std::optional<std::string> notes;
    std::optional<std::string> pool_info;
    std::optional<PracticeTag> tag;
    std::string id;                       // generated when empty
    std::int64_t now = 0;                 // creation time; current time when 0
};

PracticeTemplate make_template(const ParseResult& result, const std::string& raw_text, const TemplateOptions& opts = {});

nlohmann::json line_to_json(const Line& l);
nlohmann::json set_to_json(const Set& s);
nlohmann::json section_to_json(const Section& s);

}  // namespace workout
