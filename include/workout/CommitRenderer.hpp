#pragma once

#include <ctime>
#include <filesystem>
#include <string>

#include "workout/PracticeTemplate.hpp"

namespace workout {

struct RenderConfig {
    // indent lines under "N rounds of:" so the text parses back into the same block
    bool indent_rounds = true;
};

// One line of the sheet: "4x100 Free @ 1:30", "8x50 Kick (DESC) :15 rest", "easy swim".
std::string render_line(const Line& line);

// Printable practice sheet: header (title, date, time, pool), then every section in order.
std::string render_commit_text(const PracticeTemplate& t, const std::tm& when, const RenderConfig& cfg = {});

void write_commit_text(const std::filesystem::path& out_path, const std::string& text);

}  // namespace workout
