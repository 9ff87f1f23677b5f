#include "workout/CommitRenderer.hpp"

#include "textutil/TextUtil.hpp"
#include "workout/Yardage.hpp"

#include <fstream>
#include <stdexcept>
#include <vector>

namespace workout {

// "Mon Oct 19 '26"
static std::string format_date(const std::tm& when) {
    char wday_mon[32];
    char year[8];
    std::strftime(wday_mon, sizeof(wday_mon), "%a %b", &when);
    std::strftime(year, sizeof(year), "%y", &when);
    return std::string(wday_mon) + " " + std::to_string(when.tm_mday) + " '" + year;
}

// "6:05 PM"
static std::string format_time(const std::tm& when) {
    int hour = when.tm_hour % 12;
    if (hour == 0) hour = 12;
    char minutes[8];
    std::strftime(minutes, sizeof(minutes), "%M", &when);
    return std::to_string(hour) + ":" + minutes + (when.tm_hour < 12 ? " AM" : " PM");
}

std::string render_line(const Line& line) {
    std::string prefix;
    if (line.reps && line.distance) {
        prefix = std::to_string(*line.reps) + "x" + std::to_string(*line.distance) + " ";
    } else if (line.distance) {
        prefix = std::to_string(*line.distance) + " ";
    }

    std::vector<std::string> parts;
    if (line.stroke) parts.push_back(stroke_display(*line.stroke));
    if (line.mode) parts.push_back(mode_display(*line.mode));
    if (!line.text.empty()) parts.push_back(line.text);

    std::string content = textutil::join(parts, " ");
    if (line.effort) {
        const std::string code = effort_code(*line.effort);
        if (content.empty()) content = code;
        else content += " (" + code + ")";
    }

    std::string suffix;
    if (line.interval_seconds) {
        switch (line.interval_kind) {
            case IntervalKind::Sendoff:
                suffix = " @ " + format_interval(line.interval_seconds);
                break;
            case IntervalKind::Rest:
                suffix = " " + format_interval(line.interval_seconds) + " rest";
                break;
            case IntervalKind::None:
                break;
        }
    }

    return textutil::trim(prefix + content + suffix);
}

std::string render_commit_text(const PracticeTemplate& t, const std::tm& when, const RenderConfig& cfg) {
    std::string out;

    out += t.title;
    if (t.notes && !t.notes->empty()) out += " | " + *t.notes;
    out += "\n";

    out += format_date(when) + " \xC2\xB7 " + format_time(when);
    if (t.pool_info && !t.pool_info->empty()) out += " " + *t.pool_info;
    out += "\n\n";

    // every section, even ones worth 0 yards (instructions only)
    for (const auto& sec : t.sections) {
        out += sec.label + "\n";

        for (const auto& set : sec.sets) {
            if (set.title && !set.title->empty()) out += *set.title + "\n";

            const bool grouped = set.repeat_count > 1;
            if (grouped) out += std::to_string(set.repeat_count) + " rounds of:\n";

            for (const auto& line : set.lines) {
                if (grouped && cfg.indent_rounds) out += "  ";
                out += render_line(line) + "\n";
            }
        }
        out += "\n";
    }

    return out;
}

void write_commit_text(const std::filesystem::path& out_path, const std::string& text) {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << text;
    if (text.empty() || text.back() != '\n') out << "\n";
}

}  // namespace workout
