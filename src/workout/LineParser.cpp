#include "workout/LineParser.hpp"

#include "textutil/TextUtil.hpp"
#include "workout/FieldExtractors.hpp"

#include <utility>
#include <vector>

namespace workout {

static const std::vector<std::string>& separators() {
    static const std::vector<std::string> seps = {"-", "\xE2\x80\x93", ","};
    return seps;
}

static std::string clean_text(const std::string& s) {
    return textutil::trim(textutil::collapse_spaces(textutil::trim_separators(s, separators())));
}

static std::string with_notes(const std::string& text, const std::optional<std::string>& notes) {
    if (!notes || notes->empty()) return text;
    if (text.empty()) return *notes;
    return text + " " + *notes;
}

// "4x100 free free": what is left only repeats the stroke we already took
static bool repeats_stroke(const std::string& text, Stroke stroke) {
    if (text.empty()) return false;
    const auto again = extract_stroke(text);
    return again.value && *again.value == stroke && textutil::trim(again.remainder).empty();
}

bool ParsedLine::has_numeric_data() const {
    if (set.lines.empty()) return false;
    const Line& l = set.lines.front();
    return l.reps.has_value() || l.distance.has_value();
}

std::optional<ParsedLine> parse_line(const std::string& raw_line) {
    const std::string trimmed = textutil::trim(raw_line);
    if (trimmed.empty()) return std::nullopt;

    ParsedLine out;
    const DashPrefix dash = strip_dash_prefix(trimmed);
    out.started_with_dash = dash.had_dash;
    out.stripped_text = dash.remainder;
    out.set.repeat_count = 1;

    if (dash.remainder.size() > kMaxPatternLineLength) {
        Line note;
        note.text = dash.remainder;
        out.set.lines.push_back(std::move(note));
        return out;
    }

    const std::string unlabeled = strip_label(dash.remainder);

    // Nested repeats carry their own parenthesis ("3x (4x25 @ :25)"), so reps/distance get
    // the first look; a leading note ("(light) 200 free") is retried after notes are pulled.
    Extracted<RepsDistance> rd = extract_reps_distance(unlabeled);
    Extracted<std::string> notes;
    std::string remaining;

    if (rd.value) {
        notes = extract_parenthetical_notes(rd.remainder);
        remaining = notes.remainder;
    } else {
        notes = extract_parenthetical_notes(unlabeled);
        rd = extract_reps_distance(textutil::trim(notes.remainder));
        remaining = rd.value ? rd.remainder : notes.remainder;
    }

    Line line;

    if (rd.value) {
        line.reps = rd.value->reps;
        line.distance = rd.value->distance;

        const auto stroke = extract_stroke(remaining);
        const auto mode = extract_mode(stroke.remainder);
        const auto interval = extract_interval(mode.remainder);
        const auto effort = extract_effort(interval.remainder);

        line.stroke = stroke.value;
        line.mode = mode.value;
        if (interval.value) {
            line.interval_seconds = interval.value->seconds;
            line.interval_kind = interval.value->kind;
        }
        line.effort = effort.value;

        std::string text = clean_text(effort.remainder);
        if (line.stroke && repeats_stroke(text, *line.stroke)) text.clear();
        line.text = with_notes(text, notes.value);
    } else if (const auto total = extract_total(remaining)) {
        line.reps = 1;
        line.distance = *total;
        line.text = with_notes(clean_text(remaining), notes.value);
    } else {
        // permissive: keep the whole line as a note
        line.text = dash.remainder;
    }

    out.set.lines.push_back(std::move(line));
    return out;
}

}  // namespace workout
