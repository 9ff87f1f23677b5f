#include "workout/WorkoutParser.hpp"

#include "textutil/TextUtil.hpp"
#include "workout/HeaderDetector.hpp"
#include "workout/LineParser.hpp"

#include <utility>

namespace workout {

static const char* const kNoSectionsWarning = "No sections found. Try adding 'Main Set' or 'Warmup'.";

static std::string make_id(ParseContext& ctx, const char* prefix) {
    return std::string(prefix) + "-" + std::to_string(ctx.next_id++);
}

static Section& ensure_section(ParseContext& ctx, const ParserConfig& cfg) {
    if (!ctx.current_section) {
        Section s;
        s.id = make_id(ctx, "section");
        s.label = cfg.fallback_section_label;
        ctx.current_section = std::move(s);
    }
    return *ctx.current_section;
}

static void append_set(ParseContext& ctx, const ParserConfig& cfg, Set set) {
    set.id = make_id(ctx, "set");
    for (auto& l : set.lines) {
        if (l.id.empty()) l.id = make_id(ctx, "line");
    }
    ensure_section(ctx, cfg).sets.push_back(std::move(set));
}

// Emit the pending lines as one repeated Set. An empty buffer only resets the count.
static void flush_group(ParseContext& ctx, const ParserConfig& cfg) {
    if (ctx.pending.lines.empty()) {
        ctx.pending.repeat_count = 1;
        return;
    }

    Set set;
    set.repeat_count = ctx.pending.repeat_count;
    set.lines = std::move(ctx.pending.lines);
    append_set(ctx, cfg, std::move(set));

    ctx.pending = PendingGroup{};
}

static void push_current_section(ParseContext& ctx) {
    if (ctx.current_section && !ctx.current_section->sets.empty()) {
        ctx.sections.push_back(std::move(*ctx.current_section));
    }
    ctx.current_section.reset();
}

static void append_text(Line& line, const std::string& text) {
    if (line.text.empty()) line.text = text;
    else line.text += " " + text;
}

// Descriptor lines annotate the previous Line: inside the open group first, else the last
// Line of the current section. Returns false when there is nothing to annotate.
static bool merge_descriptor(ParseContext& ctx, const std::string& text) {
    if (ctx.pending.accumulating() && !ctx.pending.lines.empty()) {
        append_text(ctx.pending.lines.back(), text);
        return true;
    }

    if (!ctx.current_section || ctx.current_section->sets.empty()) return false;
    Set& last_set = ctx.current_section->sets.back();
    if (last_set.lines.empty()) return false;

    append_text(last_set.lines.back(), text);
    return true;
}

ParseContext step(ParseContext ctx, const std::string& raw_line, const ParserConfig& cfg) {
    const std::string line = textutil::trim(raw_line);

    if (line.empty()) {
        flush_group(ctx, cfg);
        return ctx;
    }

    if (textutil::starts_with(line, "//") || textutil::starts_with(line, "#")) return ctx;

    if (const auto label = detect_section(line)) {
        flush_group(ctx, cfg);
        push_current_section(ctx);

        Section s;
        s.id = make_id(ctx, "section");
        s.label = *label;
        ctx.current_section = std::move(s);
        ctx.saw_header = true;
        return ctx;
    }

    // Before the first header only the first line counts, as the title.
    if (!ctx.saw_header) {
        if (!ctx.title) ctx.title = line;
        return ctx;
    }

    if (const auto rounds = extract_round_count(line)) {
        flush_group(ctx, cfg);
        ctx.pending.repeat_count = *rounds;
        return ctx;
    }

    auto parsed = parse_line(raw_line);
    if (!parsed) return ctx;

    if (parsed->is_descriptor()) {
        if (!merge_descriptor(ctx, parsed->stripped_text)) {
            // nothing above it to annotate; keep it as a note line
            append_set(ctx, cfg, std::move(parsed->set));
        }
        return ctx;
    }

    if (ctx.pending.accumulating()) {
        if (textutil::begins_with_whitespace(raw_line)) {
            Line l = std::move(parsed->set.lines.front());
            l.id = make_id(ctx, "line");
            ctx.pending.lines.push_back(std::move(l));
            return ctx;
        }
        // dedent ends the block
        flush_group(ctx, cfg);
    }

    append_set(ctx, cfg, std::move(parsed->set));
    return ctx;
}

ParseResult finish(ParseContext ctx, const ParserConfig& cfg) {
    flush_group(ctx, cfg);
    push_current_section(ctx);

    ParseResult result;
    result.sections = std::move(ctx.sections);
    result.title = std::move(ctx.title);

    if (result.sections.empty()) {
        result.warnings.push_back(kNoSectionsWarning);
    }
    return result;
}

ParseResult parse(const std::string& text, const ParserConfig& cfg) {
    if (text.empty()) return ParseResult{};

    ParseContext ctx;
    for (const auto& raw : textutil::split_lines(text)) {
        ctx = step(std::move(ctx), raw, cfg);
    }
    return finish(std::move(ctx), cfg);
}

}  // namespace workout
