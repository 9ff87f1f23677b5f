#include "io/JsonIO.hpp"

#include "textutil/TextUtil.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace workout;

// Swift's Date encodes seconds since 2001-01-01T00:00:00Z
static const std::int64_t kAppleEpochOffset = 978307200;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::optional<std::string> optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::optional<std::int64_t> optional_int64(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    const json& v = j.at(key);
    if (!v.is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }
    if (v.is_number_unsigned() &&
        v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw std::runtime_error(where + "." + std::string(key) + " out of range");
    }
    return v.get<std::int64_t>();
}

static std::optional<int> optional_int(const json& j, const char* key, const std::string& where) {
    const auto v = optional_int64(j, key, where);
    if (!v) return std::nullopt;
    if (*v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) {
        throw std::runtime_error(where + "." + std::string(key) + " out of range");
    }
    return static_cast<int>(*v);
}

// counts, distances and seconds are never negative
static std::optional<int> optional_count(const json& j, const char* key, const std::string& where) {
    const auto v = optional_int(j, key, where);
    if (v && *v < 0) {
        throw std::runtime_error(where + "." + std::string(key) + " must be >= 0");
    }
    return v;
}

static std::string index_path(const std::string& where, const char* key, size_t i) {
    std::ostringstream oss;
    oss << where << "." << key << "[" << i << "]";
    return oss.str();
}

// ---------- schema 1 -> 2 ----------

static void rename_key(json& j, const char* from, const char* to) {
    if (!j.is_object() || !j.contains(from)) return;
    if (!j.contains(to)) j[to] = j[from];
    j.erase(from);
}

// legacy lines without a mode: first activity word found in the text
static std::optional<Mode> infer_mode_from_text(const std::string& text) {
    const std::string lower = textutil::to_lower_ascii(text);
    if (lower.find("drill") != std::string::npos) return Mode::Drill;
    if (lower.find("kick") != std::string::npos) return Mode::Kick;
    if (lower.find("pull") != std::string::npos) return Mode::Pull;
    if (lower.find("scull") != std::string::npos) return Mode::Scull;
    if (lower.find("technique") != std::string::npos) return Mode::Technique;
    if (lower.find("swim") != std::string::npos) return Mode::Swim;
    return std::nullopt;
}

// "1:30" -> 90, ":50" -> 50, "45" -> 45; decoration like "@ " is ignored
static std::optional<int> parse_legacy_interval(const std::string& s) {
    std::string cleaned;
    for (char c : s) {
        if ((c >= '0' && c <= '9') || c == ':') cleaned.push_back(c);
    }
    if (cleaned.empty()) return std::nullopt;

    const auto colon = cleaned.find(':');
    try {
        if (colon == std::string::npos) return std::stoi(cleaned);
        const std::string mins = cleaned.substr(0, colon);
        const std::string secs = cleaned.substr(colon + 1);
        if (secs.empty()) return std::nullopt;
        const long long m = mins.empty() ? 0 : std::stoll(mins);
        const long long sec = std::stoll(secs);
        const long long max = std::numeric_limits<int>::max();
        if (m > max / 60 || sec > max - m * 60) return std::nullopt;
        const long long total = m * 60 + sec;
        return static_cast<int>(total);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static void migrate_line_v1(json& l) {
    if (!l.is_object()) return;

    rename_key(l, "intervalSeconds", "interval_seconds");
    rename_key(l, "intervalKind", "interval_kind");
    rename_key(l, "yardageOverride", "yardage_override");

    const std::string text = (l.contains("text") && l["text"].is_string()) ? l["text"].get<std::string>() : "";

    // the old enum mixed strokes and activities: "kick" used to be a stroke
    std::optional<Mode> stroke_as_mode;
    if (l.contains("stroke") && l["stroke"].is_string()) {
        const std::string raw = l["stroke"].get<std::string>();
        if (!stroke_from_name(raw)) {
            stroke_as_mode = mode_from_name(raw);
            l["stroke"] = nullptr;
        }
    }

    const bool has_mode = l.contains("mode") && l["mode"].is_string() && mode_from_name(l["mode"].get<std::string>());
    if (!has_mode) {
        std::optional<Mode> m = stroke_as_mode ? stroke_as_mode : infer_mode_from_text(text);
        l["mode"] = m ? json(mode_name(*m)) : json(nullptr);
    }

    if (!l.contains("interval_seconds") || l["interval_seconds"].is_null()) {
        std::optional<int> secs;
        if (l.contains("interval") && l["interval"].is_string()) secs = parse_legacy_interval(l["interval"].get<std::string>());
        l["interval_seconds"] = secs ? json(*secs) : json(nullptr);
    }

    if (!l.contains("interval_kind") || !l["interval_kind"].is_string()) {
        std::string kind = "none";
        if (!l["interval_seconds"].is_null()) {
            const std::string type = (l.contains("intervalType") && l["intervalType"].is_string())
                                         ? l["intervalType"].get<std::string>()
                                         : "interval";
            kind = (type == "rest") ? "rest" : "sendoff";
        }
        l["interval_kind"] = kind;
    }

    if (!l.contains("effort")) {
        json effort = nullptr;
        if (l.contains("patterns") && l["patterns"].is_object()) {
            const json& p = l["patterns"];
            if (p.contains("pace") && p["pace"].is_string()) {
                if (auto e = effort_from_name(p["pace"].get<std::string>())) effort = effort_name(*e);
            }
        }
        l["effort"] = effort;
    }

    l.erase("interval");
    l.erase("intervalType");
    l.erase("patterns");
}

// about 31,700 years either side of 2001
static const double kMaxLegacyDateSeconds = 1e12;

static std::int64_t legacy_date(const json& v, const std::string& where) {
    if (!v.is_number()) return 0;
    const double d = v.get<double>();
    if (!std::isfinite(d) || std::fabs(d) > kMaxLegacyDateSeconds) {
        throw std::runtime_error(where + " out of range");
    }
    return static_cast<std::int64_t>(std::llround(d)) + kAppleEpochOffset;
}

static void migrate_v1_to_v2(json& j) {
    rename_key(j, "poolInfo", "pool_info");
    rename_key(j, "rawText", "raw_text");

    if (j.contains("createdAt")) {
        j["created_at"] = legacy_date(j["createdAt"], "root.createdAt");
        j.erase("createdAt");
    }
    if (j.contains("lastEditedAt")) {
        j["last_edited_at"] = legacy_date(j["lastEditedAt"], "root.lastEditedAt");
        j.erase("lastEditedAt");
    }

    if (j.contains("tag") && j["tag"].is_string()) {
        const auto tag = practice_tag_from_string(j["tag"].get<std::string>());
        j["tag"] = tag ? json(practice_tag_name(*tag)) : json(nullptr);
    }

    if (j.contains("sections") && j["sections"].is_array()) {
        for (auto& sec : j["sections"]) {
            if (!sec.is_object() || !sec.contains("sets") || !sec["sets"].is_array()) continue;
            for (auto& set : sec["sets"]) {
                rename_key(set, "repeatCount", "repeat_count");
                if (!set.is_object() || !set.contains("lines") || !set["lines"].is_array()) continue;
                for (auto& line : set["lines"]) migrate_line_v1(line);
            }
        }
    }

    j["schema_version"] = 2;
}

json migrate_template_json(json j) {
    require_object(j, "root");

    int version = 1;
    if (j.contains("schema_version")) {
        if (!j["schema_version"].is_number_integer()) {
            throw std::runtime_error("root.schema_version must be an integer");
        }
        version = j["schema_version"].get<int>();
    }

    if (version > kTemplateSchemaVersion) {
        throw std::runtime_error("unsupported template schema_version: " + std::to_string(version));
    }

    if (version < 2) migrate_v1_to_v2(j);
    return j;
}

// ---------- strict decode ----------

static Line parse_line_json(const json& j, const std::string& where) {
    require_object(j, where);

    Line l;
    l.id = require_string(j, "id", where);
    l.reps = optional_count(j, "reps", where);
    l.distance = optional_count(j, "distance", where);
    l.interval_seconds = optional_count(j, "interval_seconds", where);
    l.yardage_override = optional_count(j, "yardage_override", where);
    l.text = require_string(j, "text", where);

    if (auto s = optional_string(j, "stroke", where)) {
        l.stroke = stroke_from_name(*s);
        if (!l.stroke) throw std::runtime_error(where + ".stroke unknown value: " + *s);
    }
    if (auto m = optional_string(j, "mode", where)) {
        l.mode = mode_from_name(*m);
        if (!l.mode) throw std::runtime_error(where + ".mode unknown value: " + *m);
    }
    if (auto k = optional_string(j, "interval_kind", where)) {
        const auto kind = interval_kind_from_name(*k);
        if (!kind) throw std::runtime_error(where + ".interval_kind unknown value: " + *k);
        l.interval_kind = *kind;
    }
    if (auto e = optional_string(j, "effort", where)) {
        l.effort = effort_from_name(*e);
        if (!l.effort) throw std::runtime_error(where + ".effort unknown value: " + *e);
    }
    return l;
}

static Set parse_set_json(const json& j, const std::string& where) {
    require_object(j, where);

    Set s;
    s.id = require_string(j, "id", where);
    s.title = optional_string(j, "title", where);
    s.repeat_count = optional_int(j, "repeat_count", where).value_or(1);
    if (s.repeat_count < 1) {
        throw std::runtime_error(where + ".repeat_count must be >= 1");
    }

    if (!j.contains("lines")) {
        throw std::runtime_error(where + " missing required field: lines");
    }
    const json& lines = j.at("lines");
    require_array(lines, where + ".lines");
    for (size_t i = 0; i < lines.size(); ++i) {
        s.lines.push_back(parse_line_json(lines.at(i), index_path(where, "lines", i)));
    }
    return s;
}

static Section parse_section_json(const json& j, const std::string& where) {
    require_object(j, where);

    Section sec;
    sec.id = require_string(j, "id", where);
    sec.label = require_string(j, "label", where);

    if (!j.contains("sets")) {
        throw std::runtime_error(where + " missing required field: sets");
    }
    const json& sets = j.at("sets");
    require_array(sets, where + ".sets");
    for (size_t i = 0; i < sets.size(); ++i) {
        sec.sets.push_back(parse_set_json(sets.at(i), index_path(where, "sets", i)));
    }
    return sec;
}

PracticeTemplate practice_template_from_json(const json& raw) {
    const json j = migrate_template_json(raw);

    PracticeTemplate t;
    t.id = require_string(j, "id", "root");
    t.title = require_string(j, "title", "root");
    t.notes = optional_string(j, "notes", "root");
    t.pool_info = optional_string(j, "pool_info", "root");
    t.raw_text = optional_string(j, "raw_text", "root");

    if (auto tag = optional_string(j, "tag", "root")) {
        t.tag = practice_tag_from_string(*tag);
    }

    if (!j.contains("sections")) {
        throw std::runtime_error("root missing required field: sections");
    }
    const json& sections = j.at("sections");
    require_array(sections, "root.sections");
    for (size_t i = 0; i < sections.size(); ++i) {
        t.sections.push_back(parse_section_json(sections.at(i), index_path("root", "sections", i)));
    }

    t.created_at = optional_int64(j, "created_at", "root").value_or(0);
    t.last_edited_at = optional_int64(j, "last_edited_at", "root").value_or(0);
    return t;
}

PracticeTemplate load_practice_template(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open template file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }

    return practice_template_from_json(j);
}

std::string read_text_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open: " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}
