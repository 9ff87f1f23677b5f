#include "workout/PracticeTemplate.hpp"

#include "textutil/TextUtil.hpp"
#include "workout/Yardage.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <random>
#include <stdexcept>

namespace workout {

static const char* const kUntitled = "Untitled Practice";

const char* practice_tag_name(PracticeTag t) {
    switch (t) {
        case PracticeTag::Sprint: return "Sprint";
        case PracticeTag::Distance: return "Distance";
        case PracticeTag::IM: return "IM";
        case PracticeTag::Recovery: return "Recovery";
        case PracticeTag::Threshold: return "Threshold";
        case PracticeTag::Skills: return "Skills";
        default: return "";
    }
}

std::optional<PracticeTag> practice_tag_from_string(const std::string& s) {
    const std::string t = textutil::trim(s);
    for (PracticeTag tag : {PracticeTag::Sprint, PracticeTag::Distance, PracticeTag::IM,
                            PracticeTag::Recovery, PracticeTag::Threshold, PracticeTag::Skills}) {
        if (t == practice_tag_name(tag)) return tag;
    }

    const std::string lower = textutil::to_lower_ascii(t);
    auto has = [&](const char* needle) { return lower.find(needle) != std::string::npos; };

    if (has("sprint")) return PracticeTag::Sprint;
    if (has("distance")) return PracticeTag::Distance;
    if (has("im")) return PracticeTag::IM;
    if (has("recovery")) return PracticeTag::Recovery;
    if (has("threshold")) return PracticeTag::Threshold;
    if (has("skills") || has("drill")) return PracticeTag::Skills;
    return std::nullopt;
}

static std::string random_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned long long> dist;

    unsigned long long hi = dist(gen);
    unsigned long long lo = dist(gen);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  hi >> 32, (hi >> 16) & 0xFFFFULL, hi & 0xFFFFULL,
                  lo >> 48, lo & 0xFFFFFFFFFFFFULL);
    return buf;
}

static std::int64_t unix_now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

std::int64_t PracticeTemplate::total_yards() const {
    return workout::total_yards(sections);
}

nlohmann::json line_to_json(const Line& l) {
    nlohmann::json j;
    j["id"] = l.id;
    j["reps"] = l.reps ? nlohmann::json(*l.reps) : nlohmann::json(nullptr);
    j["distance"] = l.distance ? nlohmann::json(*l.distance) : nlohmann::json(nullptr);
    j["stroke"] = l.stroke ? nlohmann::json(stroke_name(*l.stroke)) : nlohmann::json(nullptr);
    j["mode"] = l.mode ? nlohmann::json(mode_name(*l.mode)) : nlohmann::json(nullptr);
    j["interval_seconds"] = l.interval_seconds ? nlohmann::json(*l.interval_seconds) : nlohmann::json(nullptr);
    j["interval_kind"] = interval_kind_name(l.interval_kind);
    j["effort"] = l.effort ? nlohmann::json(effort_name(*l.effort)) : nlohmann::json(nullptr);
    j["text"] = l.text;
    if (l.yardage_override) j["yardage_override"] = *l.yardage_override;
    return j;
}

nlohmann::json set_to_json(const Set& s) {
    nlohmann::json j;
    j["id"] = s.id;
    j["title"] = s.title ? nlohmann::json(*s.title) : nlohmann::json(nullptr);
    j["repeat_count"] = s.repeat_count;

    nlohmann::json lines = nlohmann::json::array();
    for (const auto& l : s.lines) lines.push_back(line_to_json(l));
    j["lines"] = lines;
    return j;
}

nlohmann::json section_to_json(const Section& s) {
    nlohmann::json j;
    j["id"] = s.id;
    j["label"] = s.label;

    nlohmann::json sets = nlohmann::json::array();
    for (const auto& set : s.sets) sets.push_back(set_to_json(set));
    j["sets"] = sets;
    return j;
}

nlohmann::json PracticeTemplate::to_json() const {
    nlohmann::json j;
    j["schema_version"] = kTemplateSchemaVersion;
    j["id"] = id;
    j["title"] = title;
    if (notes) j["notes"] = *notes;
    if (pool_info) j["pool_info"] = *pool_info;
    if (tag) j["tag"] = practice_tag_name(*tag);

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& s : sections) arr.push_back(section_to_json(s));
    j["sections"] = arr;

    if (raw_text) j["raw_text"] = *raw_text;
    j["created_at"] = created_at;
    j["last_edited_at"] = last_edited_at;
    j["total_yards"] = total_yards();
    return j;
}

void PracticeTemplate::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

PracticeTemplate make_template(const ParseResult& result, const std::string& raw_text, const TemplateOptions& opts) {
    PracticeTemplate t;
    t.id = opts.id.empty() ? random_uuid() : opts.id;

    if (!opts.title.empty()) t.title = opts.title;
    else if (result.title && !result.title->empty()) t.title = *result.title;
    else t.title = kUntitled;

    t.notes = opts.notes;
    t.pool_info = opts.pool_info;
    t.tag = opts.tag;
    t.sections = result.sections;
    if (!raw_text.empty()) t.raw_text = raw_text;

    t.created_at = opts.now != 0 ? opts.now : unix_now();
    t.last_edited_at = t.created_at;
    return t;
}

}  // namespace workout
