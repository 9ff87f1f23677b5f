#include "workout/FieldExtractors.hpp"

#include "textutil/TextUtil.hpp"

#include <limits>
#include <regex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace workout {

namespace {

const char* const kEnDash = "\xE2\x80\x93";

std::optional<int> to_int(const std::string& digits) {
    if (digits.empty()) return std::nullopt;
    try {
        return std::stoi(digits);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

// minutes are optional: ":50" and "50" are both 50 seconds
std::optional<int> clock_seconds(const std::ssub_match& minutes, const std::ssub_match& seconds) {
    const auto secs = to_int(seconds.str());
    if (!secs) return std::nullopt;
    long long mins = 0;
    if (minutes.matched) {
        const auto m = to_int(minutes.str());
        if (!m) return std::nullopt;
        mins = *m;
    }
    const long long total = mins * 60 + *secs;
    if (total > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(total);
}

std::string erase_match(const std::string& s, const std::smatch& m) {
    std::string out = s;
    out.erase(static_cast<size_t>(m.position(0)), static_cast<size_t>(m.length(0)));
    return out;
}

template <typename T>
struct Keyword {
    std::regex re;
    T value;
};

// "\bkeyword\b", case-insensitive; spaces inside a keyword match any run of whitespace
std::regex whole_word(const std::string& keyword) {
    std::string pat = "\\b";
    for (char c : keyword) {
        if (c == ' ') pat += "\\s+";
        else pat.push_back(c);
    }
    pat += "\\b";
    return std::regex(pat, std::regex::icase);
}

template <typename T>
std::vector<Keyword<T>> compile_keywords(const std::vector<std::pair<const char*, T>>& table) {
    std::vector<Keyword<T>> out;
    out.reserve(table.size());
    for (const auto& [kw, value] : table) out.push_back(Keyword<T>{whole_word(kw), value});
    return out;
}

// first keyword in table order wins; only its first occurrence is removed
template <typename T>
Extracted<T> extract_keyword(const std::string& s, const std::vector<Keyword<T>>& keywords) {
    for (const auto& kw : keywords) {
        std::smatch m;
        if (std::regex_search(s, m, kw.re)) {
            return {kw.value, erase_match(s, m)};
        }
    }
    return {std::nullopt, s};
}

// Remove the ')' that closes a group opened before the start of s.
std::string drop_closing_paren(const std::string& s) {
    int depth = 1;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '(') {
            ++depth;
        } else if (s[i] == ')') {
            if (--depth == 0) return s.substr(0, i) + s.substr(i + 1);
        }
    }
    return s;
}

}  // namespace

DashPrefix strip_dash_prefix(const std::string& line) {
    DashPrefix out;
    const std::string t = textutil::trim(line);

    size_t skip = 0;
    if (textutil::starts_with(t, "-")) skip = 1;
    else if (textutil::starts_with(t, kEnDash)) skip = 3;

    if (skip == 0) {
        out.remainder = t;
        return out;
    }
    out.had_dash = true;
    out.remainder = textutil::trim(t.substr(skip));
    return out;
}

std::string strip_label(const std::string& line) {
    static const std::regex label_re(R"(^(?:[A-Z]\.\s*|\d+(?:-|–)\d+:\s*))");
    return std::regex_replace(line, label_re, "", std::regex_constants::format_first_only);
}

Extracted<std::string> extract_parenthetical_notes(const std::string& s) {
    std::vector<std::string> notes;
    std::string rest;
    rest.reserve(s.size());

    // each '(' pairs with the next ')'; "()" is not a note
    size_t last = 0;
    size_t from = 0;
    size_t open = 0;
    while ((open = s.find('(', from)) != std::string::npos) {
        const size_t close = s.find(')', open + 1);
        if (close == std::string::npos) break;
        if (close == open + 1) {
            from = open + 1;
            continue;
        }
        rest.append(s, last, open - last);
        notes.push_back(s.substr(open + 1, close - open - 1));
        last = from = close + 1;
    }
    rest.append(s, last, std::string::npos);

    if (notes.empty()) return {std::nullopt, s};
    return {textutil::join(notes, ", "), rest};
}

Extracted<RepsDistance> extract_reps_distance(const std::string& s) {
    static const std::regex nested_re(R"(^(\d{1,10})\s*(?:x|×)\s*(\()?\s*(\d{1,10})\s*(?:x|×)\s*(\d{1,10})(?!\d))",
                                      std::regex::icase);
    static const std::regex simple_re(R"(^(\d{1,10})\s*(?:x|×)\s*(\d{1,10})(?!\d))", std::regex::icase);
    static const std::regex distance_re(R"(^(\d{1,10})(?:\s|$))");

    std::smatch m;

    if (std::regex_search(s, m, nested_re)) {
        const auto outer = to_int(m[1].str());
        const auto inner = to_int(m[3].str());
        const auto dist = to_int(m[4].str());
        if (outer && inner && dist && *outer > 0 && *inner > 0) {
            const long long reps = static_cast<long long>(*outer) * *inner;
            if (reps <= std::numeric_limits<int>::max()) {
                std::string rest = m.suffix().str();
                if (m[2].matched) rest = drop_closing_paren(rest);
                return {RepsDistance{static_cast<int>(reps), *dist}, rest};
            }
        }
    }

    if (std::regex_search(s, m, simple_re)) {
        const auto reps = to_int(m[1].str());
        const auto dist = to_int(m[2].str());
        if (reps && dist && *reps > 0) {
            return {RepsDistance{*reps, *dist}, m.suffix().str()};
        }
    }

    if (std::regex_search(s, m, distance_re)) {
        const auto dist = to_int(m[1].str());
        if (dist) return {RepsDistance{1, *dist}, m.suffix().str()};
    }

    return {std::nullopt, s};
}

Extracted<Stroke> extract_stroke(const std::string& s) {
    static const std::vector<Keyword<Stroke>> keywords = compile_keywords<Stroke>({
        {"free", Stroke::Freestyle},
        {"freestyle", Stroke::Freestyle},
        {"fr", Stroke::Freestyle},
        {"back", Stroke::Backstroke},
        {"backstroke", Stroke::Backstroke},
        {"bk", Stroke::Backstroke},
        {"breast", Stroke::Breaststroke},
        {"breaststroke", Stroke::Breaststroke},
        {"br", Stroke::Breaststroke},
        {"fly", Stroke::Butterfly},
        {"butterfly", Stroke::Butterfly},
        {"im", Stroke::IM},
        {"choice", Stroke::Choice},
    });
    return extract_keyword(s, keywords);
}

Extracted<Mode> extract_mode(const std::string& s) {
    // more specific activities first; "swim" is the weakest signal
    static const std::vector<Keyword<Mode>> keywords = compile_keywords<Mode>({
        {"drill", Mode::Drill},
        {"kick", Mode::Kick},
        {"pull", Mode::Pull},
        {"scull", Mode::Scull},
        {"technique", Mode::Technique},
        {"swim", Mode::Swim},
    });
    return extract_keyword(s, keywords);
}

Extracted<Interval> extract_interval(const std::string& s) {
    static const std::regex sendoff_re(
        R"(@\s*(?:(\d+)?:)?(\d+)(?:\s*(?:-|–)\s*(?:\d*:)?\d+)?)");
    static const std::regex rest_re(R"((?:(\d+)?:)?(\d+)\s*rest\b)", std::regex::icase);

    std::smatch m;

    if (std::regex_search(s, m, sendoff_re)) {
        if (const auto secs = clock_seconds(m[1], m[2])) {
            return {Interval{*secs, IntervalKind::Sendoff}, erase_match(s, m)};
        }
    }

    if (std::regex_search(s, m, rest_re)) {
        if (const auto secs = clock_seconds(m[1], m[2])) {
            return {Interval{*secs, IntervalKind::Rest}, erase_match(s, m)};
        }
    }

    return {std::nullopt, s};
}

Extracted<Effort> extract_effort(const std::string& s) {
    static const std::vector<Keyword<Effort>> keywords = compile_keywords<Effort>({
        {"easy", Effort::Easy},
        {"ez", Effort::Easy},
        {"aerobic", Effort::Cruise},
        {"cruise", Effort::Cruise},
        {"moderate", Effort::Moderate},
        {"strong", Effort::Moderate},
        {"threshold", Effort::Threshold},
        {"race pace", Effort::RacePace},
        {"race", Effort::RacePace},
        {"sprint", Effort::Sprint},
        {"fast", Effort::Fast},
        {"descend", Effort::Descend},
        {"ascend", Effort::Ascend},
        {"build", Effort::Build},
        {"negative split", Effort::NegativeSplit},
        {"even pace", Effort::EvenPace},
        {"best average", Effort::BestAverage},
        {"hold pace", Effort::HoldPace},
    });
    return extract_keyword(s, keywords);
}

std::optional<int> extract_total(const std::string& s) {
    static const std::regex labeled_re(R"((?:total|preset|warmup|cooldown):\s*(\d+))", std::regex::icase);
    static const std::regex bare_re(R"(^\s*(\d{3,})\s*$)");

    std::smatch m;
    if (std::regex_search(s, m, labeled_re)) return to_int(m[1].str());
    if (std::regex_search(s, m, bare_re)) return to_int(m[1].str());
    return std::nullopt;
}

}  // namespace workout
