#include "workout/HeaderDetector.hpp"

#include "textutil/TextUtil.hpp"
#include "workout/Models.hpp"

#include <regex>
#include <stdexcept>
#include <vector>

namespace workout {

namespace {

struct Alias {
    const char* key;
    const char* label;
};

// Longest aliases first so prefix matching is deterministic.
const std::vector<Alias>& section_aliases() {
    static const std::vector<Alias> aliases = {
        {"post-set", labels::kPostSet},
        {"post set", labels::kPostSet},
        {"technique", labels::kPostSet},
        {"recovery", labels::kPostSet},
        {"drills", labels::kPostSet},
        {"reset", labels::kPostSet},
        {"post", labels::kPostSet},

        {"cool-down", labels::kCooldown},
        {"cool down", labels::kCooldown},
        {"warm-down", labels::kCooldown},
        {"warm down", labels::kCooldown},
        {"cooldown", labels::kCooldown},
        {"warmdown", labels::kCooldown},
        {"cd", labels::kCooldown},

        {"main set", labels::kMainSet},
        {"main", labels::kMainSet},
        {"ms", labels::kMainSet},

        {"pre-set", labels::kPreSet},
        {"pre set", labels::kPreSet},
        {"preset", labels::kPreSet},
        {"ps", labels::kPreSet},

        {"warm-up", labels::kWarmup},
        {"warm up", labels::kWarmup},
        {"warmup", labels::kWarmup},
        {"wu", labels::kWarmup},
    };
    return aliases;
}

// what may follow an alias for a prefix match: end, space, dash, colon or en-dash
bool is_header_boundary(const std::string& rest) {
    if (rest.empty()) return true;
    const char c = rest[0];
    if (c == ' ' || c == '-' || c == ':') return true;
    return textutil::starts_with(rest, "\xE2\x80\x93");
}

}  // namespace

std::optional<std::string> detect_section(const std::string& line) {
    const std::string normalized = textutil::to_lower_ascii(textutil::trim(line));
    if (normalized.empty()) return std::nullopt;

    const auto& aliases = section_aliases();

    for (const auto& a : aliases) {
        if (normalized == a.key) return std::string(a.label);
    }

    for (const auto& a : aliases) {
        const std::string key = a.key;
        if (!textutil::starts_with(normalized, key)) continue;
        if (is_header_boundary(normalized.substr(key.size()))) return std::string(a.label);
    }

    return std::nullopt;
}

std::optional<int> extract_round_count(const std::string& line) {
    static const std::regex rounds_re(
        R"(^(\d+)\s*(?:x|×)?\s*(?:rounds?|through|thru|:(?!\d)))",
        std::regex::icase);

    const std::string t = textutil::trim(line);
    if (t.size() > kMaxPatternLineLength) return std::nullopt;

    std::smatch m;
    if (!std::regex_search(t, m, rounds_re)) return std::nullopt;

    try {
        const int n = std::stoi(m[1].str());
        if (n <= 0) return std::nullopt;
        return n;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}  // namespace workout
