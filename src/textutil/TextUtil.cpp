#include "textutil/TextUtil.hpp"

namespace textutil {

static bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && is_blank(s[i])) ++i;
    while (j > i && is_blank(s[j - 1])) --j;
    return s.substr(i, j - i);
}

std::string to_lower_ascii(std::string s) {
    for (char& c : s) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    return s;
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    std::string cur;
    cur.reserve(128);

    for (char ch : s) {
        if (ch == '\r') continue;
        if (ch == '\n') {
            lines.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    lines.push_back(cur);
    return lines;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool begins_with_whitespace(const std::string& s) {
    return !s.empty() && (s[0] == ' ' || s[0] == '\t');
}

std::string collapse_spaces(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = false;

    for (char c : s) {
        if (c == ' ' || c == '\t') {
            if (!prev_space) out.push_back(' ');
            prev_space = true;
        } else {
            out.push_back(c);
            prev_space = false;
        }
    }
    return out;
}

std::string trim_separators(const std::string& s, const std::vector<std::string>& separators) {
    std::string out = trim(s);

    // one separator at each end, matching "^[–-]\s*|\s*[–-]$|^,\s*|\s*,$"
    for (const auto& sep : separators) {
        if (!sep.empty() && starts_with(out, sep)) {
            out = trim(out.substr(sep.size()));
            break;
        }
    }
    for (const auto& sep : separators) {
        if (!sep.empty() && out.size() >= sep.size() &&
            out.compare(out.size() - sep.size(), sep.size(), sep) == 0) {
            out = trim(out.substr(0, out.size() - sep.size()));
            break;
        }
    }
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

}  // namespace textutil
