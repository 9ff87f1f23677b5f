#pragma once
#include <string>
#include <vector>

namespace textutil {

// strip spaces, tabs and CR/LF from both ends
std::string trim(const std::string& s);

// ASCII-only lowercase; UTF-8 continuation bytes pass through untouched
std::string to_lower_ascii(std::string s);

// split on '\n', dropping '\r'; always returns at least one element
std::vector<std::string> split_lines(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);

// true if the first byte is a space or tab
bool begins_with_whitespace(const std::string& s);

// collapse runs of spaces/tabs into a single space
std::string collapse_spaces(const std::string& s);

// strip any of the given separator tokens (single bytes or UTF-8 sequences) from both ends,
// along with the whitespace around them
std::string trim_separators(const std::string& s, const std::vector<std::string>& separators);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

}  // namespace textutil
