#pragma once

#include <optional>
#include <string>
#include <vector>

#include "workout/Models.hpp"

namespace workout {

struct ParserConfig {
    // label for the section opened when content needs one and no header is open
    std::string fallback_section_label = labels::kMainSet;
};

// Lines collected under a "2x thru" header until the block ends.
struct PendingGroup {
    int repeat_count = 1;
    std::vector<Line> lines;

    bool accumulating() const { return repeat_count > 1; }
};

// Everything the scan carries from one line to the next.
struct ParseContext {
    std::vector<Section> sections;          // finished sections, document order
    std::optional<Section> current_section;
    PendingGroup pending;
    std::optional<std::string> title;
    bool saw_header = false;
    int next_id = 1;                         // ids are unique within one parse
};

// Feed one physical line (untrimmed; leading whitespace marks group membership).
ParseContext step(ParseContext ctx, const std::string& raw_line, const ParserConfig& cfg = {});

// Final flush, last section, warnings.
ParseResult finish(ParseContext ctx, const ParserConfig& cfg = {});

// Never throws for any input; structural problems come back as warnings.
ParseResult parse(const std::string& text, const ParserConfig& cfg = {});

}  // namespace workout
