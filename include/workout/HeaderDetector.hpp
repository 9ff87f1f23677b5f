#pragma once

#include <optional>
#include <string>

namespace workout {

// Classify a line as a section header ("wu", "Main Set:", "Post Set - Pull").
// Returns the canonical label, e.g. "Warmup".
std::optional<std::string> detect_section(const std::string& line);

// "2x thru", "3 rounds", "4x:" -> repeat count. Plain set lines ("4x100 free") are not headers.
std::optional<int> extract_round_count(const std::string& line);

}  // namespace workout
