#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "workout/PracticeTemplate.hpp"

// Upgrade a stored template document to the current schema. Documents without
// "schema_version" are the mobile app's camelCase format (schema 1).
// Throws std::runtime_error for versions newer than this build understands.
nlohmann::json migrate_template_json(nlohmann::json j);

// Strict decode of a current-schema document (migration applied first).
workout::PracticeTemplate practice_template_from_json(const nlohmann::json& j);

workout::PracticeTemplate load_practice_template(const std::string& path);

std::string read_text_file(const std::string& path);
