#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace costbridge::sanitize {

// Returns a copy of `value` with every NaN or infinite float replaced by null.
// Everything else is copied unchanged.
nlohmann::json sanitize(const nlohmann::json& value);

// Rewrites the bare NaN, Infinity and -Infinity tokens some servers emit
// (outside string literals) to null so the text parses as strict JSON.
std::string replace_non_finite_literals(const std::string& text);

}  // namespace costbridge::sanitize
