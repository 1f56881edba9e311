#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "synth/attribute_pattern.hpp"

namespace synth {

// JSON form of one pattern:
//
//   {"name": "age", "type": "integer", "categorical": false,
//    "min": 18, "max": 90, "decimals": null,
//    "bins": [18, 21.6, ...], "prs": [0.05, ...]}
//
// "decimals" is null unless the type is float. Integral numbers of integer
// columns are written as JSON integers.
nlohmann::json pattern_to_json(const AttributePattern& p);

// Throws std::runtime_error on a missing key, an unknown type, a bins/prs
// length mismatch or a negative probability.
AttributePattern pattern_from_json(const nlohmann::json& j);

// Multi-column document: {"attributes": [pattern, ...]}.
nlohmann::json patterns_to_json(const std::vector<AttributePattern>& ps);
std::vector<AttributePattern> patterns_from_json(const nlohmann::json& j);

// File helpers. Loading accepts a single pattern or an "attributes"
// document.
std::vector<AttributePattern> load_pattern_file(const std::string& path);
void save_pattern_file(const std::string& path,
                       const std::vector<AttributePattern>& ps);

}  // namespace synth
