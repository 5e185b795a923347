#pragma once

#include "node.h"

#include <nlohmann/json.hpp>

#include <istream>
#include <ostream>
#include <string>

namespace kisexpr {

// JSON form of a tree for viewer and debugging tools:
//   List -> array, String -> string, Integer -> integer, Float -> float,
//   Symbol -> {"symbol": "text"}
// Integer and Float stay distinct (nlohmann writes 2.0 for a whole float).
nlohmann::json to_json(const Node& node);

// Inverse of to_json. Throws nlohmann::json::exception or SexprError on
// values with no tree counterpart (null, booleans, other objects), and
// ParseError::NESTING_TOO_DEEP when arrays nest deeper than `max_depth`
// (the outermost array is depth 1, as for parse()).
Node from_json(const nlohmann::json& j, int max_depth = 512);

void write_json(std::ostream& out, const Node& node, int indent = -1);

// Returns true on success, false on parse error.
bool read_json(std::istream& in, Node& node, int max_depth = 512);
bool read_json(const std::string& json_text, Node& node, int max_depth = 512);

} // namespace kisexpr
