#pragma once
/*
================================================================================
Fragment 9.3 - IO: HeuristicResult JSON (write + read back)
FILE: cpp/engine/io/result_json.hpp

Purpose:
  - Deterministic JSON export of HeuristicResult for dashboards, reports and
    regression diffs, and a strict reader for the same document.

Hardening:
  - Stable key order; maps are written sorted by key.
  - Non-finite numbers (the +inf LCOE sentinel) are written as null and read
    back as +inf, so parse + re-serialize reproduces the input bytes.
  - Unknown keys are ignored on read; known keys are type-checked.
================================================================================
*/

#include <iosfwd>
#include <string>
#include <string_view>

#include "engine/io/json_value.hpp"
#include "engine/optimization/heuristic_result.hpp"

namespace powerplan {

std::string heuristic_result_to_json(const HeuristicResult& r, int indent_spaces = 2);

bool parse_heuristic_result_json(std::string_view json, HeuristicResult* out,
                                 JsonParseError* err = nullptr);

bool parse_heuristic_result_json(std::istream& is, HeuristicResult* out,
                                 JsonParseError* err = nullptr);

// Returns true on success, false when the file cannot be written.
bool write_heuristic_result_json_file(const HeuristicResult& r, const std::string& file_path,
                                      int indent_spaces = 2);

} // namespace powerplan
