#pragma once
/*
================================================================================
Fragment 9.4 - IO: Scenario Loader
FILE: cpp/engine/io/scenario_json.hpp

Purpose:
  - Build a validated Scenario + problem inputs + fill policy from JSON.

Document (every section optional except load_trajectory):
  {
    "problem_type": 1,
    "site": { "name": "...", "nox_tpy": 100, ..., "grid_available_year": 2030 },
    "load_trajectory": { "2027": 200, "2028": 300 },
    "workload_mix": { "pre_training": 0.6, "batch_inference": 0.4 },
    "workloads": { "custom": { "flexibility_pct": 0.2, "ramp_factor": 0.1 } },
    "parameters": { "discount_rate": 0.08, "flex_scenarios": [0, 0.15], ... },
    "equipment": { "recip": { "capex_per_kw": 1700 }, ... },
    "fill_policy": { "name": "recip_then_grid", "recip_cap_mw": 150, ... },
    "problem": { "existing": {...}, "lcoe_threshold": 100, "services": [...] }
  }

Errors:
  - Malformed JSON: parse_scenario_json returns false with JsonParseError.
  - Wrong value types, unknown technology / policy names, out-of-range
    values: ValidationError naming the offending key path.
  - load_scenario_file: IOError when the file cannot be read.
================================================================================
*/

#include <string>
#include <string_view>

#include "engine/core/scenario.hpp"
#include "engine/io/json_value.hpp"
#include "engine/io/read_through_cache.hpp"
#include "engine/optimization/problems.hpp"
#include "engine/sizing/equipment_sizer.hpp"

namespace powerplan {

struct ScenarioDocument {
  int problem_type = 1;
  Scenario scenario{};
  ProblemInputs inputs{};
  FillPolicy policy = FillPolicy::recip_first();
};

// Builds from an already-parsed value. Throws ValidationError.
ScenarioDocument scenario_from_json(const JsonValue& root);

// false on malformed JSON (see *err); throws ValidationError on bad content.
bool parse_scenario_json(std::string_view json, ScenarioDocument* out, JsonParseError* err = nullptr);

// Whole file as text. Throws IOError.
std::string read_text_file(const std::string& path);

// read_text_file + parse. Malformed JSON is rethrown as ValidationError with
// the position in the message.
ScenarioDocument load_scenario_file(const std::string& path);

// Caller-owned cache of parsed scenario files, keyed by path. A failed load
// leaves the cache unchanged and rethrows.
using ScenarioFileCache = ReadThroughCache<ScenarioDocument>;

ScenarioDocument load_scenario_file(const std::string& path, ScenarioFileCache& cache);

} // namespace powerplan
