/*
  Fragment 9.7 - Scenario Loader Selftest

  Framework-free checks for the scenario JSON loader:
    1) A full document fills site, trajectory, parameters, equipment
       overrides, fill policy and problem inputs.
    2) Wrong value types name the offending key path.
    3) Malformed JSON is reported with a position, not thrown.
    4) Missing files raise IOError; the cached loader reads a file once.
    5) Loading logs at DEBUG through a redirected log stream.

  Run: ./scenario_json_selftest (non-zero exit on failure)
*/

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/io/json_value.hpp"
#include "engine/io/scenario_json.hpp"

namespace powerplan {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void expect_near(double got, double exp, double tol, std::string_view msg) {
  if (!(std::fabs(got - exp) <= tol)) {
    fail(msg);
    std::cerr << "  expected " << exp << ", got " << got << "\n";
  } else {
    pass(msg);
  }
}

// Runs fn and returns the ValidationError message, or "" when nothing was thrown.
template <class Fn>
std::string validation_message(Fn fn) {
  try {
    fn();
  } catch (const ValidationError& e) {
    return e.what();
  }
  return std::string();
}

ScenarioDocument parse_or_fail(std::string_view json) {
  ScenarioDocument doc;
  JsonParseError err;
  if (!parse_scenario_json(json, &doc, &err)) fail("Scenario JSON should parse: " + describe(err));
  return doc;
}

const char* kFullDocument = R"({
  "problem_type": 2,
  "site": {
    "name": "north_campus",
    "nox_tpy": 250,
    "land_area_acres": 900,
    "n_minus_1_required": false,
    "grid_capacity_mw": 80,
    "grid_available_year": 2030
  },
  "load_trajectory": { "2027": 150, "2028": 250.5 },
  "workload_mix": { "pre_training": 0.6, "batch_inference": 0.4 },
  "workloads": { "batch_inference": { "flexibility_pct": 0.8 } },
  "parameters": { "discount_rate": 0.07, "flex_scenarios": [0, 0.2], "load_seed": 7 },
  "equipment": { "recip": { "capex_per_kw": 1700 } },
  "fill_policy": { "name": "recip_then_grid", "recip_cap_mw": 150, "grid_import_limit_mw": 60 },
  "problem": {
    "existing": { "recip_units": 6, "bess_power_mw": 10, "bess_energy_mwh": 40 },
    "existing_lcoe": 75,
    "lcoe_threshold": 95,
    "primary": "turbine",
    "services": [ { "name": "econ_dr", "activation_per_mwh": 40, "expected_hours_yr": 80, "min_capacity_mw": 1 } ],
    "grid_available_month": 24,
    "rental_cost_kw_month": 45
  }
})";

void test_full_document() {
  const ScenarioDocument doc = parse_or_fail(kFullDocument);
  const Scenario& sc = doc.scenario;

  expect_true(doc.problem_type == 2, "problem_type read");
  expect_true(sc.site_name == "north_campus", "Site name read");
  expect_near(sc.site.nox_tpy, 250.0, 0.0, "NOx cap read");
  expect_near(sc.site.gas_supply_mcf_day, SiteConstraints{}.gas_supply_mcf_day, 0.0, "Absent key keeps default");
  expect_true(!sc.site.n_minus_1_required, "N-1 flag read");
  expect_true(sc.site.grid_available_year && *sc.site.grid_available_year == 2030, "Grid year read");
  expect_near(sc.trajectory.peak_in(2028), 250.5, 0.0, "Trajectory year keys read");
  expect_true(sc.trajectory.workload_mix.size() == 2, "Workload mix read");
  expect_near(sc.workloads.at("batch_inference").flexibility_pct, 0.8, 0.0, "Workload override read");
  expect_near(sc.workloads.at("batch_inference").ramp_factor, 0.0, 0.0, "Partial workload override keeps other field");
  expect_near(sc.params.discount_rate, 0.07, 0.0, "Discount rate read");
  expect_true(sc.params.flex_scenarios.size() == 2, "Flex scenarios read");
  expect_true(sc.params.load_seed == 7, "Load seed read");
  expect_near(sc.catalog.at(Technology::Recip).capex_per_kw, 1700.0, 0.0, "Equipment override merged");
  expect_near(sc.catalog.at(Technology::Recip).capacity_mw, 18.3, 0.0, "Unlisted spec fields keep defaults");

  expect_true(doc.policy.name == "recip_then_grid", "Fill policy name read");
  expect_near(doc.policy.primary.at(0).cap_mw, 150.0, 0.0, "Recip cap read");
  expect_near(doc.policy.grid_import_limit_mw, 60.0, 0.0, "Grid import limit read");

  expect_true(doc.inputs.brownfield.existing.recip_units == 6, "Existing recips read");
  expect_near(doc.inputs.brownfield.existing.recip_mw, 6 * 18.3, 1e-9, "Existing recip MW sized from catalog");
  expect_near(doc.inputs.brownfield.lcoe_threshold, 95.0, 0.0, "LCOE threshold read");
  expect_true(doc.inputs.land_dev.primary == Technology::Turbine, "LandDev primary read");
  expect_true(doc.inputs.grid_services.services.size() == 1, "Services replace the defaults");
  expect_true(doc.inputs.bridge_power.grid_available_month == 24, "Bridge month read");
}

void test_validation_errors() {
  const std::string wrong_type = validation_message(
      [] { parse_or_fail(R"({"site": {"nox_tpy": "high"}, "load_trajectory": {"2027": 100}})"); });
  expect_true(wrong_type == "scenario: 'site.nox_tpy' must be number, got string", "Wrong type names the key path");

  expect_true(validation_message([] { parse_or_fail(R"({"site": {}})"); }).find("load_trajectory") !=
                  std::string::npos,
              "Missing load_trajectory rejected");
  expect_true(!validation_message([] { parse_or_fail(R"({"load_trajectory": {"20x7": 100}})"); }).empty(),
              "Non-year trajectory key rejected");
  expect_true(!validation_message([] {
                 parse_or_fail(R"({"load_trajectory": {"2027": 100}, "equipment": {"fusion": {}}})");
               }).empty(),
              "Unknown technology rejected");
  expect_true(!validation_message([] {
                 parse_or_fail(R"({"load_trajectory": {"2027": 100}, "workload_mix": {"pre_training": 0.5}})");
               }).empty(),
              "Workload shares not summing to 1 rejected");
  expect_true(!validation_message([] {
                 parse_or_fail(R"({"load_trajectory": {"2027": 100}, "fill_policy": {"name": "coal_first"}})");
               }).empty(),
              "Unknown fill policy rejected");
  expect_true(!validation_message([] {
                 parse_or_fail(R"({"load_trajectory": {"2027": 100}, "problem": {"grid_available_month": 1.5}})");
               }).empty(),
              "Fractional month rejected");
}

void test_malformed_json() {
  ScenarioDocument doc;
  JsonParseError err;
  const bool ok = parse_scenario_json("{\n  \"load_trajectory\": {\"2027\": 100,}\n}", &doc, &err);
  expect_true(!ok, "Trailing comma is malformed JSON");
  expect_true(err.line == 2 && err.col > 1, "Parse error carries line and column");
  expect_true(!describe(err).empty(), "Parse error has a description");
}

void test_files_and_cache() {
  bool io_threw = false;
  try {
    (void)load_scenario_file("/nonexistent/powerplan/scenario.json");
  } catch (const IOError&) {
    io_threw = true;
  }
  expect_true(io_threw, "Missing file raises IOError");

  const std::filesystem::path path = std::filesystem::temp_directory_path() / "powerplan_scenario_selftest.json";
  {
    std::ofstream f(path);
    f << R"({"site": {"name": "cached"}, "load_trajectory": {"2027": 100}})";
  }

  {
    std::ostringstream captured;
    set_log_stream(&captured);
    {
      const ScopedLogLevel debug(LogLevel::DEBUG);
      (void)load_scenario_file(path.string());
    }
    set_log_stream(nullptr);
    expect_true(captured.str().find("[DEBUG] loaded scenario 'cached'") != std::string::npos,
                "Load logged at DEBUG to the redirected stream");
    expect_true(get_log_level() == LogLevel::ERROR, "Scoped log level restored");
    LogLevel parsed = LogLevel::ERROR;
    expect_true(parse_log_level("warn", &parsed) && parsed == LogLevel::WARN, "parse_log_level accepts 'warn'");
    expect_true(!parse_log_level("WARN", &parsed) && parsed == LogLevel::WARN, "parse_log_level is case-sensitive");
  }

  ScenarioFileCache cache(std::chrono::minutes(5), 4);
  const ScenarioDocument first = load_scenario_file(path.string(), cache);
  {
    std::ofstream f(path);
    f << R"({"site": {"name": "edited"}, "load_trajectory": {"2027": 100}})";
  }
  const ScenarioDocument second = load_scenario_file(path.string(), cache);
  expect_true(first.scenario.site_name == "cached" && second.scenario.site_name == "cached",
              "Cached loader serves the first read");
  expect_true(cache.stats().hits == 1 && cache.stats().misses == 1, "One miss then one hit");

  cache.invalidate(path.string());
  const ScenarioDocument third = load_scenario_file(path.string(), cache);
  expect_true(third.scenario.site_name == "edited", "Invalidate forces a fresh read");

  {
    std::ofstream f(path);
    f << "{ not json";
  }
  cache.clear();
  bool bad_threw = false;
  try {
    (void)load_scenario_file(path.string(), cache);
  } catch (const ValidationError&) {
    bad_threw = true;
  }
  expect_true(bad_threw, "Malformed file raises ValidationError");
  expect_true(cache.size() == 0, "Failed load is not cached");

  std::error_code ec;
  std::filesystem::remove(path, ec);
}

}  // namespace
}  // namespace powerplan

int main() {
  using namespace powerplan;
  set_log_level(LogLevel::ERROR);

  test_full_document();
  test_validation_errors();
  test_malformed_json();
  test_files_and_cache();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
