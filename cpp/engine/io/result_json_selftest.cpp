/*
  Fragment 9.6 - Result JSON Round-Trip Selftest

  Framework-free checks for the HeuristicResult JSON contract:
    1) Writer never emits NaN/Inf literals (keys such as batch_inference are
       text, not literals); the +inf LCOE sentinel is null.
    2) Reader turns null back into +inf.
    3) serialize(parse(serialize(result))) is byte-identical, for a hand-built
       result and for real engine output.
    4) Malformed JSON and schema errors are reported, not thrown.

  Run: ./result_json_selftest (non-zero exit on failure)
*/

#include <cctype>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/core/scenario.hpp"
#include "engine/io/json_value.hpp"
#include "engine/io/json_writer.hpp"
#include "engine/io/result_json.hpp"
#include "engine/optimization/planning_engine.hpp"

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

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

// Alphabetic tokens outside string literals: only true / false / null are JSON.
std::vector<std::string> bare_words(const std::string& json) {
  std::vector<std::string> words;
  bool in_string = false;
  for (size_t i = 0; i < json.size(); ++i) {
    const char c = json[i];
    if (in_string) {
      if (c == '\\') ++i;
      else if (c == '"') in_string = false;
      continue;
    }
    if (c == '"') {
      in_string = true;
    } else if (std::isdigit(static_cast<unsigned char>(c))) {
      // Skip the whole number so an exponent 'e' is not read as a word.
      while (i + 1 < json.size() && (std::isdigit(static_cast<unsigned char>(json[i + 1])) ||
                                     json[i + 1] == '.' || json[i + 1] == 'e' || json[i + 1] == 'E' ||
                                     json[i + 1] == '+' || json[i + 1] == '-')) {
        ++i;
      }
    } else if (std::isalpha(static_cast<unsigned char>(c))) {
      size_t j = i;
      while (j < json.size() && std::isalpha(static_cast<unsigned char>(json[j]))) ++j;
      words.push_back(json.substr(i, j - i));
      i = j - 1;
    }
  }
  return words;
}

void expect_json_has_no_nonfinite_literals(const std::string& json) {
  bool only_keywords = true;
  for (const std::string& w : bare_words(json)) {
    if (w != "true" && w != "false" && w != "null") {
      only_keywords = false;
      std::cerr << "  bare token: " << w << "\n";
    }
  }
  expect_true(only_keywords, "JSON must not contain NaN/Inf literals");
}

void test_nonfinite_scan() {
  expect_true(bare_words(R"({"batch_inference": 1, "info": "nan inf", "tiny": 1e-300, "big": 2.5E+10})").empty(),
              "Keys and strings mentioning inf/nan are not literals");
  const std::vector<std::string> w = bare_words(R"({"a": inf, "b": -Infinity, "c": NaN, "d": null})");
  expect_true(w.size() == 4 && w[0] == "inf" && w[1] == "Infinity" && w[2] == "NaN" && w[3] == "null",
              "Bare non-finite tokens are found");
}

HeuristicResult make_result() {
  const double inf = std::numeric_limits<double>::infinity();
  HeuristicResult r;
  r.problem_type = ProblemType::LandDev;
  r.problem_name = "land_dev";
  r.scenario_id = "00ff00ff00ff00ff";
  r.feasible = false;
  r.objective_value = 80.0;
  r.objective_label = "max_firm_mw";
  r.lcoe = inf;
  r.capex_total = 1.25e8;
  r.opex_annual = 3.5e6;
  r.timeline_months = 27.0;
  r.binding_constraint = "nox";
  r.equipment_config.recip_units = 4;
  r.equipment_config.recip_mw = 73.2;
  r.dispatch_summary.generation_mwh["recip"] = 412345.678;
  r.dispatch_summary.starts["recip"] = 1;

  ConstraintEval e;
  e.name = "land";
  e.unit = "acres";
  e.value = 5.0;
  e.limit = 0.0;
  e.utilization = 999.0;
  e.binding = true;
  e.violated = true;
  r.constraint_status.push_back(e);

  r.violations.push_back("land: 5.00 acres exceeds limit of 0.00 acres");
  r.warnings.push_back("Quote \" and backslash \\ and tab \t survive");
  r.metrics["nox_cap_mw"] = 80.0;
  r.metrics["tiny"] = 1e-300;
  r.metrics["unbounded"] = inf;

  FlexScenarioRow row;
  row.key = "15%";
  row.flex_pct = 0.15;
  row.load_max_mw = 80.0 / (1.0 - 0.15 * 0.7);
  row.firm_mw = 80.0;
  row.lcoe = 61.234567890123;
  row.binding = "nox";
  r.flex_matrix.push_back(row);

  AnnualStackRow year;
  year.year = 2027;
  year.annual_lcoe = inf;
  r.annual_stack.push_back(year);

  r.bridge_scenarios.push_back(BridgeScenario{"rental", 0.0, 0.0, 5.0e6});
  r.service_revenue.push_back(ServiceRevenue{"econ_dr", true, 72.0, 0.0, 360000.0, 360000.0});
  r.flex_by_workload["batch_inference"] = 90.0;
  return r;
}

void test_writer_nonfinite() {
  const std::string json = heuristic_result_to_json(make_result());
  expect_true(!json.empty() && json.back() == '\n', "Writer output ends with a newline");
  expect_json_has_no_nonfinite_literals(json);
  expect_true(json.find("\"lcoe\": null") != std::string::npos, "+inf LCOE written as null");
  expect_true(json.rfind("{\n  \"problem_type\": 3", 0) == 0, "problem_type leads the document");
  expect_eq_str(json_number(std::numeric_limits<double>::quiet_NaN()), "null", "NaN writes as null");
  expect_eq_str(json_number(-0.0), "0", "Negative zero writes as 0");
  expect_eq_str(json_number(0.1), "0.1", "Shortest round-trip formatting");
}

void test_reader_null_to_inf() {
  HeuristicResult out;
  JsonParseError err;
  const bool ok = parse_heuristic_result_json(heuristic_result_to_json(make_result()), &out, &err);
  if (!ok) {
    fail("Reader must accept writer output");
    std::cerr << "  parse error: " << describe(err) << "\n";
    return;
  }
  pass("Reader accepted writer output");
  expect_true(std::isinf(out.lcoe) && out.lcoe > 0.0, "null LCOE reads back as +inf");
  expect_true(std::isinf(out.metrics.at("unbounded")), "null metric reads back as +inf");
  expect_true(std::isinf(out.annual_stack.at(0).annual_lcoe), "null annual LCOE reads back as +inf");
  expect_true(out.problem_type == ProblemType::LandDev, "Problem type survives");
  expect_true(out.metrics.at("tiny") == 1e-300, "Tiny values survive exactly");
  expect_true(out.flex_matrix.at(0).lcoe == 61.234567890123, "Doubles survive exactly");
  expect_eq_str(out.warnings.at(0), "Quote \" and backslash \\ and tab \t survive", "Escapes survive");
  expect_true(out.constraint_status.at(0).sense == ConstraintSense::Max && out.constraint_status.at(0).violated,
              "Constraint status survives");
}

void test_round_trip_identical() {
  const std::string j1 = heuristic_result_to_json(make_result());
  HeuristicResult parsed;
  expect_true(parse_heuristic_result_json(j1, &parsed), "Round-trip parse succeeds");
  expect_eq_str(j1, heuristic_result_to_json(parsed), "Round trip is byte-identical (pretty)");

  const std::string c1 = heuristic_result_to_json(make_result(), 0);
  HeuristicResult compact;
  expect_true(parse_heuristic_result_json(c1, &compact), "Compact parse succeeds");
  expect_eq_str(c1, heuristic_result_to_json(compact, 0), "Round trip is byte-identical (compact)");

  Scenario s = Scenario::defaults(120.0);
  s.trajectory.peak_mw_by_year[2028] = 150.0;
  s.trajectory.workload_mix = {{"pre_training", 0.5}, {"batch_inference", 0.5}};
  const PlanningEngine engine(s);
  for (int type = 1; type <= 5; ++type) {
    const std::string a = heuristic_result_to_json(engine.optimize(type));
    HeuristicResult back;
    std::istringstream is(a);
    const bool ok = parse_heuristic_result_json(is, &back);
    expect_true(ok, "Engine output parses for problem type " + std::to_string(type));
    expect_eq_str(a, heuristic_result_to_json(back), "Engine output round trip for problem type " + std::to_string(type));
  }
}

void test_errors() {
  HeuristicResult out;
  JsonParseError err;
  expect_true(!parse_heuristic_result_json("{\"problem_type\": 1,\n \"lcoe\": NaN}", &out, &err),
              "NaN literal is rejected");
  expect_true(err.line == 2, "Parse error reports the line");

  JsonParseError schema;
  expect_true(!parse_heuristic_result_json("{\"feasible\": true}", &out, &schema), "Missing problem_type rejected");
  expect_true(!schema.message.empty(), "Schema error has a message");

  JsonParseError type_err;
  expect_true(!parse_heuristic_result_json("{\"problem_type\": 9}", &out, &type_err), "Unknown problem_type rejected");

  JsonParseError wrong;
  expect_true(!parse_heuristic_result_json("{\"problem_type\": 1, \"feasible\": \"yes\"}", &out, &wrong),
              "Wrong field type rejected");
}

}  // namespace
}  // namespace powerplan

int main() {
  using namespace powerplan;
  set_log_level(LogLevel::ERROR);

  test_nonfinite_scan();
  test_writer_nonfinite();
  test_reader_null_to_inf();
  test_round_trip_identical();
  test_errors();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
