/*
================================================================================
Fragment 10.0 - CLI: Main Entry Point (powerplan_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line driver for the planning engine:
    * run a scenario file and write the result JSON / CSV tables
    * run a built-in demo scenario for any problem type

Usage:
  powerplan_cli run <scenario.json> [--out result.json] [--dispatch-csv f]
                                    [--stack-csv f] [--log-level lvl]
  powerplan_cli demo <1..5> [--out result.json] [--log-level lvl]
  powerplan_cli help

Hardening:
  - Explicit exit codes for CI integration
  - No silent failures: every error is printed with its category
  - Deterministic output (only solve_time_seconds varies between runs)
================================================================================
*/

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/io/dispatch_csv.hpp"
#include "engine/io/result_json.hpp"
#include "engine/io/scenario_json.hpp"
#include "engine/optimization/planning_engine.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace powerplan;

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3,
  IO_ERROR = 4
};

namespace {

struct CliOptions {
  std::string input;
  std::string out_path;
  std::string dispatch_csv;
  std::string stack_csv;
  bool verbose = false;
  bool level_set = false;
  LogLevel level = LogLevel::INFO;
};

void print_help() {
  std::cout << R"(
powerplan_cli - On-site power sizing and dispatch planner

Usage:
  powerplan_cli run <scenario.json> [options]
  powerplan_cli demo <problem_type> [options]
  powerplan_cli help

Problem types:
  1  Greenfield      minimize blended LCOE for a new site
  2  Brownfield      maximize expansion MW under an LCOE ceiling
  3  LandDev         max firm MW allowed by NOx / gas / land
  4  GridServices    demand-response revenue from flexible load
  5  BridgePower     rent vs buy until the grid arrives

Options:
  --out <file>            write the result JSON to <file> (default: stdout)
  --dispatch-csv <file>   write the 8760-hour dispatch of the chosen fleet
  --stack-csv <file>      write the annual energy stack
  --log-level <lvl>       debug | info | warn | error (default: info)
  --verbose               same as --log-level debug

Log lines go to stderr whenever the result JSON goes to stdout.

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation / configuration error
  3 - Computation failed
  4 - I/O error
)";
}

// Parses everything after "<cmd> <arg>". false on unknown / incomplete flag.
bool parse_flags(int argc, char** argv, int first, CliOptions& opt) {
  for (int i = first; i < argc; ++i) {
    const std::string a = argv[i];
    auto next = [&](std::string& dst) {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << a << "\n";
        return false;
      }
      dst = argv[++i];
      return true;
    };
    if (a == "--verbose") {
      opt.verbose = true;
    } else if (a == "--log-level") {
      std::string lvl;
      if (!next(lvl)) return false;
      if (!parse_log_level(lvl, &opt.level)) {
        std::cerr << "Unknown log level: " << lvl << "\n";
        return false;
      }
      opt.level_set = true;
    } else if (a == "--out") {
      if (!next(opt.out_path)) return false;
    } else if (a == "--dispatch-csv") {
      if (!next(opt.dispatch_csv)) return false;
    } else if (a == "--stack-csv") {
      if (!next(opt.stack_csv)) return false;
    } else {
      std::cerr << "Unknown option: " << a << "\n";
      return false;
    }
  }
  return true;
}

// Built-in three-year campus with a mixed AI workload.
ScenarioDocument demo_document(int problem_type) {
  ScenarioDocument doc;
  doc.problem_type = problem_type;

  Scenario& sc = doc.scenario;
  sc.site_name = "demo_campus";
  sc.trajectory.peak_mw_by_year = {{2027, 150.0}, {2028, 250.0}, {2029, 300.0}};
  sc.trajectory.workload_mix = {{"pre_training", 0.4}, {"batch_inference", 0.4}, {"real_time_inference", 0.2}};
  sc.site.nox_tpy = 250.0;
  sc.site.gas_supply_mcf_day = 80000.0;
  sc.site.land_area_acres = 1000.0;
  sc.site.grid_capacity_mw = 100.0;
  sc.site.grid_available_year = 2029;

  doc.inputs.brownfield.existing.set_recip_units(6, sc.catalog);
  doc.inputs.brownfield.existing_lcoe = 80.0;
  doc.inputs.brownfield.lcoe_threshold = 100.0;
  doc.inputs.bridge_power.grid_available_month = 36;
  return doc;
}

// Load level the reported fleet was sized against.
double dispatch_peak_mw(const HeuristicResult& r, const Scenario& sc) {
  for (const char* k : {"total_mw", "n1_served_mw", "base_load_mw"}) {
    auto it = r.metrics.find(k);
    if (it != r.metrics.end()) return it->second;
  }
  return sc.trajectory.max_peak_mw();
}

void print_summary(const HeuristicResult& r) {
  std::cerr << "Problem:    " << r.problem_name << " (scenario " << r.scenario_id << ")\n";
  std::cerr << "Feasible:   " << (r.feasible ? "yes" : "no") << "\n";
  std::cerr << "Objective:  " << r.objective_label << " = " << r.objective_value << "\n";
  std::cerr << "Fleet:      " << summarize(r.equipment_config) << "\n";
  if (!r.selected_strategy.empty()) std::cerr << "Strategy:   " << r.selected_strategy << "\n";
  if (!r.binding_constraint.empty()) std::cerr << "Binding:    " << r.binding_constraint << "\n";
  for (const std::string& v : r.violations) std::cerr << "  violation: " << v << "\n";
  for (const std::string& w : r.warnings) std::cerr << "  warning:   " << w << "\n";
}

int solve_and_write(const ScenarioDocument& doc, const CliOptions& opt) {
  const PlanningEngine engine(doc.scenario, doc.policy);
  const HeuristicResult r = engine.optimize(doc.problem_type, doc.inputs);
  print_summary(r);

  const std::string json = heuristic_result_to_json(r);
  if (opt.out_path.empty()) {
    std::cout << json;
  } else if (!write_heuristic_result_json_file(r, opt.out_path)) {
    throw IOError("cannot write '" + opt.out_path + "'");
  }

  if (!opt.stack_csv.empty() && !write_annual_stack_csv_file(r.annual_stack, opt.stack_csv)) {
    throw IOError("cannot write '" + opt.stack_csv + "'");
  }
  if (!opt.dispatch_csv.empty()) {
    const DispatchResult d =
        engine.services().dispatch.simulate_peak(r.equipment_config, dispatch_peak_mw(r, doc.scenario));
    if (!write_dispatch_csv_file(d, opt.dispatch_csv)) {
      throw IOError("cannot write '" + opt.dispatch_csv + "'");
    }
  }
  return ExitCode::SUCCESS;
}

// Maps the error taxonomy onto exit codes.
template <class Fn>
int guarded(Fn&& fn) {
  try {
    return fn();
  } catch (const IOError& e) {
    std::cerr << "I/O error: " << e.what() << "\n";
    return ExitCode::IO_ERROR;
  } catch (const ValidationError& e) {
    std::cerr << "Validation FAILED: " << e.what() << "\n";
    return ExitCode::VALIDATION_FAILED;
  } catch (const ConfigurationError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return ExitCode::VALIDATION_FAILED;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return ExitCode::COMPUTATION_FAILED;
  }
}

int cmd_run(const CliOptions& opt) {
  return guarded([&] {
    const ScenarioDocument doc = load_scenario_file(opt.input);
    return solve_and_write(doc, opt);
  });
}

int cmd_demo(int problem_type, const CliOptions& opt) {
  return guarded([&] { return solve_and_write(demo_document(problem_type), opt); });
}

} // namespace

int main(int argc, char** argv) {
  const std::string cmd = (argc >= 2) ? std::string(argv[1]) : "help";

  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return ExitCode::SUCCESS;
  }

  if (cmd != "run" && cmd != "demo") {
    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'powerplan_cli help' for usage information.\n";
    return ExitCode::INVALID_ARGS;
  }
  if (argc < 3) {
    std::cerr << "'" << cmd << "' needs an argument. Run 'powerplan_cli help'.\n";
    return ExitCode::INVALID_ARGS;
  }

  CliOptions opt;
  opt.input = argv[2];
  if (!parse_flags(argc, argv, 3, opt)) return ExitCode::INVALID_ARGS;
  if (opt.verbose) set_log_level(LogLevel::DEBUG);
  else if (opt.level_set) set_log_level(opt.level);
  // stdout carries the result JSON.
  if (opt.out_path.empty()) set_log_stream(&std::cerr);

  if (cmd == "run") return cmd_run(opt);

  int problem_type = 0;
  try {
    size_t used = 0;
    problem_type = std::stoi(opt.input, &used);
    if (used != opt.input.size()) problem_type = 0;
  } catch (const std::exception&) {
    problem_type = 0;
  }
  if (problem_type < 1 || problem_type > 5) {
    std::cerr << "demo: problem type must be 1..5, got '" << opt.input << "'\n";
    return ExitCode::INVALID_ARGS;
  }
  return cmd_demo(problem_type, opt);
}
