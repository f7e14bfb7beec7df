#pragma once
/*
================================================================================
Fragment 8.1 - Optimization: HeuristicResult
FILE: cpp/engine/optimization/heuristic_result.hpp

Purpose:
  - The single output record of optimize() for every problem type.
  - Plain numbers / strings / bools / maps / sequences only, so it can be
    written to JSON or CSV with no internal object references.

Notes:
  - objective_value meaning depends on problem type (objective_label says
    which): blended LCOE, incremental MW, firm MW, annual revenue, or NPV.
  - Problem-specific tables (annual_stack, flex_matrix, service_revenue,
    bridge_scenarios) are empty for problem types that do not produce them.
  - Non-finite numbers (e.g. +inf LCOE sentinel) serialize as JSON null.
================================================================================
*/

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "engine/constraints/constraint_checker.hpp"
#include "engine/core/equipment.hpp"
#include "engine/dispatch/dispatch_simulator.hpp"
#include "engine/planning/annual_stack.hpp"

namespace powerplan {

enum class ProblemType : int {
  Greenfield = 1,
  Brownfield = 2,
  LandDev = 3,
  GridServices = 4,
  BridgePower = 5
};

const char* to_string(ProblemType t) noexcept;
std::optional<ProblemType> problem_type_from_int(int v) noexcept;

struct DispatchSummary {
  double energy_required_mwh = 0.0;
  double energy_delivered_mwh = 0.0;
  double unserved_energy_mwh = 0.0;
  double unserved_energy_pct = 0.0;
  double curtailed_mwh = 0.0;
  double peak_unserved_mw = 0.0;
  int hours_with_unserved = 0;
  double fuel_mmbtu = 0.0;
  double gas_mcf = 0.0;
  double fleet_ramp_mw_min = 0.0;
  double effective_ramp_mw_min = 0.0;

  // Keyed by technology name.
  std::map<std::string, double> generation_mwh;
  std::map<std::string, double> capacity_factor;
  std::map<std::string, int> starts;
};

DispatchSummary summarize_dispatch(const DispatchResult& d);

struct FlexScenarioRow {
  std::string key;          // "0%", "15%", ...
  double flex_pct = 0.0;
  double load_max_mw = 0.0;
  double firm_mw = 0.0;
  double lcoe = 0.0;
  std::string binding;
};

struct ServiceRevenue {
  std::string service;
  bool qualified = false;   // eligible_mw >= min_capacity_mw
  double eligible_mw = 0.0;
  double availability_revenue = 0.0;
  double activation_revenue = 0.0;
  double total_revenue = 0.0;
};

struct BridgeScenario {
  std::string strategy;     // "rental" | "purchase" | "hybrid"
  double npv = 0.0;
  double capex = 0.0;
  double monthly_cost = 0.0;
};

struct HeuristicResult {
  ProblemType problem_type = ProblemType::Greenfield;
  std::string problem_name;
  std::string scenario_id;

  bool feasible = false;
  double objective_value = 0.0;
  std::string objective_label;

  double lcoe = 0.0;
  double capex_total = 0.0;
  double opex_annual = 0.0;

  EquipmentConfig equipment_config{};
  DispatchSummary dispatch_summary{};
  std::vector<ConstraintEval> constraint_status;
  std::string binding_constraint;
  std::vector<std::string> violations;
  std::vector<std::string> warnings;

  double timeline_months = 0.0;
  double solve_time_seconds = 0.0;
  double unserved_energy_mwh = 0.0;
  double unserved_energy_pct = 0.0;
  double energy_delivered_mwh = 0.0;

  std::map<std::string, double> metrics;
  std::string selected_strategy;   // fill policy (Greenfield) or bridge strategy

  std::vector<AnnualStackRow> annual_stack;
  std::vector<FlexScenarioRow> flex_matrix;
  std::map<std::string, double> flex_by_workload;
  std::vector<ServiceRevenue> service_revenue;
  std::vector<BridgeScenario> bridge_scenarios;
};

} // namespace powerplan
