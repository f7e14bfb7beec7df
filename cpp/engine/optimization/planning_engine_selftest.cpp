/*
  Fragment 8.10 - Planning Engine Selftest

  Framework-free checks for the five planning strategies behind optimize():
    1) Factory: unknown problem types and bad inputs are raised, not returned.
    2) Greenfield: annual stack attached, objective is the blended LCOE;
       the fill policy is part of the scenario id.
    3) Brownfield: an existing LCOE at or above the ceiling is infeasible.
    4) LandDev: firm capacity follows the tightest of NOx / gas / land.
    5) GridServices: flexible and DR-eligible MW, per-product revenue.
    6) BridgePower: zero bridge months, the crossover sentinel, min-NPV choice;
       no load gives +inf LCOE with a warning.

  Run: ./planning_engine_selftest (non-zero exit on failure)
*/

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/scenario.hpp"
#include "engine/core/units.hpp"
#include "engine/optimization/planning_engine.hpp"
#include "engine/optimization/problems.hpp"

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

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

double metric(const HeuristicResult& r, const std::string& key) {
  auto it = r.metrics.find(key);
  if (it == r.metrics.end()) {
    fail("missing metric '" + key + "'");
    return std::nan("");
  }
  return it->second;
}

bool has_warning(const HeuristicResult& r, const std::string& w) {
  return std::find(r.warnings.begin(), r.warnings.end(), w) != r.warnings.end();
}

Scenario roomy_site(double peak_mw) {
  Scenario s = Scenario::defaults(peak_mw);
  s.site.nox_tpy = 1000.0;
  s.site.gas_supply_mcf_day = 1.0e6;
  s.site.land_area_acres = 5000.0;
  return s;
}

void test_factory() {
  bool threw_low = false, threw_high = false;
  try {
    (void)make_problem(0);
  } catch (const ConfigurationError&) {
    threw_low = true;
  }
  try {
    (void)make_problem(6);
  } catch (const ConfigurationError&) {
    threw_high = true;
  }
  expect_true(threw_low && threw_high, "Problem types outside 1..5 are configuration errors");
  expect_true(problem_type_of(make_problem(4)) == ProblemType::GridServices, "Type 4 resolves to GridServices");

  const PlanningEngine engine(Scenario::defaults(100.0));
  bool threw_engine = false;
  try {
    (void)engine.optimize(9);
  } catch (const ConfigurationError&) {
    threw_engine = true;
  }
  expect_true(threw_engine, "Engine raises on an unknown problem type");

  ProblemInputs bad;
  bad.land_dev.primary = Technology::Bess;
  bool threw_inputs = false;
  try {
    (void)engine.optimize(3, bad);
  } catch (const ValidationError&) {
    threw_inputs = true;
  }
  expect_true(threw_inputs, "Non-thermal LandDev primary is rejected");

  Scenario no_turbine = Scenario::defaults(100.0);
  EquipmentCatalog trimmed;
  for (const auto& [tech, spec] : no_turbine.catalog.entries()) {
    if (tech != Technology::Turbine) trimmed.set(spec);
  }
  no_turbine.catalog = trimmed;
  const PlanningEngine partial(no_turbine);
  ProblemInputs turbine_first;
  turbine_first.land_dev.primary = Technology::Turbine;
  bool threw_catalog = false;
  try {
    (void)partial.optimize(3, turbine_first);
  } catch (const ConfigurationError&) {
    threw_catalog = true;
  }
  expect_true(threw_catalog, "Missing catalog entry is a configuration error");
}

void test_greenfield() {
  Scenario s = roomy_site(80.0);
  s.trajectory.peak_mw_by_year[2028] = 120.0;
  const PlanningEngine engine(s);
  const HeuristicResult r = engine.optimize(1);

  expect_true(r.problem_type == ProblemType::Greenfield, "Greenfield problem type recorded");
  expect_eq_str(r.objective_label, "blended_lcoe_usd_mwh", "Greenfield objective label");
  expect_true(r.annual_stack.size() == 2, "Annual stack has one row per year");
  expect_true(std::isfinite(r.objective_value) && r.objective_value == r.lcoe, "Objective is the blended LCOE");
  expect_true(!r.selected_strategy.empty(), "Selected fill policy reported");
  expect_true(metric(r, "candidates_evaluated") >= 1.0, "At least one candidate evaluated");
  expect_true(r.feasible && r.violations.empty(), "Roomy site is feasible");
  expect_true(r.equipment_config.firm_capacity_mw() >= 120.0, "Final fleet covers the final peak");
  expect_true(!r.scenario_id.empty(), "Scenario id set");

  const HeuristicResult again = engine.optimize(1);
  expect_true(again.objective_value == r.objective_value && again.equipment_config == r.equipment_config &&
                  again.scenario_id == r.scenario_id,
              "Greenfield is deterministic");

  const PlanningEngine turbine_engine(s, FillPolicy::turbine_first());
  expect_true(turbine_engine.optimize(1).scenario_id != r.scenario_id, "Fill policy is part of the scenario id");
  const PlanningEngine same_policy(s, FillPolicy::recip_first());
  expect_true(same_policy.optimize(1).scenario_id == r.scenario_id, "Same scenario and policy -> same id");
  FillPolicy capped = FillPolicy::recip_then_grid(60.0, 20.0);
  const std::string capped_id = PlanningEngine(s, capped).optimize(1).scenario_id;
  capped.grid_import_limit_mw = 30.0;
  expect_true(PlanningEngine(s, capped).optimize(1).scenario_id != capped_id, "Policy limits change the scenario id");

  const PlanningEngine empty(Scenario::defaults(0.0));
  const HeuristicResult z = empty.optimize(1);
  expect_true(!z.feasible && !z.violations.empty(), "No positive load -> infeasible with a violation");
  expect_true(std::isinf(z.objective_value), "No positive load -> +inf objective");
}

void test_brownfield() {
  const PlanningEngine engine(Scenario::defaults(200.0));
  ProblemInputs in;
  in.brownfield.existing.set_recip_units(6, engine.scenario().catalog);
  in.brownfield.existing_lcoe = 90.0;
  in.brownfield.lcoe_threshold = 80.0;

  const HeuristicResult r = engine.optimize(2, in);
  expect_true(!r.feasible, "Existing LCOE above ceiling -> infeasible");
  expect_near(r.objective_value, 0.0, 1e-12, "Existing LCOE above ceiling -> zero expansion");
  expect_true(r.violations.size() == 1 && r.violations.front() == "LCOE ceiling already reached",
              "Single ceiling violation reported");

  in.brownfield.existing_lcoe = 80.0;
  in.brownfield.lcoe_threshold = 100.0;
  const HeuristicResult ok = engine.optimize(2, in);
  const double expansion = ok.objective_value;
  expect_true(expansion >= 0.0 && expansion <= 400.0, "Expansion within the search bracket");
  if (expansion >= 1.0) {
    expect_true(metric(ok, "blended_lcoe") <= 100.0 + 1e-9, "Blended LCOE respects the ceiling");
  }
  expect_near(metric(ok, "existing_mw"), 6 * 18.3, 1e-9, "Existing firm MW from the existing fleet");
  expect_true(ok.equipment_config.recip_units >= 6, "Result fleet includes the existing units");
  expect_true(ok.feasible == ok.violations.empty(), "Feasible iff no violations");
}

void test_land_dev() {
  Scenario s = Scenario::defaults(100.0);
  s.params.planning_capacity_factor = 1.0;
  s.site.nox_tpy = 175.2;
  s.site.gas_supply_mcf_day = 120.0 * 24.0 * s.catalog.at(Technology::Recip).gas_mcf_per_mwh();
  s.site.land_area_acres = 75.0;
  const PlanningEngine engine(s);
  const HeuristicResult r = engine.optimize(3);

  expect_near(r.objective_value, 80.0, 1e-9, "Max firm MW is the NOx cap");
  expect_eq_str(r.binding_constraint, "nox", "NOx is binding");
  expect_near(metric(r, "gas_cap_mw"), 120.0, 1e-9, "Gas cap reported");
  expect_near(metric(r, "land_cap_mw"), 150.0, 1e-9, "Land cap reported");
  expect_near(metric(r, "units"), 4.0, 1e-12, "Four 18.3 MW units fit under 80 MW");
  expect_true(r.equipment_config.recip_units == 4, "Fleet is the fitted unit count");
  expect_true(r.flex_matrix.size() == s.params.flex_scenarios.size(), "One flex row per scenario");
  if (r.flex_matrix.size() == 4) {
    expect_eq_str(r.flex_matrix[0].key, "0%", "First flex key");
    expect_eq_str(r.flex_matrix[3].key, "50%", "Last flex key");
    expect_near(r.flex_matrix[0].load_max_mw, 80.0, 1e-9, "No flexibility -> load equals firm MW");
    expect_near(r.flex_matrix[3].load_max_mw, 80.0 / (1.0 - 0.5 * 0.7), 1e-9, "50% flex with 0.7 alignment");
    expect_true(r.flex_matrix[3].lcoe < r.flex_matrix[0].lcoe, "More servable load lowers LCOE");
  }
}

void test_grid_services() {
  Scenario s = Scenario::defaults(100.0);
  s.trajectory.workload_mix = {{"batch_inference", 1.0}};
  const PlanningEngine engine(s);
  const HeuristicResult r = engine.optimize(4);

  expect_eq_str(r.objective_label, "annual_dr_revenue_usd", "GridServices objective label");
  expect_near(metric(r, "total_flex_mw"), 90.0, 1e-9, "Flexible MW = 100 x 0.90");
  expect_near(metric(r, "eligible_mw"), 72.0, 1e-9, "Eligible MW = 90 x 0.8");
  expect_near(metric(r, "base_load_mw"), 10.0, 1e-9, "Base load is the inflexible remainder");
  expect_near(r.flex_by_workload.at("batch_inference"), 90.0, 1e-9, "Flex by workload");
  for (const ServiceRevenue& rev : r.service_revenue) {
    expect_near(rev.eligible_mw, 72.0, 1e-9, "Every service sees 72 eligible MW: " + rev.service);
  }
  // econ_dr 360k + ers_10 4.8384M + ers_30 3.2832M + capacity 4.32M
  expect_near(r.objective_value, 12801600.0, 1e-3, "Annual revenue across default services");

  ProblemInputs in;
  in.grid_services.services = {DrService{"big_only", 10.0, 0.0, 0.0, 0.0, 100.0}};
  const HeuristicResult none = engine.optimize(4, in);
  expect_true(none.service_revenue.size() == 1 && !none.service_revenue[0].qualified,
              "Service above eligible MW does not qualify");
  expect_near(none.objective_value, 0.0, 1e-12, "Unqualified service earns nothing");

  Scenario unknown = Scenario::defaults(100.0);
  unknown.trajectory.workload_mix = {{"crypto_mining", 1.0}};
  const HeuristicResult u = PlanningEngine(unknown).optimize(4);
  expect_near(metric(u, "total_flex_mw"), 0.0, 1e-12, "Unknown workload has no flexibility");
  expect_true(has_warning(u, "Unknown workload 'crypto_mining' contributes no flexibility"),
              "Unknown workload warns");
}

void test_bridge_power() {
  const PlanningEngine engine(Scenario::defaults(100.0));

  ProblemInputs now;
  now.bridge_power.grid_available_month = 0;
  const HeuristicResult z = engine.optimize(5, now);
  expect_near(metric(z, "rental_npv"), 0.0, 1e-12, "No bridge months -> zero rental NPV");
  expect_eq_str(z.selected_strategy, "rental", "No bridge months -> rental is cheapest");
  expect_near(z.objective_value, 0.0, 1e-12, "Objective is the selected NPV");
  expect_true(z.bridge_scenarios.size() == 3, "Three bridge strategies evaluated");
  expect_true(z.metrics.count("purchase_vs_rental_irr_annual") == 0, "No IRR without bridge months");
  expect_true(has_warning(z, "Transition timing is indicative only"), "Timing caveat attached");

  ProblemInputs later;
  later.bridge_power.grid_available_month = 36;
  const HeuristicResult r = engine.optimize(5, later);
  double min_npv = r.bridge_scenarios.front().npv;
  for (const BridgeScenario& b : r.bridge_scenarios) min_npv = std::min(min_npv, b.npv);
  expect_near(r.objective_value, min_npv, 1e-6, "Objective is the minimum NPV");
  expect_near(metric(r, "rental_monthly_cost"), 100.0 * 1000.0 * 50.0, 1e-6, "Monthly rental = MW x 1000 x $/kW-month");
  const double saving = metric(r, "rental_monthly_cost") - metric(r, "purchase_opex_monthly");
  const double expected_crossover = saving > 0.0
                                        ? (metric(r, "purchase_capex") - metric(r, "residual_value")) / saving
                                        : units::crossover_never_months;
  expect_near(metric(r, "crossover_month"), expected_crossover, 1e-6, "Crossover month from cash-flow rates");

  ProblemInputs free_rent;
  free_rent.bridge_power.grid_available_month = 12;
  free_rent.bridge_power.rental_cost_kw_month = 0.0;
  const HeuristicResult f = engine.optimize(5, free_rent);
  expect_near(metric(f, "crossover_month"), units::crossover_never_months, 1e-12, "Free rental never crosses over");
  expect_eq_str(f.selected_strategy, "rental", "Free rental wins");

  const HeuristicResult none = PlanningEngine(Scenario::defaults(0.0)).optimize(5, later);
  expect_true(!none.feasible && !none.violations.empty(), "Bridge with no load is infeasible");
  expect_true(std::isinf(none.lcoe) && none.lcoe > 0.0, "Bridge with no load -> +inf LCOE");
  expect_true(has_warning(none, "No load to serve; LCOE undefined"), "Bridge with no load warns LCOE undefined");
}

}  // namespace
}  // namespace powerplan

int main() {
  using namespace powerplan;
  set_log_level(LogLevel::ERROR);

  test_factory();
  test_greenfield();
  test_brownfield();
  test_land_dev();
  test_grid_services();
  test_bridge_power();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
