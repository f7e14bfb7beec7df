/*
  Fragment 6.2 - Constraint Checker Selftest

  Framework-free checks for the site constraint layer:
    1) Per-constraint evaluation rules (binding band, zero limits, Min sense).
    2) Overall binding selection (largest overshoot, else closest to 1).
    3) Firm-capacity limits from NOx / gas / land and tie order.
    4) A full check_constraints() run that violates the NOx cap.
    5) Land allocation and the solar threshold edge.
    6) Parallel-redundancy availability and NOx / gas values from dispatch.
    7) N-1 margin counts BESS power at the configured capacity credit.

  Run: ./constraint_checker_selftest (non-zero exit on failure)
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/constraints/constraint_checker.hpp"
#include "engine/core/load_model.hpp"
#include "engine/dispatch/dispatch_simulator.hpp"

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

void test_evaluate_rules() {
  std::vector<std::string> warnings;

  const ConstraintEval near_cap = evaluate_constraint("nox", "tpy", ConstraintSense::Max, 96.0, 100.0, &warnings);
  expect_true(near_cap.binding && !near_cap.violated, "96% of a Max limit binds without violating");

  const ConstraintEval loose = evaluate_constraint("gas", "mcf_day", ConstraintSense::Max, 50.0, 100.0, &warnings);
  expect_true(!loose.binding && !loose.violated, "50% of a Max limit is slack");

  const ConstraintEval zero_used = evaluate_constraint("land", "acres", ConstraintSense::Max, 0.0, 0.0, &warnings);
  expect_near(zero_used.utilization, 0.0, 1e-12, "Zero limit with zero use -> utilization 0");
  expect_true(!zero_used.violated, "Zero limit with zero use is not violated");
  expect_true(warnings.empty(), "No warning for an unused zero limit");

  const ConstraintEval zero_limit = evaluate_constraint("land", "acres", ConstraintSense::Max, 5.0, 0.0, &warnings);
  expect_near(zero_limit.utilization, 999.0, 1e-12, "Zero limit with use -> degenerate utilization");
  expect_true(zero_limit.violated, "Zero limit with use is violated");
  expect_true(warnings.size() == 1, "Zero limit with use warns once");

  const ConstraintEval short_n1 = evaluate_constraint("n_minus_1", "mw", ConstraintSense::Min, 90.0, 100.0, &warnings);
  expect_true(short_n1.violated && short_n1.binding, "Min constraint below its limit is violated");

  const ConstraintEval tight_n1 = evaluate_constraint("n_minus_1", "mw", ConstraintSense::Min, 104.0, 100.0, &warnings);
  expect_true(tight_n1.binding && !tight_n1.violated, "Min constraint within 5% binds");

  const ConstraintEval no_req = evaluate_constraint("ramp", "mw_min", ConstraintSense::Min, 0.0, 0.0, &warnings);
  expect_true(!no_req.violated && !no_req.binding, "Min constraint with zero limit is not evaluated");
}

void test_binding_selection() {
  std::vector<ConstraintEval> evals;
  evals.push_back(evaluate_constraint("nox", "tpy", ConstraintSense::Max, 110.0, 100.0, nullptr));
  evals.push_back(evaluate_constraint("gas", "mcf_day", ConstraintSense::Max, 150.0, 100.0, nullptr));
  evals.push_back(evaluate_constraint("land", "acres", ConstraintSense::Max, 99.0, 100.0, nullptr));
  expect_eq_str(select_binding_constraint(evals), "gas", "Largest overshoot wins among violations");

  std::vector<ConstraintEval> slack;
  slack.push_back(evaluate_constraint("nox", "tpy", ConstraintSense::Max, 50.0, 100.0, nullptr));
  slack.push_back(evaluate_constraint("land", "acres", ConstraintSense::Max, 97.0, 100.0, nullptr));
  expect_eq_str(select_binding_constraint(slack), "land", "Utilization closest to 1 wins with no violation");

  expect_eq_str(select_binding_constraint({}), "", "Nothing evaluated -> empty binding name");
}

void test_limits() {
  const EquipmentCatalog catalog = EquipmentCatalog::defaults();
  GlobalParameters params{};
  params.planning_capacity_factor = 1.0;
  SiteConstraints site{};
  site.nox_tpy = 175.2;
  site.gas_supply_mcf_day = 120.0 * 24.0 * catalog.at(Technology::Recip).gas_mcf_per_mwh();
  site.land_area_acres = 75.0;
  const WorkloadTable workloads = default_workload_table();
  const DispatchSimulator sim(catalog, params);
  const ConstraintChecker checker(catalog, params, site, workloads, sim);

  const ConstraintLimits l = checker.calculate_constraint_limits(Technology::Recip);
  expect_near(l.nox_cap_mw, 80.0, 1e-9, "NOx cap in MW");
  expect_near(l.gas_cap_mw, 120.0, 1e-9, "Gas cap in MW");
  expect_near(l.land_cap_mw, 150.0, 1e-9, "Land cap in MW");
  expect_near(l.max_firm_mw, 80.0, 1e-9, "Max firm is the smallest cap");
  expect_eq_str(l.binding, "nox", "NOx binds");

  expect_eq_str(ConstraintLimits::from_caps(100.0, 100.0, 200.0).binding, "nox", "NOx wins a NOx/gas tie");
  expect_eq_str(ConstraintLimits::from_caps(200.0, 100.0, 100.0).binding, "gas", "Gas wins a gas/land tie");
  expect_eq_str(ConstraintLimits::from_caps(200.0, 150.0, 100.0).binding, "land", "Land binds when smallest");
}

void test_check_nox_violation() {
  const EquipmentCatalog catalog = EquipmentCatalog::defaults();
  const GlobalParameters params{};
  const SiteConstraints site{};  // 100 tpy NOx
  const WorkloadTable workloads = default_workload_table();
  const DispatchSimulator sim(catalog, params);
  const ConstraintChecker checker(catalog, params, site, workloads, sim);

  EquipmentConfig cfg;
  cfg.set_recip_units(12, catalog);
  const ConstraintReport rep = checker.check_constraints(cfg, 200.0, {{"pre_training", 1.0}});

  expect_true(!rep.feasible(), "200 MW of recips exceeds a 100 tpy NOx cap");
  const ConstraintEval* nox = rep.find("nox");
  expect_true(nox != nullptr && nox->violated, "NOx evaluation is violated");
  expect_eq_str(rep.analysis.binding_constraint, "nox", "NOx is the binding constraint");
  expect_true(!rep.violations.empty() && rep.violations.front().rfind("nox:", 0) == 0,
              "Violation message names the NOx constraint");
  const ConstraintEval* n1 = rep.find("n_minus_1");
  expect_true(n1 != nullptr && !n1->violated, "12 recips survive N-1 at 200 MW");
  expect_true(rep.find("ramp") == nullptr, "Pre-training needs no ramp, so ramp is not evaluated");
  expect_near(checker.time_to_power_months(cfg), 24.0 + 3.0, 1e-12, "Time to power = longest lead + offset");
}

void test_land_allocation() {
  const EquipmentCatalog catalog = EquipmentCatalog::defaults();
  const GlobalParameters params{};
  SiteConstraints site{};
  site.land_area_acres = 1000.0;
  const WorkloadTable workloads = default_workload_table();
  const DispatchSimulator sim(catalog, params);
  const ConstraintChecker checker(catalog, params, site, workloads, sim);

  const LandAllocation crowded = checker.allocate_land(300.0);
  expect_near(crowded.datacenter_acres, 100.0, 1e-9, "Datacenter footprint from MW per acre");
  expect_near(crowded.equipment_acres, 790.0, 1e-9, "Equipment land is the remainder");
  expect_true(!crowded.solar_allowed, "790 acres is below the solar threshold");

  const LandAllocation edge = checker.allocate_land(270.0);
  expect_near(edge.equipment_acres, 800.0, 1e-9, "Equipment land at the threshold");
  expect_true(edge.solar_allowed, "Solar allowed exactly at the threshold");

  expect_near(checker.aggregate_availability(EquipmentConfig{}), 0.0, 1e-12, "No units -> zero availability");
}

void test_availability_and_emission_values() {
  const EquipmentCatalog catalog = EquipmentCatalog::defaults();
  const GlobalParameters params{};
  const SiteConstraints site{};
  const WorkloadTable workloads = default_workload_table();
  const DispatchSimulator sim(catalog, params);
  const ConstraintChecker checker(catalog, params, site, workloads, sim);

  EquipmentConfig three;
  three.set_recip_units(3, catalog);
  three.grid_import_mw = 10.0;
  expect_near(checker.aggregate_availability(three), 1.0 - std::pow(0.025, 3) * 0.0003, 1e-15,
              "3 recips + grid -> 1 - 0.025^3 * 0.0003");

  EquipmentConfig mixed;
  mixed.set_recip_units(4, catalog);
  mixed.set_turbine_units(1, catalog);
  mixed.bess_power_mw = 60.0;  // two 50 MW blocks
  mixed.bess_energy_mwh = 240.0;
  mixed.solar_mw_dc = 20.0;    // not firm
  const double expected_avail = 1.0 - std::pow(0.025, 4) * 0.05 * std::pow(0.005, 2);
  expect_near(checker.aggregate_availability(mixed), expected_avail, 1e-15,
              "Recips, turbine and BESS blocks fold in; solar excluded");

  const DispatchResult d = sim.simulate_peak(mixed, 100.0);
  const ConstraintReport rep = checker.check_constraints(mixed, d, 100.0, {{"pre_training", 1.0}});

  const double recip_mwh = d.stats(Technology::Recip).energy_mwh;
  const double turbine_mwh = d.stats(Technology::Turbine).energy_mwh;
  expect_true(recip_mwh > 0.0, "Recips carry energy at 100 MW");

  const ConstraintEval* nox = rep.find("nox");
  const double nox_tpy = (recip_mwh * catalog.at(Technology::Recip).nox_lb_mwh +
                          turbine_mwh * catalog.at(Technology::Turbine).nox_lb_mwh) / 2000.0;
  expect_true(nox != nullptr, "NOx evaluated");
  if (nox) expect_near(nox->value, nox_tpy, 1e-9 * (1.0 + nox_tpy), "NOx tpy = sum(MWh * lb/MWh) / 2000");

  const ConstraintEval* gas = rep.find("gas");
  const double gas_mcf_day = (recip_mwh * catalog.at(Technology::Recip).gas_mcf_per_mwh() +
                              turbine_mwh * catalog.at(Technology::Turbine).gas_mcf_per_mwh()) / 365.0;
  expect_true(gas != nullptr, "Gas evaluated");
  if (gas) expect_near(gas->value, gas_mcf_day, 1e-9 * (1.0 + gas_mcf_day), "Gas MCF/day = sum(MWh * MCF/MWh) / 365");

  const ConstraintEval* avail = rep.find("availability");
  expect_true(avail != nullptr, "Availability evaluated");
  if (avail) expect_near(avail->value, expected_avail, 1e-15, "Availability constraint uses the redundancy formula");
}

void test_n_minus_1_bess_credit() {
  const EquipmentCatalog catalog = EquipmentCatalog::defaults();
  const SiteConstraints site{};
  const WorkloadTable workloads = default_workload_table();

  EquipmentConfig cfg;
  cfg.set_recip_units(6, catalog);
  cfg.bess_power_mw = 40.0;
  cfg.bess_energy_mwh = 160.0;
  const double bare_margin = cfg.firm_capacity_mw() - cfg.largest_unit_mw(catalog);

  const GlobalParameters params{};
  const DispatchSimulator sim(catalog, params);
  const ConstraintChecker checker(catalog, params, site, workloads, sim);
  const ConstraintReport rep = checker.check_constraints(cfg, 100.0, {{"pre_training", 1.0}});
  const ConstraintEval* n1 = rep.find("n_minus_1");
  expect_true(n1 != nullptr, "N-1 evaluated");
  if (n1) expect_near(n1->value, bare_margin + 40.0 * 0.25, 1e-9, "40 MW BESS adds 10 MW at the 0.25 credit");

  GlobalParameters no_credit{};
  no_credit.bess_capacity_credit = 0.0;
  const DispatchSimulator sim0(catalog, no_credit);
  const ConstraintChecker checker0(catalog, no_credit, site, workloads, sim0);
  const ConstraintReport rep0 = checker0.check_constraints(cfg, 100.0, {{"pre_training", 1.0}});
  const ConstraintEval* n1_0 = rep0.find("n_minus_1");
  expect_true(n1_0 != nullptr, "N-1 evaluated without credit");
  if (n1_0) expect_near(n1_0->value, bare_margin, 1e-9, "Zero credit leaves only thermal and grid");
}

}  // namespace
}  // namespace powerplan

int main() {
  using namespace powerplan;

  test_evaluate_rules();
  test_binding_selection();
  test_limits();
  test_check_nox_violation();
  test_land_allocation();
  test_availability_and_emission_values();
  test_n_minus_1_bess_credit();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
