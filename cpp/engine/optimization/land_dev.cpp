/*
================================================================================
Fragment 8.7 - Optimization: Land Development Strategy
FILE: cpp/engine/optimization/land_dev.cpp

Objective:
  - Largest firm MW the site supports, given NOx, gas and land caps for the
    primary technology, and how much load that firm fleet can carry as
    workload flexibility rises.

Method:
  - Caps come from ConstraintChecker::calculate_constraint_limits(); the
    smallest one is max_firm_mw and names the binding limit.
  - The fleet is floor(max_firm / unit) primary units. Constraints are
    checked at the load that fleet serves with N-1 (when required).
  - Flex row: load_max = firm / (1 - flex * alignment_factor); LCOE uses
    load_max * 8760 * planning_capacity_factor as the energy denominator.
================================================================================
*/

#include <cmath>
#include <limits>
#include <sstream>
#include <string>

#include "engine/core/logging.hpp"
#include "engine/core/units.hpp"
#include "engine/optimization/strategies.hpp"

namespace powerplan::strategy {

namespace {

std::string flex_key(double flex) {
  return std::to_string(static_cast<long>(std::lround(flex * 100.0))) + "%";
}

} // namespace

HeuristicResult solve_land_dev(const LandDevProblem& p, const PlanningServices& s) {
  HeuristicResult r;
  r.objective_label = "max_firm_mw";

  const GlobalParameters& params = s.scenario.params;
  const ConstraintLimits limits = s.checker.calculate_constraint_limits(p.primary);
  const double unit_mw = s.scenario.catalog.at(p.primary).capacity_mw;

  r.binding_constraint = limits.binding;
  r.metrics["nox_cap_mw"] = limits.nox_cap_mw;
  r.metrics["gas_cap_mw"] = limits.gas_cap_mw;
  r.metrics["land_cap_mw"] = limits.land_cap_mw;
  r.metrics["max_firm_mw"] = limits.max_firm_mw;

  if (!(limits.max_firm_mw < std::numeric_limits<double>::max())) {
    r.feasible = false;
    r.violations.push_back("Site limits do not bound firm capacity for " +
                           std::string(to_string(p.primary)));
    return r;
  }

  const int n_units = static_cast<int>(std::floor(limits.max_firm_mw / unit_mw));
  r.objective_value = limits.max_firm_mw;

  if (n_units < 1) {
    r.feasible = false;
    r.violations.push_back("Site limits allow less than one " + std::string(to_string(p.primary)) +
                           " unit (" + limits.binding + " binding)");
    return r;
  }

  EquipmentConfig cfg;
  if (p.primary == Technology::Recip) cfg.set_recip_units(n_units, s.scenario.catalog);
  else cfg.set_turbine_units(n_units, s.scenario.catalog);

  const double firm_mw = cfg.firm_capacity_mw();
  const int served_units = s.scenario.site.n_minus_1_required ? n_units - 1 : n_units;
  const double served_mw = served_units * unit_mw;

  std::ostringstream oss;
  oss << "land_dev: caps nox=" << limits.nox_cap_mw << " gas=" << limits.gas_cap_mw
      << " land=" << limits.land_cap_mw << " -> " << n_units << " x " << unit_mw << "MW ("
      << limits.binding << " binding)";
  log(LogLevel::DEBUG, oss.str());

  const DispatchResult dispatch = s.dispatch.simulate_peak(cfg, served_mw);
  const ConstraintReport report =
      s.checker.check_constraints(cfg, dispatch, served_mw, s.scenario.trajectory.workload_mix);

  const double mwh_per_mw = units::hours_per_year * params.planning_capacity_factor;
  for (double flex : params.flex_scenarios) {
    FlexScenarioRow row;
    row.key = flex_key(flex);
    row.flex_pct = flex;
    row.firm_mw = limits.max_firm_mw;
    row.load_max_mw = limits.max_firm_mw / (1.0 - flex * params.alignment_factor);
    row.lcoe = s.economics.calculate_lcoe(cfg, dispatch, row.load_max_mw * mwh_per_mw).lcoe;
    row.binding = limits.binding;
    r.flex_matrix.push_back(row);
  }

  const LcoeResult base = s.economics.calculate_lcoe(cfg, dispatch, limits.max_firm_mw * mwh_per_mw);
  r.lcoe = base.lcoe;
  r.capex_total = base.capex;
  r.opex_annual = base.opex.total();
  r.equipment_config = cfg;
  r.timeline_months = s.checker.time_to_power_months(cfg);

  apply_dispatch(r, dispatch);
  apply_constraints(r, report);
  r.binding_constraint = limits.binding;
  add_warnings(r, base.warnings);
  r.feasible = r.violations.empty();

  r.metrics["installed_firm_mw"] = firm_mw;
  r.metrics["n1_served_mw"] = served_mw;
  r.metrics["units"] = n_units;
  return r;
}

} // namespace powerplan::strategy
