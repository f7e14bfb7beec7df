/*
================================================================================
Fragment 8.5 - Optimization: Greenfield Strategy
FILE: cpp/engine/optimization/greenfield.cpp

Objective:
  - Minimize blended LCOE over the trajectory subject to all site
    constraints passing.

Method:
  - Build a small, named set of fill policies (recip-first, turbine-first,
    and recip-then-grid when a grid connection is configured), run the
    annual stack for each, check the final-year fleet, and keep the
    cheapest feasible candidate. When none passes, keep the cheapest one and
    report its violations.
  - Solar is offered only when the land allocation leaves at least the
    solar threshold for equipment.
================================================================================
*/

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/optimization/strategies.hpp"

namespace powerplan::strategy {

namespace {

struct Candidate {
  FillPolicy policy;
  AnnualStackResult stack;
  ConstraintReport report;
};

std::vector<FillPolicy> candidate_policies(const PlanningServices& s, double max_peak_mw) {
  const Scenario& sc = s.scenario;
  std::vector<FillPolicy> out;

  FillPolicy base = s.sizer.policy();
  out.push_back(base);
  if (base.name != "recip_first") out.push_back(FillPolicy::recip_first());
  if (base.name != "turbine_first" && sc.catalog.has(Technology::Turbine)) {
    out.push_back(FillPolicy::turbine_first());
  }
  if (sc.site.grid_capacity_mw > 0.0 && sc.site.grid_available_year) {
    const ConstraintLimits lim = s.checker.calculate_constraint_limits(Technology::Recip);
    out.push_back(FillPolicy::recip_then_grid(0.9 * lim.nox_cap_mw, sc.site.grid_capacity_mw));
  }

  const LandAllocation land = s.checker.allocate_land(max_peak_mw);
  double max_solar = 0.0;
  if (land.solar_allowed && sc.catalog.has(Technology::Solar)) {
    const double acres_per_mw = sc.catalog.at(Technology::Solar).land_acres_per_mw;
    max_solar = acres_per_mw > 0.0 ? land.equipment_acres / acres_per_mw : 0.0;
  }
  for (FillPolicy& p : out) p.max_solar_mw = max_solar;
  return out;
}

bool better(const Candidate& a, const Candidate& b) {
  const bool fa = a.report.feasible();
  const bool fb = b.report.feasible();
  if (fa != fb) return fa;
  return a.stack.blended_lcoe < b.stack.blended_lcoe;
}

} // namespace

HeuristicResult solve_greenfield(const GreenfieldProblem&, const PlanningServices& s) {
  HeuristicResult r;
  r.objective_label = "blended_lcoe_usd_mwh";

  const LoadTrajectory& traj = s.scenario.trajectory;
  const double max_peak = traj.max_peak_mw();
  if (!(max_peak > 0.0)) {
    r.feasible = false;
    r.objective_value = std::numeric_limits<double>::infinity();
    r.lcoe = r.objective_value;
    r.violations.push_back("Load trajectory has no positive peak load");
    r.warnings.push_back("No load to serve; LCOE undefined");
    return r;
  }

  std::vector<Candidate> candidates;
  for (const FillPolicy& policy : candidate_policies(s, max_peak)) {
    Candidate c;
    c.policy = policy;
    c.stack = s.stack.optimize_annual_energy_stack(traj, policy);
    c.report = s.checker.check_constraints(c.stack.final_equipment, c.stack.final_dispatch,
                                           c.stack.final_peak_mw, traj.workload_mix);
    log(LogLevel::DEBUG, "greenfield candidate '" + policy.name + "': blended_lcoe=" +
                             std::to_string(c.stack.blended_lcoe) +
                             " feasible=" + (c.report.feasible() ? "true" : "false"));
    candidates.push_back(std::move(c));
  }

  const Candidate* best = &candidates.front();
  int n_feasible = 0;
  for (const Candidate& c : candidates) {
    if (c.report.feasible()) ++n_feasible;
    if (better(c, *best)) best = &c;
  }

  r.feasible = best->report.feasible();
  r.selected_strategy = best->policy.name;
  r.objective_value = best->stack.blended_lcoe;
  r.lcoe = best->stack.blended_lcoe;
  r.capex_total = best->stack.total_capex;
  r.opex_annual = best->stack.avg_annual_opex;
  r.equipment_config = best->stack.final_equipment;
  r.timeline_months = s.checker.time_to_power_months(best->stack.final_equipment);
  r.annual_stack = best->stack.rows;

  apply_dispatch(r, best->stack.final_dispatch);
  apply_constraints(r, best->report);
  add_warnings(r, best->stack.warnings);
  if (n_feasible == 0) {
    add_warnings(r, {"No candidate fill policy satisfies all constraints; reporting lowest-LCOE candidate"});
  }

  r.metrics["peak_mw"] = max_peak;
  r.metrics["npv_total_cost"] = best->stack.npv_total_cost;
  r.metrics["avg_annual_fuel_cost"] = best->stack.avg_annual_fuel;
  r.metrics["active_years"] = best->stack.active_years;
  r.metrics["candidates_evaluated"] = static_cast<double>(candidates.size());
  r.metrics["candidates_feasible"] = n_feasible;
  r.metrics["firm_capacity_mw"] = best->stack.final_equipment.firm_capacity_mw();
  r.metrics["voll_cost"] = best->stack.total_unserved_mwh * s.scenario.params.voll_per_mwh;
  return r;
}

} // namespace powerplan::strategy
