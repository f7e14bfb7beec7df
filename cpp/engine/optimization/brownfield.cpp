/*
================================================================================
Fragment 8.6 - Optimization: Brownfield Strategy
FILE: cpp/engine/optimization/brownfield.cpp

Objective:
  - Maximize incremental MW beyond an existing fleet while the energy-weighted
    blend of the existing LCOE and the expansion LCOE stays at or below the
    ceiling.

Method:
  - Bisection on expansion MW in [0, 2 * max(peak, existing MW)] to a 1 MW
    tolerance. Expansion is sized without N-1 (the existing fleet already
    carries the reserve), and each MW is credited
    8760 * planning_capacity_factor MWh.
  - Constraints are checked on existing + expansion at existing + best MW.
================================================================================
*/

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

#include "engine/core/logging.hpp"
#include "engine/core/units.hpp"
#include "engine/optimization/strategies.hpp"

namespace powerplan::strategy {

namespace {

constexpr double kToleranceMw = 1.0;

struct Expansion {
  double mw = 0.0;
  EquipmentConfig equipment{};
  LcoeResult lcoe{};
  double blended_lcoe = 0.0;
};

} // namespace

HeuristicResult solve_brownfield(const BrownfieldProblem& p, const PlanningServices& s) {
  HeuristicResult r;
  r.objective_label = "incremental_mw";

  const GlobalParameters& params = s.scenario.params;
  const double mwh_per_mw = units::hours_per_year * params.planning_capacity_factor;
  const double existing_mw = p.existing.firm_capacity_mw();
  const double existing_energy = existing_mw * mwh_per_mw;

  r.metrics["existing_mw"] = existing_mw;
  r.metrics["existing_lcoe"] = p.existing_lcoe;
  r.metrics["lcoe_threshold"] = p.lcoe_threshold;

  if (p.existing_lcoe >= p.lcoe_threshold) {
    r.feasible = false;
    r.objective_value = 0.0;
    r.lcoe = p.existing_lcoe;
    r.equipment_config = p.existing;
    r.violations.push_back("LCOE ceiling already reached");
    r.metrics["max_expansion_mw"] = 0.0;
    r.metrics["blended_lcoe"] = p.existing_lcoe;
    return r;
  }

  auto evaluate = [&](double mw) {
    Expansion e;
    e.mw = mw;
    e.equipment = s.sizer.size_equipment_to_load(mw, false);
    const double new_energy = mw * mwh_per_mw;
    e.lcoe = s.economics.calculate_lcoe(e.equipment, mw, new_energy);
    const double total = existing_energy + new_energy;
    e.blended_lcoe = new_energy > 0.0
                         ? (p.existing_lcoe * existing_energy + e.lcoe.lcoe * new_energy) / total
                         : p.existing_lcoe;
    return e;
  };
  auto within = [&](const Expansion& e) {
    return std::isfinite(e.blended_lcoe) && e.blended_lcoe <= p.lcoe_threshold;
  };

  double lo = 0.0;
  double hi = 2.0 * std::max(s.scenario.trajectory.max_peak_mw(), existing_mw);
  Expansion best = evaluate(0.0);

  const Expansion top = evaluate(hi);
  if (within(top)) {
    best = top;
  } else {
    while (hi - lo > kToleranceMw) {
      const double mid = 0.5 * (lo + hi);
      Expansion e = evaluate(mid);
      if (within(e)) {
        lo = mid;
        best = e;
      } else {
        hi = mid;
      }
    }
  }

  std::ostringstream oss;
  oss << "brownfield: existing=" << existing_mw << "MW expansion=" << best.mw
      << "MW blended_lcoe=" << best.blended_lcoe;
  log(LogLevel::DEBUG, oss.str());

  const EquipmentConfig combined = p.existing.plus(best.equipment);
  const double served_mw = existing_mw + best.mw;
  const DispatchResult dispatch = s.dispatch.simulate_peak(combined, served_mw);
  const ConstraintReport report =
      s.checker.check_constraints(combined, dispatch, served_mw, s.scenario.trajectory.workload_mix);

  r.objective_value = best.mw;
  r.lcoe = best.blended_lcoe;
  r.capex_total = best.lcoe.capex;
  r.opex_annual = best.lcoe.opex.total();
  r.equipment_config = combined;
  r.timeline_months = best.equipment.empty() ? 0.0 : s.checker.time_to_power_months(best.equipment);

  apply_dispatch(r, dispatch);
  apply_constraints(r, report);
  if (best.mw > 0.0) add_warnings(r, best.lcoe.warnings);
  if (best.mw < kToleranceMw) r.violations.push_back("No expansion satisfies LCOE ceiling");
  r.feasible = r.violations.empty();

  r.metrics["max_expansion_mw"] = best.mw;
  r.metrics["blended_lcoe"] = best.blended_lcoe;
  r.metrics["expansion_lcoe"] = best.mw > 0.0 ? best.lcoe.lcoe : 0.0;
  r.metrics["total_mw"] = served_mw;
  return r;
}

} // namespace powerplan::strategy
