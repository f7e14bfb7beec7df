/*
================================================================================
Fragment 8.9 - Optimization: Bridge Power Strategy
FILE: cpp/engine/optimization/bridge_power.cpp

Objective:
  - Cheapest way (NPV) to carry the load until the grid arrives at month M:
    rent everything, buy a permanent fleet, or buy a share and rent the rest.

Method (monthly rate i = discount_rate / 12, months m = 0..M-1):
  - rental   = sum peak * 1000 * rent_kw_month / (1+i)^m
  - purchase = CAPEX + sum OPEX_month / (1+i)^m - residual / (1+i)^M,
               residual = residual_value_pct * CAPEX
  - hybrid   = purchase of hybrid_purchase_share * peak (no N-1) + rental
               of the remainder
  - crossover month = (CAPEX - residual) / (rent_month - OPEX_month), 999
    when renting never costs more per month.
  - IRR of buying instead of renting, from the incremental monthly flows,
    compounded to an annual rate.

Notes:
  - Ties resolve rental, then purchase, then hybrid.
  - Constraints are checked on the full permanent fleet at peak; a rented
    fleet of the same size occupies the same site budget.
================================================================================
*/

#include <cmath>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/core/units.hpp"
#include "engine/optimization/strategies.hpp"

namespace powerplan::strategy {

namespace {

struct OwnedFleet {
  EquipmentConfig equipment{};
  DispatchResult dispatch{};
  LcoeResult lcoe{};
  double capex = 0.0;
  double opex_monthly = 0.0;
  double residual = 0.0;
};

OwnedFleet own(const PlanningServices& s, double mw, bool n1) {
  OwnedFleet f;
  f.equipment = s.sizer.size_equipment_to_load(mw, n1);
  f.dispatch = s.dispatch.simulate_peak(f.equipment, mw);
  f.lcoe = s.economics.calculate_lcoe(f.equipment, f.dispatch);
  f.capex = f.lcoe.capex;
  f.opex_monthly = f.lcoe.opex.total() / units::months_per_year;
  f.residual = s.scenario.params.residual_value_pct * f.capex;
  return f;
}

// Present value of a level monthly payment over months [0, n).
double level_pv(double monthly, double i, int n) {
  double pv = 0.0;
  for (int m = 0; m < n; ++m) pv += monthly / std::pow(1.0 + i, m);
  return pv;
}

double purchase_npv(const OwnedFleet& f, double i, int months) {
  return f.capex + level_pv(f.opex_monthly, i, months) - f.residual / std::pow(1.0 + i, months);
}

} // namespace

HeuristicResult solve_bridge_power(const BridgePowerProblem& p, const PlanningServices& s) {
  HeuristicResult r;
  r.objective_label = "bridge_npv_usd";
  r.timeline_months = p.grid_available_month;
  r.warnings.push_back("Transition timing is indicative only");

  const Scenario& sc = s.scenario;
  const GlobalParameters& params = sc.params;
  const double peak = sc.trajectory.max_peak_mw();
  const int months = p.grid_available_month;
  const double i = params.discount_rate / units::months_per_year;

  if (!(peak > 0.0)) {
    r.feasible = false;
    r.lcoe = std::numeric_limits<double>::infinity();
    r.violations.push_back("Load trajectory has no positive peak load");
    r.warnings.push_back("No load to serve; LCOE undefined");
    return r;
  }

  const double rental_monthly = peak * units::kw_per_mw * p.rental_cost_kw_month;
  const double rental_npv = level_pv(rental_monthly, i, months);

  const OwnedFleet full = own(s, peak, sc.site.n_minus_1_required);
  const double buy_npv = purchase_npv(full, i, months);

  const double share = params.hybrid_purchase_share;
  const OwnedFleet part = own(s, share * peak, false);
  const double rest_monthly = (1.0 - share) * peak * units::kw_per_mw * p.rental_cost_kw_month;
  const double hybrid_npv = purchase_npv(part, i, months) + level_pv(rest_monthly, i, months);

  r.bridge_scenarios.push_back(BridgeScenario{"rental", rental_npv, 0.0, rental_monthly});
  r.bridge_scenarios.push_back(BridgeScenario{"purchase", buy_npv, full.capex, full.opex_monthly});
  r.bridge_scenarios.push_back(
      BridgeScenario{"hybrid", hybrid_npv, part.capex, part.opex_monthly + rest_monthly});

  const BridgeScenario* best = &r.bridge_scenarios.front();
  for (const BridgeScenario& b : r.bridge_scenarios) {
    if (b.npv < best->npv) best = &b;
  }

  const double saving_monthly = rental_monthly - full.opex_monthly;
  const double crossover = saving_monthly > 0.0 ? (full.capex - full.residual) / saving_monthly
                                                : units::crossover_never_months;

  // Buy instead of rent: pay CAPEX now, save (rent - OPEX) each month,
  // recover the residual when the grid arrives.
  std::optional<double> irr_annual;
  if (months > 0) {
    std::vector<double> flows(static_cast<size_t>(months) + 1, saving_monthly);
    flows[0] -= full.capex;
    flows[static_cast<size_t>(months)] = full.residual;
    if (const auto monthly = irr(flows)) irr_annual = std::pow(1.0 + *monthly, units::months_per_year) - 1.0;
  }

  std::ostringstream oss;
  oss << "bridge_power: rental=" << rental_npv << " purchase=" << buy_npv << " hybrid=" << hybrid_npv
      << " -> " << best->strategy;
  log(LogLevel::DEBUG, oss.str());

  const ConstraintReport report =
      s.checker.check_constraints(full.equipment, full.dispatch, peak, sc.trajectory.workload_mix);

  r.selected_strategy = best->strategy;
  r.objective_value = best->npv;
  r.lcoe = full.lcoe.lcoe;
  r.capex_total = best->capex;
  r.opex_annual = best->monthly_cost * units::months_per_year;
  r.equipment_config = full.equipment;

  apply_dispatch(r, full.dispatch);
  apply_constraints(r, report);
  add_warnings(r, full.lcoe.warnings);
  r.feasible = r.violations.empty();

  r.metrics["peak_mw"] = peak;
  r.metrics["grid_available_month"] = months;
  r.metrics["rental_npv"] = rental_npv;
  r.metrics["purchase_npv"] = buy_npv;
  r.metrics["hybrid_npv"] = hybrid_npv;
  r.metrics["rental_monthly_cost"] = rental_monthly;
  r.metrics["purchase_capex"] = full.capex;
  r.metrics["purchase_opex_monthly"] = full.opex_monthly;
  r.metrics["residual_value"] = full.residual;
  r.metrics["crossover_month"] = crossover;
  if (irr_annual) r.metrics["purchase_vs_rental_irr_annual"] = *irr_annual;
  return r;
}

} // namespace powerplan::strategy
