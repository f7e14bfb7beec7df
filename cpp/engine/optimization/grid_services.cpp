/*
================================================================================
Fragment 8.8 - Optimization: Grid Services Strategy
FILE: cpp/engine/optimization/grid_services.cpp

Objective:
  - Annual demand-response revenue from flexible workloads. LCOE of the
    base-load fleet is reported but does not enter the objective.

Method:
  - flexible MW per workload = peak * share * flexibility_pct.
  - eligible MW = total flexible MW * dr_eligibility_factor.
  - A product qualifies when eligible MW >= its minimum capacity.
    availability = eligible * $/MW-hr * 8760 (or eligible * 1000 * $/kW-yr),
    activation = eligible * expected hours * $/MWh.
  - The on-site fleet is sized for base load = peak - total flexible MW.
================================================================================
*/

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/core/units.hpp"
#include "engine/optimization/strategies.hpp"

namespace powerplan::strategy {

namespace {

ServiceRevenue service_revenue(const DrService& svc, double eligible_mw) {
  ServiceRevenue out;
  out.service = svc.name;
  out.eligible_mw = eligible_mw;
  out.qualified = eligible_mw > 0.0 && eligible_mw >= svc.min_capacity_mw;
  if (!out.qualified) return out;

  out.availability_revenue = svc.payment_kw_yr > 0.0
                                 ? eligible_mw * units::kw_per_mw * svc.payment_kw_yr
                                 : eligible_mw * svc.payment_mw_hr * units::hours_per_year;
  out.activation_revenue = eligible_mw * svc.expected_hours_yr * svc.activation_per_mwh;
  out.total_revenue = out.availability_revenue + out.activation_revenue;
  return out;
}

} // namespace

HeuristicResult solve_grid_services(const GridServicesProblem& p, const PlanningServices& s) {
  HeuristicResult r;
  r.objective_label = "annual_dr_revenue_usd";

  const Scenario& sc = s.scenario;
  const double peak = sc.trajectory.max_peak_mw();
  const auto& mix = sc.trajectory.workload_mix;

  std::vector<std::string> unknown;
  const double total_flex = flexible_mw(peak, mix, sc.workloads, &unknown);
  r.flex_by_workload = flexible_mw_by_workload(peak, mix, sc.workloads);

  if (mix.empty()) {
    add_warnings(r, {"Workload mix is empty; no flexible capacity available"});
  }
  for (const std::string& w : unknown) {
    add_warnings(r, {"Unknown workload '" + w + "' contributes no flexibility"});
  }

  const double eligible = total_flex * sc.params.dr_eligibility_factor;
  double total_revenue = 0.0;
  int qualified = 0;
  for (const DrService& svc : p.services) {
    ServiceRevenue rev = service_revenue(svc, eligible);
    if (rev.qualified) ++qualified;
    total_revenue += rev.total_revenue;
    r.service_revenue.push_back(std::move(rev));
  }
  log(LogLevel::DEBUG, "grid_services: flex=" + std::to_string(total_flex) + "MW eligible=" +
                           std::to_string(eligible) + "MW qualified=" + std::to_string(qualified));

  const double base_load = std::max(0.0, peak - total_flex);
  const EquipmentConfig cfg = s.sizer.size_equipment_to_load(base_load, sc.site.n_minus_1_required);
  const DispatchResult dispatch = s.dispatch.simulate_peak(cfg, base_load);
  const LcoeResult lcoe = s.economics.calculate_lcoe(cfg, dispatch);
  const ConstraintReport report = s.checker.check_constraints(cfg, dispatch, base_load, mix);

  r.objective_value = total_revenue;
  r.lcoe = lcoe.lcoe;
  r.capex_total = lcoe.capex;
  r.opex_annual = lcoe.opex.total();
  r.equipment_config = cfg;
  r.timeline_months = cfg.empty() ? 0.0 : s.checker.time_to_power_months(cfg);

  apply_dispatch(r, dispatch);
  apply_constraints(r, report);
  add_warnings(r, lcoe.warnings);
  r.feasible = r.violations.empty();

  r.metrics["peak_mw"] = peak;
  r.metrics["total_flex_mw"] = total_flex;
  r.metrics["eligible_mw"] = eligible;
  r.metrics["base_load_mw"] = base_load;
  r.metrics["total_revenue"] = total_revenue;
  r.metrics["services_qualified"] = qualified;
  r.metrics["revenue_per_flex_mw"] = total_flex > 0.0 ? total_revenue / total_flex : 0.0;
  return r;
}

} // namespace powerplan::strategy
