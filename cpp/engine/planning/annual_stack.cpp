#include "engine/planning/annual_stack.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include "engine/core/logging.hpp"

namespace powerplan {

AnnualStackBuilder::AnnualStackBuilder(const EquipmentSizer& sizer, const DispatchSimulator& dispatch,
                                       const EconomicsCalculator& economics, const GlobalParameters& params,
                                       const SiteConstraints& site)
    : sizer_(sizer), dispatch_(dispatch), economics_(economics), params_(params), site_(site) {}

AnnualStackResult AnnualStackBuilder::optimize_annual_energy_stack(const LoadTrajectory& trajectory,
                                                                   const EquipmentConfig& existing) const {
  return optimize_annual_energy_stack(trajectory, sizer_.policy(), existing);
}

AnnualStackResult AnnualStackBuilder::optimize_annual_energy_stack(const LoadTrajectory& trajectory,
                                                                   const FillPolicy& policy,
                                                                   const EquipmentConfig& existing) const {
  AnnualStackResult out;
  EquipmentConfig fleet = existing;
  if (trajectory.empty()) {
    out.final_equipment = fleet;
    out.blended_lcoe = std::numeric_limits<double>::infinity();
    out.warnings.push_back("Load trajectory is empty; blended LCOE undefined");
    log(LogLevel::WARN, "optimize_annual_energy_stack: empty trajectory");
    return out;
  }

  const double r = params_.discount_rate;
  const double crf = economics_.crf();
  const int first_year = trajectory.first_year();

  double disc_cost = 0.0;
  double disc_energy = 0.0;
  double total_fuel = 0.0;
  double total_opex = 0.0;
  double capex_cumulative = 0.0;  // existing fleet is sunk

  for (const auto& [year, peak] : trajectory.peak_mw_by_year) {
    const int k = year - first_year;
    const double df = 1.0 / std::pow(1.0 + r, k + 1);

    AnnualStackRow row;
    row.year = year;
    row.peak_mw = peak;
    row.grid_available = site_.grid_available_in(year);

    if (!(peak > 0.0)) {
      row.equipment = fleet;
      row.capex_cumulative = capex_cumulative;
      row.annual_cost = crf * capex_cumulative;
      row.annual_lcoe = std::numeric_limits<double>::infinity();
      disc_cost += df * row.annual_cost;
      out.rows.push_back(row);
      log(LogLevel::DEBUG, "annual stack " + std::to_string(year) + ": no load");
      continue;
    }

    FillPolicy year_policy = policy;
    year_policy.grid_import_limit_mw =
        row.grid_available ? std::min(policy.grid_import_limit_mw, site_.grid_capacity_mw) : 0.0;
    const EquipmentSizer year_sizer = sizer_.with_policy(year_policy);

    const EquipmentConfig target = year_sizer.size_equipment_to_load(peak, site_.n_minus_1_required);
    const EquipmentConfig grown = fleet.merged_max(target);
    const EquipmentConfig added = grown.added_since(fleet);
    fleet = grown;

    row.equipment = fleet;
    row.capex_added = economics_.calculate_capex(added);
    capex_cumulative += row.capex_added;
    row.capex_cumulative = capex_cumulative;

    DispatchResult d = dispatch_.simulate_peak(fleet, peak);
    const double esc = std::pow(1.0 + params_.fuel_escalation_rate, k);
    const OpexBreakdown opex = economics_.calculate_annual_opex(fleet, d, esc);

    row.fuel_cost = opex.fuel;
    row.opex = opex.total();
    row.annual_cost = crf * capex_cumulative + row.opex;
    row.energy_required_mwh = d.energy_required_mwh;
    row.energy_delivered_mwh = d.energy_delivered_mwh;
    row.unserved_energy_mwh = d.unserved_energy_mwh;
    row.unserved_energy_pct = d.unserved_energy_pct;
    row.annual_lcoe = row.energy_delivered_mwh > 0.0 ? row.annual_cost / row.energy_delivered_mwh
                                                     : std::numeric_limits<double>::infinity();

    disc_cost += df * row.annual_cost;
    disc_energy += df * row.energy_delivered_mwh;
    total_fuel += row.fuel_cost;
    total_opex += row.opex;

    out.total_capex += row.capex_added;
    out.total_delivered_mwh += row.energy_delivered_mwh;
    out.total_unserved_mwh += row.unserved_energy_mwh;
    out.final_peak_mw = peak;
    ++out.active_years;

    log(LogLevel::DEBUG, "annual stack " + std::to_string(year) + ": peak=" + std::to_string(peak) +
                             " MW, added capex=" + std::to_string(row.capex_added) +
                             ", fleet=" + summarize(fleet));

    out.rows.push_back(row);
    out.final_dispatch = std::move(d);
  }

  out.final_equipment = fleet;
  out.npv_total_cost = disc_cost;
  out.avg_annual_fuel = annualize_fuel(total_fuel, out.active_years);
  out.avg_annual_opex = out.active_years > 0 ? total_opex / out.active_years : 0.0;

  if (disc_energy > 0.0) {
    out.blended_lcoe = disc_cost / disc_energy;
  } else {
    out.blended_lcoe = std::numeric_limits<double>::infinity();
    out.warnings.push_back("No energy delivered across the horizon; blended LCOE undefined");
    log(LogLevel::WARN, "optimize_annual_energy_stack: zero discounted energy");
  }
  if (out.total_unserved_mwh > 0.0) {
    out.warnings.push_back("Unserved energy in " + std::to_string(std::count_if(
        out.rows.begin(), out.rows.end(), [](const AnnualStackRow& rr) { return rr.unserved_energy_mwh > 0.0; })) +
        " analysis year(s)");
  }
  return out;
}

} // namespace powerplan
