#pragma once
/*
================================================================================
Fragment 7.1 - Planning: Annual Energy Stack Builder
FILE: cpp/engine/planning/annual_stack.hpp

Purpose:
  - Walk the analysis years of a LoadTrajectory, growing equipment
    additively to meet each year's peak, dispatching each year, and
    blending the multi-year LCOE on an NPV basis.

Rules:
  - Capacity is never removed (component-wise max with the running fleet).
  - A year's CAPEX is the cost of the capacity added that year only.
  - Annual cost = CRF x cumulative CAPEX + OPEX (fuel escalated by
    (1 + fuel_escalation_rate)^k).
  - Blended LCOE = sum(df_k * cost_k) / sum(df_k * delivered_k),
    df_k = 1 / (1 + r)^(k+1).
  - Years with peak <= 0 are recorded but are not active operating years.

Hardening:
  - Zero discounted energy -> +inf blended LCOE plus a warning.
  - The EquipmentConfig lives only for one call.
================================================================================
*/

#include <string>
#include <vector>

#include "engine/core/equipment.hpp"
#include "engine/core/load_model.hpp"
#include "engine/core/settings.hpp"
#include "engine/dispatch/dispatch_simulator.hpp"
#include "engine/economics/economics.hpp"
#include "engine/sizing/equipment_sizer.hpp"

namespace powerplan {

struct AnnualStackRow {
  int year = 0;
  double peak_mw = 0.0;
  EquipmentConfig equipment{};
  double capex_added = 0.0;
  double capex_cumulative = 0.0;
  double opex = 0.0;               // includes fuel
  double fuel_cost = 0.0;
  double annual_cost = 0.0;
  double energy_required_mwh = 0.0;
  double energy_delivered_mwh = 0.0;
  double unserved_energy_mwh = 0.0;
  double unserved_energy_pct = 0.0;
  double annual_lcoe = 0.0;        // +inf when nothing delivered
  bool grid_available = false;
};

struct AnnualStackResult {
  EquipmentConfig final_equipment{};
  double blended_lcoe = 0.0;
  std::vector<AnnualStackRow> rows;

  double total_capex = 0.0;        // sum of added capex
  double npv_total_cost = 0.0;     // sum of discounted annual cost
  double avg_annual_fuel = 0.0;    // total fuel / active years
  double avg_annual_opex = 0.0;    // total opex / active years
  int active_years = 0;
  double total_delivered_mwh = 0.0;
  double total_unserved_mwh = 0.0;
  double final_peak_mw = 0.0;

  DispatchResult final_dispatch{}; // last active year
  std::vector<std::string> warnings;
};

class AnnualStackBuilder {
 public:
  AnnualStackBuilder(const EquipmentSizer& sizer, const DispatchSimulator& dispatch,
                     const EconomicsCalculator& economics, const GlobalParameters& params,
                     const SiteConstraints& site);

  // existing: fleet already on site before the first analysis year.
  AnnualStackResult optimize_annual_energy_stack(const LoadTrajectory& trajectory,
                                                 const EquipmentConfig& existing = EquipmentConfig{}) const;

  // Same, with a different fill policy (same catalog).
  AnnualStackResult optimize_annual_energy_stack(const LoadTrajectory& trajectory, const FillPolicy& policy,
                                                 const EquipmentConfig& existing = EquipmentConfig{}) const;

 private:
  const EquipmentSizer& sizer_;
  const DispatchSimulator& dispatch_;
  const EconomicsCalculator& economics_;
  const GlobalParameters& params_;
  const SiteConstraints& site_;
};

} // namespace powerplan
