#pragma once
/*
================================================================================
Fragment 1.4 - Core: Global Parameters + Site Constraints
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every economic / planning assumption (discount rate, fuel,
    ITC, VOLL, BESS constants, land constants) and every site limit (NOx,
    gas, land, reliability, ramp, time-to-power) into validated objects.
  - Named constants that are empirical rather than derived
    (alignment_factor, dr_eligibility_factor) live here so callers can
    override them instead of editing formulas.

Hardening:
  - validate_or_throw() catches nonsensical values early.
  - Explicit units in every field name.
  - Any change here changes the scenario fingerprint (scenario_key).
================================================================================
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "engine/core/errors.hpp"

namespace powerplan {

// ----------------------------- Global parameters -----------------------------
struct GlobalParameters {
  double discount_rate = 0.08;
  int project_life_years = 20;
  double fuel_price_mmbtu = 3.50;
  double fuel_escalation_rate = 0.025;
  double itc_rate = 0.30;                 // applied to solar + BESS capex
  double voll_per_mwh = 50000.0;          // value of lost load
  double grid_price_mwh = 80.0;

  // BESS
  double bess_capacity_credit = 0.25;
  double bess_degradation_per_kwh = 0.03; // $ per kWh discharged
  double bess_initial_soc = 0.5;

  // Timeline
  double commissioning_offset_months = 3.0;

  // Planning
  double planning_capacity_factor = 0.85; // converts firm MW to annual MWh in caps / blends
  double alignment_factor = 0.7;          // flexible MW -> extra servable load (LandDev)
  double dr_eligibility_factor = 0.8;     // flexible MW -> DR-eligible MW (GridServices)
  std::vector<double> flex_scenarios{0.0, 0.15, 0.30, 0.50};

  // Bridge power
  double residual_value_pct = 0.10;
  double hybrid_purchase_share = 0.70;

  // Land
  double solar_land_threshold_acres = 800.0;
  double datacenter_mw_per_acre = 3.0;
  double substation_acres = 10.0;
  double infrastructure_land_pct = 0.10;

  // Synthetic profiles
  uint64_t load_seed = 42;

  void validate_or_throw() const {
    auto in01 = [](double x) { return x >= 0.0 && x <= 1.0; };
    if (discount_rate < 0.0 || discount_rate > 1.0) {
      throw ValidationError("GlobalParameters: discount_rate must be [0,1]");
    }
    if (project_life_years < 1 || project_life_years > 100) {
      throw ValidationError("GlobalParameters: project_life_years outside [1,100]");
    }
    if (fuel_price_mmbtu < 0.0) throw ValidationError("GlobalParameters: fuel_price_mmbtu < 0");
    if (fuel_escalation_rate < -0.5 || fuel_escalation_rate > 1.0) {
      throw ValidationError("GlobalParameters: fuel_escalation_rate outside sane bounds");
    }
    if (!in01(itc_rate)) throw ValidationError("GlobalParameters: itc_rate must be [0,1]");
    if (voll_per_mwh < 0.0) throw ValidationError("GlobalParameters: voll_per_mwh < 0");
    if (grid_price_mwh < 0.0) throw ValidationError("GlobalParameters: grid_price_mwh < 0");
    if (!in01(bess_capacity_credit)) {
      throw ValidationError("GlobalParameters: bess_capacity_credit must be [0,1]");
    }
    if (bess_degradation_per_kwh < 0.0) {
      throw ValidationError("GlobalParameters: bess_degradation_per_kwh < 0");
    }
    if (!in01(bess_initial_soc)) throw ValidationError("GlobalParameters: bess_initial_soc must be [0,1]");
    if (commissioning_offset_months < 0.0) {
      throw ValidationError("GlobalParameters: commissioning_offset_months < 0");
    }
    if (!(planning_capacity_factor > 0.0 && planning_capacity_factor <= 1.0)) {
      throw ValidationError("GlobalParameters: planning_capacity_factor must be (0,1]");
    }
    if (!in01(alignment_factor)) throw ValidationError("GlobalParameters: alignment_factor must be [0,1]");
    if (!in01(dr_eligibility_factor)) {
      throw ValidationError("GlobalParameters: dr_eligibility_factor must be [0,1]");
    }
    for (double f : flex_scenarios) {
      // load_max = firm / (1 - f * alignment) must stay finite
      if (f < 0.0 || f * alignment_factor >= 1.0) {
        throw ValidationError("GlobalParameters: flex scenario outside [0, 1/alignment_factor)");
      }
    }
    if (!in01(residual_value_pct)) throw ValidationError("GlobalParameters: residual_value_pct must be [0,1]");
    if (!in01(hybrid_purchase_share)) {
      throw ValidationError("GlobalParameters: hybrid_purchase_share must be [0,1]");
    }
    if (solar_land_threshold_acres < 0.0) {
      throw ValidationError("GlobalParameters: solar_land_threshold_acres < 0");
    }
    if (datacenter_mw_per_acre <= 0.0) {
      throw ValidationError("GlobalParameters: datacenter_mw_per_acre must be > 0");
    }
    if (substation_acres < 0.0) throw ValidationError("GlobalParameters: substation_acres < 0");
    if (!in01(infrastructure_land_pct)) {
      throw ValidationError("GlobalParameters: infrastructure_land_pct must be [0,1]");
    }
  }
};

// ----------------------------- Site constraints ------------------------------
struct SiteConstraints {
  double nox_tpy = 100.0;
  double gas_supply_mcf_day = 50000.0;
  double land_area_acres = 500.0;
  bool n_minus_1_required = true;
  double min_availability = 0.995;
  double min_ramp_mw_min = 0.0;            // 0 = derive from workload mix
  double max_time_to_power_months = 36.0;

  double grid_capacity_mw = 0.0;           // 0 = no grid import
  std::optional<int> grid_available_year;  // unset = grid never in horizon

  bool grid_available_in(int year) const {
    return grid_capacity_mw > 0.0 && grid_available_year && year >= *grid_available_year;
  }

  void validate_or_throw() const {
    if (nox_tpy < 0.0) throw ValidationError("SiteConstraints: nox_tpy < 0");
    if (gas_supply_mcf_day < 0.0) throw ValidationError("SiteConstraints: gas_supply_mcf_day < 0");
    if (land_area_acres < 0.0) throw ValidationError("SiteConstraints: land_area_acres < 0");
    if (!(min_availability >= 0.0 && min_availability < 1.0)) {
      throw ValidationError("SiteConstraints: min_availability must be [0,1)");
    }
    if (min_ramp_mw_min < 0.0) throw ValidationError("SiteConstraints: min_ramp_mw_min < 0");
    if (max_time_to_power_months <= 0.0) {
      throw ValidationError("SiteConstraints: max_time_to_power_months must be > 0");
    }
    if (grid_capacity_mw < 0.0) throw ValidationError("SiteConstraints: grid_capacity_mw < 0");
  }
};

} // namespace powerplan
