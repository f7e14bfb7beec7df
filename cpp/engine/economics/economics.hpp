#pragma once
/*
================================================================================
Fragment 5.1 - Economics: CAPEX / OPEX / LCOE / NPV / IRR
FILE: cpp/engine/economics/economics.hpp

Purpose:
  - calculate_capex: installed cost of an EquipmentConfig (ITC applied to
    solar + BESS), plus grid interconnection.
  - calculate_annual_opex: fixed O&M + VOM x MWh + fuel + grid energy +
    BESS degradation, from a dispatch run.
  - calculate_lcoe: (CAPEX x CRF + OPEX) / delivered MWh.
  - npv / irr helpers for scenario cash flows.

Hardening:
  - Zero delivered energy -> LCOE = +inf sentinel plus a warning. Never
    throws, never NaN.
  - CRF degenerates cleanly: r == 0 -> 1/n, n <= 0 -> 1.
================================================================================
*/

#include <optional>
#include <string>
#include <vector>

#include "engine/core/equipment.hpp"
#include "engine/core/settings.hpp"
#include "engine/dispatch/dispatch_simulator.hpp"

namespace powerplan {

struct OpexBreakdown {
  double fixed_om = 0.0;
  double variable_om = 0.0;
  double fuel = 0.0;
  double grid_energy = 0.0;
  double bess_degradation = 0.0;

  double total() const { return fixed_om + variable_om + fuel + grid_energy + bess_degradation; }
};

struct LcoeResult {
  double lcoe = 0.0;                  // $/MWh, +inf when nothing delivered
  double capex = 0.0;
  double annualized_capex = 0.0;
  OpexBreakdown opex{};
  double annual_cost = 0.0;           // annualized capex + opex
  double voll_adjusted_cost = 0.0;    // annual_cost + unserved * VOLL
  double energy_delivered_mwh = 0.0;
  double unserved_energy_mwh = 0.0;
  double unserved_energy_pct = 0.0;
  std::vector<std::string> warnings;
};

// Capital recovery factor r(1+r)^n / ((1+r)^n - 1).
double capital_recovery_factor(double rate, int years);

// Net present value; flows[0] is undiscounted (t = 0).
double npv(double rate, const std::vector<double>& flows);

// Internal rate of return per period by bisection on [-0.99, 10]. nullopt
// when the flows never change sign across the bracket.
std::optional<double> irr(const std::vector<double>& flows);

// Multi-year fuel spread over years that actually operated.
double annualize_fuel(double total_fuel, int active_years);

class EconomicsCalculator {
 public:
  EconomicsCalculator(const EquipmentCatalog& catalog, const GlobalParameters& params,
                      const DispatchSimulator& dispatch);

  double calculate_capex(const EquipmentConfig& cfg) const;

  // fuel_multiplier scales fuel price (e.g. escalation for a later year).
  OpexBreakdown calculate_annual_opex(const EquipmentConfig& cfg, const DispatchResult& dispatch,
                                      double fuel_multiplier = 1.0) const;

  // Runs a dispatch at reference_peak_mw first.
  OpexBreakdown calculate_annual_opex(const EquipmentConfig& cfg, double reference_peak_mw) const;

  LcoeResult calculate_lcoe(const EquipmentConfig& cfg, const DispatchResult& dispatch,
                            std::optional<double> annual_energy_mwh = std::nullopt) const;

  // Energy, unserved and operating costs are derived from a dispatch run at
  // reference_peak_mw; annual_energy_mwh (if given) replaces the denominator.
  LcoeResult calculate_lcoe(const EquipmentConfig& cfg, double reference_peak_mw,
                            std::optional<double> annual_energy_mwh = std::nullopt) const;

  double crf() const { return capital_recovery_factor(params_.discount_rate, params_.project_life_years); }

  const GlobalParameters& params() const noexcept { return params_; }

 private:
  const EquipmentCatalog& catalog_;
  const GlobalParameters& params_;
  const DispatchSimulator& dispatch_;
};

} // namespace powerplan
