#pragma once
/*
================================================================================
Fragment 4.1 - Dispatch: Hourly Economic Dispatch
FILE: cpp/engine/dispatch/dispatch_simulator.hpp

Purpose:
  - One-year (8760 h) merit-order dispatch of an EquipmentConfig against an
    hourly load series.

Per-hour order:
  1) solar must-take
  2) dispatchables by marginal $/MWh (thermal: HR * fuel + VOM; grid: grid
     price). Grid runs ahead of thermal only when strictly cheaper.
     Each technology bounded by MW x availability and, for thermal, by
     units x ramp_rate_mw_min x 60 change per hour.
  3) BESS discharge covers the remaining shortfall (power x availability,
     SOC x sqrt(eta)); storage is held as a reliability reserve
  4) shortfall -> unserved
  5) reliability charging from excess solar, forced ramp-floor output, then
     unused dispatchable headroom in merit order (only in hours with no
     discharge)

Hardening:
  - Never throws on degenerate inputs: empty config / zero load produce a
    zero-energy result.
  - Deterministic given (config, load, catalog, params).
================================================================================
*/

#include <array>
#include <cstdint>
#include <vector>

#include "engine/core/equipment.hpp"
#include "engine/core/settings.hpp"

namespace powerplan {

struct TechDispatchStats {
  double energy_mwh = 0.0;
  double capacity_factor = 0.0;  // energy / (nameplate * 8760)
  int starts = 0;                // 0 -> >0 transitions
};

struct DispatchResult {
  // Hourly series (MW, SOC in MWh). Length 8760 when produced by simulate().
  std::vector<double> load_mw;
  std::vector<double> recip_mw;
  std::vector<double> turbine_mw;
  std::vector<double> solar_mw;
  std::vector<double> bess_discharge_mw;
  std::vector<double> bess_charge_mw;
  std::vector<double> bess_soc_mwh;
  std::vector<double> grid_mw;
  std::vector<double> unserved_mw;
  std::vector<double> curtailed_mw;

  // Aggregates
  double energy_required_mwh = 0.0;
  double energy_delivered_mwh = 0.0;
  double unserved_energy_mwh = 0.0;
  double unserved_energy_pct = 0.0;
  double curtailed_mwh = 0.0;
  double peak_unserved_mw = 0.0;
  int hours_with_unserved = 0;

  double fuel_mmbtu = 0.0;
  double gas_mcf = 0.0;
  double bess_charge_mwh = 0.0;

  double fleet_ramp_mw_min = 0.0;       // sum(units * ramp) across thermal + BESS
  double effective_ramp_mw_min = 0.0;   // capacity-weighted average thermal unit ramp

  std::array<TechDispatchStats, 5> by_tech{};

  const TechDispatchStats& stats(Technology t) const { return by_tech[static_cast<int>(t)]; }
  TechDispatchStats& stats(Technology t) { return by_tech[static_cast<int>(t)]; }
};

// Marginal cost of a dispatchable technology ($/MWh).
double marginal_cost_per_mwh(Technology t, const EquipmentCatalog& catalog,
                             const GlobalParameters& params);

// Sum of unit ramp capability (MW/min) of thermal units and BESS blocks.
double fleet_ramp_capability_mw_min(const EquipmentConfig& cfg, const EquipmentCatalog& catalog);

class DispatchSimulator {
 public:
  DispatchSimulator(const EquipmentCatalog& catalog, const GlobalParameters& params);

  DispatchResult simulate(const EquipmentConfig& cfg, const std::vector<double>& hourly_load_mw) const;

  // Builds the synthetic load for peak_mw (params.load_seed) and simulates.
  DispatchResult simulate_peak(const EquipmentConfig& cfg, double peak_mw) const;

 private:
  const EquipmentCatalog& catalog_;
  const GlobalParameters& params_;
  std::vector<double> solar_shape_;  // per MWdc, empty when no solar spec
};

} // namespace powerplan
