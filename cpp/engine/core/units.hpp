#pragma once
/*
================================================================================
Fragment 1.10 - Core: Units + Conversions
FILE: cpp/engine/core/units.hpp

Purpose:
  - Explicit power/energy/fuel/emissions conversions so sizing, dispatch and
    economics code avoids silent unit bugs (kW vs MW, btu vs MMBtu, lb vs ton).

Hardening:
  - Header-only constexpr constants (no runtime overhead).
  - No implicit "magic numbers" scattered through the code.
================================================================================
*/

namespace powerplan::units {

// Time
inline constexpr int hours_per_year = 8760;
inline constexpr int hours_per_day = 24;
inline constexpr int days_per_year = 365;
inline constexpr int months_per_year = 12;
inline constexpr double minutes_per_hour = 60.0;

// Power
inline constexpr double kw_per_mw = 1000.0;

// Energy / fuel
// Heat rate btu/kWh -> MMBtu/MWh: (btu/kWh * 1000 kWh/MWh) / 1e6 btu/MMBtu
inline constexpr double heat_rate_btu_kwh_to_mmbtu_mwh = 1.0e-3;
// Pipeline gas higher heating value (btu per MCF).
inline constexpr double btu_per_mcf = 1'037'000.0;

// Emissions
inline constexpr double lb_per_short_ton = 2000.0;

// Sentinels
inline constexpr int crossover_never_months = 999;
inline constexpr double degenerate_utilization = 999.0;

inline constexpr double mmbtu_per_mwh(double heat_rate_btu_kwh) {
  return heat_rate_btu_kwh * heat_rate_btu_kwh_to_mmbtu_mwh;
}

inline constexpr double mcf_per_mwh(double heat_rate_btu_kwh) {
  return heat_rate_btu_kwh * kw_per_mw / btu_per_mcf;
}

} // namespace powerplan::units
