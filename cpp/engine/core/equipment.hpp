#pragma once
/*
================================================================================
Fragment 2.1 - Core: Equipment Catalog + Equipment Config
FILE: cpp/engine/core/equipment.hpp

Purpose:
  - Typed, read-only view over externally supplied technology specs
    (EquipmentSpec / EquipmentCatalog).
  - The per-evaluation equipment mix (EquipmentConfig).

Hardening:
  - EquipmentSpec::validate_or_throw() rejects negative rates and
    availability / efficiency outside (0,1].
  - EquipmentCatalog::at() raises ConfigurationError for a missing entry.
  - total_capacity_mw() is derived, never stored.

Notes:
  - Grid and solar specs use 1 MW "units" so every technology can be
    treated uniformly by land / capex / availability roll-ups.
================================================================================
*/

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "engine/core/errors.hpp"

namespace powerplan {

enum class Technology : int { Recip = 0, Turbine = 1, Bess = 2, Solar = 3, Grid = 4 };

inline constexpr std::array<Technology, 5> kAllTechnologies = {
    Technology::Recip, Technology::Turbine, Technology::Bess, Technology::Solar, Technology::Grid};

const char* to_string(Technology t) noexcept;
std::optional<Technology> technology_from_string(std::string_view s) noexcept;

inline bool is_thermal(Technology t) noexcept {
  return t == Technology::Recip || t == Technology::Turbine;
}

// ----------------------------- EquipmentSpec ---------------------------------
struct EquipmentSpec {
  std::string name;
  Technology technology = Technology::Recip;

  double capacity_mw = 0.0;            // unit size (BESS: power per block)
  double heat_rate_btu_kwh = 0.0;      // 0 for non-fuel technologies
  double nox_lb_mwh = 0.0;
  double ramp_rate_mw_min = 0.0;       // per unit
  double start_time_cold_min = 0.0;
  double lead_time_months_min = 0.0;
  double lead_time_months_max = 0.0;

  double capex_per_kw = 0.0;           // thermal, solar (dc), grid interconnect
  double capex_per_kwh = 0.0;          // BESS energy
  double vom_per_mwh = 0.0;
  double fom_per_kw_yr = 0.0;

  double availability_pct = 1.0;       // (0,1]
  double land_acres_per_mw = 0.0;

  double duration_hours = 0.0;         // BESS only
  double roundtrip_efficiency = 1.0;   // BESS only, (0,1]
  double capacity_factor = 0.0;        // solar only, [0,1]

  double gas_mcf_per_mwh() const;
  double fuel_mmbtu_per_mwh() const;

  void validate_or_throw() const;
};

// ----------------------------- EquipmentCatalog ------------------------------
class EquipmentCatalog {
 public:
  EquipmentCatalog() = default;

  // Reference technology table used when no external catalog is supplied.
  static EquipmentCatalog defaults();

  void set(EquipmentSpec spec);
  bool has(Technology t) const noexcept;

  // Throws ConfigurationError when the technology is not in the catalog.
  const EquipmentSpec& at(Technology t) const;

  const std::map<Technology, EquipmentSpec>& entries() const noexcept { return specs_; }

  void validate_or_throw() const;

 private:
  std::map<Technology, EquipmentSpec> specs_;
};

// ----------------------------- EquipmentConfig -------------------------------
// Chosen mix for one evaluation. Thermal is tracked in whole units.
struct EquipmentConfig {
  int recip_units = 0;
  int turbine_units = 0;
  double recip_mw = 0.0;
  double turbine_mw = 0.0;
  double bess_power_mw = 0.0;
  double bess_energy_mwh = 0.0;
  double solar_mw_dc = 0.0;
  double grid_import_mw = 0.0;

  double total_capacity_mw() const {
    return recip_mw + turbine_mw + bess_power_mw + solar_mw_dc + grid_import_mw;
  }
  double thermal_mw() const { return recip_mw + turbine_mw; }
  double firm_capacity_mw() const { return thermal_mw() + grid_import_mw; }
  // Firm capacity plus the share of BESS power counted toward contingency.
  double credited_firm_mw(double bess_credit) const { return firm_capacity_mw() + bess_power_mw * bess_credit; }

  bool empty() const { return total_capacity_mw() <= 0.0 && bess_energy_mwh <= 0.0; }

  // MW installed for a technology (BESS: power).
  double mw(Technology t) const;

  // Largest single firm element: a thermal unit, or the grid import taken as
  // one element of grid_import_mw. BESS is not firm and is not counted.
  double largest_unit_mw(const EquipmentCatalog& catalog) const;

  // Component-wise max: additive growth, never removes capacity.
  EquipmentConfig merged_max(const EquipmentConfig& target) const;

  // Component-wise sum (an existing fleet plus an expansion).
  EquipmentConfig plus(const EquipmentConfig& other) const;

  // Component-wise (this - base), clamped at zero.
  EquipmentConfig added_since(const EquipmentConfig& base) const;

  void set_recip_units(int n, const EquipmentCatalog& catalog);
  void set_turbine_units(int n, const EquipmentCatalog& catalog);

  bool operator==(const EquipmentConfig& o) const;
  bool operator!=(const EquipmentConfig& o) const { return !(*this == o); }
};

std::string summarize(const EquipmentConfig& cfg);

} // namespace powerplan
