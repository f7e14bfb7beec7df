#include "engine/core/equipment.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "engine/core/units.hpp"

namespace powerplan {

const char* to_string(Technology t) noexcept {
  switch (t) {
    case Technology::Recip:   return "recip";
    case Technology::Turbine: return "turbine";
    case Technology::Bess:    return "bess";
    case Technology::Solar:   return "solar";
    case Technology::Grid:    return "grid";
    default:                  return "unknown";
  }
}

std::optional<Technology> technology_from_string(std::string_view s) noexcept {
  for (Technology t : kAllTechnologies) {
    if (s == to_string(t)) return t;
  }
  return std::nullopt;
}

// ----------------------------- EquipmentSpec ---------------------------------
double EquipmentSpec::gas_mcf_per_mwh() const {
  return units::mcf_per_mwh(heat_rate_btu_kwh);
}

double EquipmentSpec::fuel_mmbtu_per_mwh() const {
  return units::mmbtu_per_mwh(heat_rate_btu_kwh);
}

void EquipmentSpec::validate_or_throw() const {
  const std::string who = std::string("EquipmentSpec[") + to_string(technology) + "]: ";
  auto nonneg = [&](double v, const char* field) {
    if (!std::isfinite(v) || v < 0.0) {
      throw ValidationError(who + field + " must be finite and >= 0");
    }
  };
  nonneg(capacity_mw, "capacity_mw");
  nonneg(heat_rate_btu_kwh, "heat_rate_btu_kwh");
  nonneg(nox_lb_mwh, "nox_lb_mwh");
  nonneg(ramp_rate_mw_min, "ramp_rate_mw_min");
  nonneg(start_time_cold_min, "start_time_cold_min");
  nonneg(lead_time_months_min, "lead_time_months_min");
  nonneg(lead_time_months_max, "lead_time_months_max");
  nonneg(capex_per_kw, "capex_per_kw");
  nonneg(capex_per_kwh, "capex_per_kwh");
  nonneg(vom_per_mwh, "vom_per_mwh");
  nonneg(fom_per_kw_yr, "fom_per_kw_yr");
  nonneg(land_acres_per_mw, "land_acres_per_mw");
  nonneg(duration_hours, "duration_hours");

  if (!(availability_pct > 0.0 && availability_pct <= 1.0)) {
    throw ValidationError(who + "availability_pct must be (0,1]");
  }
  if (!(roundtrip_efficiency > 0.0 && roundtrip_efficiency <= 1.0)) {
    throw ValidationError(who + "roundtrip_efficiency must be (0,1]");
  }
  if (!(capacity_factor >= 0.0 && capacity_factor <= 1.0)) {
    throw ValidationError(who + "capacity_factor must be [0,1]");
  }
  if (lead_time_months_max < lead_time_months_min) {
    throw ValidationError(who + "lead_time_months_max < lead_time_months_min");
  }
  if (capacity_mw <= 0.0) {
    throw ValidationError(who + "capacity_mw (unit size) must be > 0");
  }
}

// ----------------------------- EquipmentCatalog ------------------------------
EquipmentCatalog EquipmentCatalog::defaults() {
  EquipmentCatalog c;

  EquipmentSpec recip;
  recip.name = "Reciprocating engine 18.3 MW";
  recip.technology = Technology::Recip;
  recip.capacity_mw = 18.3;
  recip.heat_rate_btu_kwh = 7700.0;
  recip.nox_lb_mwh = 0.50;
  recip.ramp_rate_mw_min = 3.0;
  recip.start_time_cold_min = 5.0;
  recip.lead_time_months_min = 18.0;
  recip.lead_time_months_max = 24.0;
  recip.capex_per_kw = 1650.0;
  recip.vom_per_mwh = 8.5;
  recip.fom_per_kw_yr = 18.5;
  recip.availability_pct = 0.975;
  recip.land_acres_per_mw = 0.5;
  c.set(recip);

  EquipmentSpec turbine;
  turbine.name = "Aeroderivative gas turbine 50 MW";
  turbine.technology = Technology::Turbine;
  turbine.capacity_mw = 50.0;
  turbine.heat_rate_btu_kwh = 8500.0;
  turbine.nox_lb_mwh = 0.25;
  turbine.ramp_rate_mw_min = 8.0;
  turbine.start_time_cold_min = 10.0;
  turbine.lead_time_months_min = 24.0;
  turbine.lead_time_months_max = 30.0;
  turbine.capex_per_kw = 1300.0;
  turbine.vom_per_mwh = 6.5;
  turbine.fom_per_kw_yr = 12.5;
  turbine.availability_pct = 0.95;
  turbine.land_acres_per_mw = 0.3;
  c.set(turbine);

  EquipmentSpec bess;
  bess.name = "Battery storage 50 MW / 4 h";
  bess.technology = Technology::Bess;
  bess.capacity_mw = 50.0;
  bess.duration_hours = 4.0;
  bess.roundtrip_efficiency = 0.90;
  bess.ramp_rate_mw_min = 50.0;
  bess.lead_time_months_min = 12.0;
  bess.lead_time_months_max = 12.0;
  bess.capex_per_kwh = 236.0;
  bess.fom_per_kw_yr = 0.0;
  bess.availability_pct = 0.995;
  bess.land_acres_per_mw = 0.25;
  c.set(bess);

  EquipmentSpec solar;
  solar.name = "Single-axis solar PV";
  solar.technology = Technology::Solar;
  solar.capacity_mw = 1.0;
  solar.capacity_factor = 0.25;
  solar.lead_time_months_min = 12.0;
  solar.lead_time_months_max = 12.0;
  solar.capex_per_kw = 950.0;
  solar.fom_per_kw_yr = 0.0;
  solar.availability_pct = 0.995;
  solar.land_acres_per_mw = 5.0;
  c.set(solar);

  EquipmentSpec grid;
  grid.name = "Utility grid interconnection";
  grid.technology = Technology::Grid;
  grid.capacity_mw = 1.0;
  grid.lead_time_months_min = 36.0;
  grid.lead_time_months_max = 60.0;
  grid.capex_per_kw = 500.0;
  grid.availability_pct = 0.9997;
  c.set(grid);

  return c;
}

void EquipmentCatalog::set(EquipmentSpec spec) {
  const Technology t = spec.technology;
  specs_[t] = std::move(spec);
}

bool EquipmentCatalog::has(Technology t) const noexcept {
  return specs_.find(t) != specs_.end();
}

const EquipmentSpec& EquipmentCatalog::at(Technology t) const {
  auto it = specs_.find(t);
  if (it == specs_.end()) {
    throw ConfigurationError(std::string("EquipmentCatalog: missing entry for '") +
                             to_string(t) + "'");
  }
  return it->second;
}

void EquipmentCatalog::validate_or_throw() const {
  for (const auto& [tech, spec] : specs_) {
    if (spec.technology != tech) {
      throw ValidationError("EquipmentCatalog: spec technology does not match its key");
    }
    spec.validate_or_throw();
  }
}

// ----------------------------- EquipmentConfig -------------------------------
double EquipmentConfig::mw(Technology t) const {
  switch (t) {
    case Technology::Recip:   return recip_mw;
    case Technology::Turbine: return turbine_mw;
    case Technology::Bess:    return bess_power_mw;
    case Technology::Solar:   return solar_mw_dc;
    case Technology::Grid:    return grid_import_mw;
    default:                  return 0.0;
  }
}

double EquipmentConfig::largest_unit_mw(const EquipmentCatalog& catalog) const {
  double largest = 0.0;
  if (recip_units > 0) largest = std::max(largest, catalog.at(Technology::Recip).capacity_mw);
  if (turbine_units > 0) largest = std::max(largest, catalog.at(Technology::Turbine).capacity_mw);
  if (grid_import_mw > 0.0) largest = std::max(largest, grid_import_mw);
  return largest;
}

EquipmentConfig EquipmentConfig::plus(const EquipmentConfig& other) const {
  EquipmentConfig out = *this;
  out.recip_units += other.recip_units;
  out.turbine_units += other.turbine_units;
  out.recip_mw += other.recip_mw;
  out.turbine_mw += other.turbine_mw;
  out.bess_power_mw += other.bess_power_mw;
  out.bess_energy_mwh += other.bess_energy_mwh;
  out.solar_mw_dc += other.solar_mw_dc;
  out.grid_import_mw += other.grid_import_mw;
  return out;
}

EquipmentConfig EquipmentConfig::merged_max(const EquipmentConfig& target) const {
  EquipmentConfig out = *this;
  if (target.recip_units > out.recip_units) {
    out.recip_units = target.recip_units;
    out.recip_mw = target.recip_mw;
  }
  if (target.turbine_units > out.turbine_units) {
    out.turbine_units = target.turbine_units;
    out.turbine_mw = target.turbine_mw;
  }
  out.bess_power_mw = std::max(out.bess_power_mw, target.bess_power_mw);
  out.bess_energy_mwh = std::max(out.bess_energy_mwh, target.bess_energy_mwh);
  out.solar_mw_dc = std::max(out.solar_mw_dc, target.solar_mw_dc);
  out.grid_import_mw = std::max(out.grid_import_mw, target.grid_import_mw);
  return out;
}

EquipmentConfig EquipmentConfig::added_since(const EquipmentConfig& base) const {
  EquipmentConfig d;
  d.recip_units = std::max(0, recip_units - base.recip_units);
  d.turbine_units = std::max(0, turbine_units - base.turbine_units);
  d.recip_mw = std::max(0.0, recip_mw - base.recip_mw);
  d.turbine_mw = std::max(0.0, turbine_mw - base.turbine_mw);
  d.bess_power_mw = std::max(0.0, bess_power_mw - base.bess_power_mw);
  d.bess_energy_mwh = std::max(0.0, bess_energy_mwh - base.bess_energy_mwh);
  d.solar_mw_dc = std::max(0.0, solar_mw_dc - base.solar_mw_dc);
  d.grid_import_mw = std::max(0.0, grid_import_mw - base.grid_import_mw);
  return d;
}

void EquipmentConfig::set_recip_units(int n, const EquipmentCatalog& catalog) {
  recip_units = std::max(0, n);
  recip_mw = recip_units * catalog.at(Technology::Recip).capacity_mw;
}

void EquipmentConfig::set_turbine_units(int n, const EquipmentCatalog& catalog) {
  turbine_units = std::max(0, n);
  turbine_mw = turbine_units * catalog.at(Technology::Turbine).capacity_mw;
}

bool EquipmentConfig::operator==(const EquipmentConfig& o) const {
  return recip_units == o.recip_units && turbine_units == o.turbine_units &&
         recip_mw == o.recip_mw && turbine_mw == o.turbine_mw &&
         bess_power_mw == o.bess_power_mw && bess_energy_mwh == o.bess_energy_mwh &&
         solar_mw_dc == o.solar_mw_dc && grid_import_mw == o.grid_import_mw;
}

std::string summarize(const EquipmentConfig& cfg) {
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(1);
  oss << cfg.recip_units << "x recip (" << cfg.recip_mw << " MW), "
      << cfg.turbine_units << "x turbine (" << cfg.turbine_mw << " MW), "
      << "bess " << cfg.bess_power_mw << " MW/" << cfg.bess_energy_mwh << " MWh, "
      << "solar " << cfg.solar_mw_dc << " MWdc, "
      << "grid " << cfg.grid_import_mw << " MW";
  return oss.str();
}

} // namespace powerplan
