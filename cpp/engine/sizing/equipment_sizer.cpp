#include "engine/sizing/equipment_sizer.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "engine/core/errors.hpp"

namespace powerplan {

namespace {

constexpr double kEps = 1e-9;
constexpr int kMaxN1Additions = 10000;

int units_to_cover(double mw, double unit_mw) {
  if (mw <= kEps) return 0;
  return static_cast<int>(std::ceil(mw / unit_mw - kEps));
}

} // namespace

// ----------------------------- FillPolicy ------------------------------------
FillPolicy FillPolicy::recip_first() { return FillPolicy{}; }

FillPolicy FillPolicy::turbine_first() {
  FillPolicy p;
  p.name = "turbine_first";
  p.primary = {FillStep{Technology::Turbine}};
  p.fill = {Technology::Grid, Technology::Recip};
  return p;
}

FillPolicy FillPolicy::recip_then_grid(double recip_cap_mw, double grid_limit_mw) {
  FillPolicy p;
  p.name = "recip_then_grid";
  p.primary = {FillStep{Technology::Recip, recip_cap_mw}};
  p.fill = {Technology::Grid, Technology::Turbine};
  p.grid_import_limit_mw = grid_limit_mw;
  return p;
}

void hash_fill_policy(Fnv1a64& h, const FillPolicy& p) {
  h.update_string("powerplan.fill_policy.v1");
  h.update_string(p.name);
  h.update_u64(p.primary.size());
  for (const FillStep& step : p.primary) {
    h.update_enum(step.tech);
    h.update_f64(step.cap_mw);
  }
  h.update_u64(p.fill.size());
  for (Technology t : p.fill) h.update_enum(t);
  for (double v : {p.grid_import_limit_mw, p.bess_fraction, p.solar_fraction, p.max_solar_mw}) h.update_f64(v);
}

void FillPolicy::validate_or_throw() const {
  auto dispatchable = [](Technology t) { return is_thermal(t) || t == Technology::Grid; };
  for (const FillStep& s : primary) {
    if (!dispatchable(s.tech)) {
      throw ValidationError("FillPolicy '" + name + "': primary step must be recip, turbine or grid");
    }
    if (!(s.cap_mw >= 0.0)) throw ValidationError("FillPolicy '" + name + "': negative primary cap");
  }
  bool has_thermal_fill = false;
  for (Technology t : fill) {
    if (!dispatchable(t)) {
      throw ValidationError("FillPolicy '" + name + "': fill step must be recip, turbine or grid");
    }
    has_thermal_fill = has_thermal_fill || is_thermal(t);
  }
  if (!has_thermal_fill) {
    throw ValidationError("FillPolicy '" + name + "': fill order needs an uncapped thermal technology");
  }
  if (grid_import_limit_mw < 0.0) throw ValidationError("FillPolicy: grid_import_limit_mw < 0");
  if (bess_fraction < 0.0 || bess_fraction > 1.0) throw ValidationError("FillPolicy: bess_fraction must be [0,1]");
  if (solar_fraction < 0.0 || solar_fraction > 1.0) throw ValidationError("FillPolicy: solar_fraction must be [0,1]");
  if (max_solar_mw < 0.0) throw ValidationError("FillPolicy: max_solar_mw < 0");
}

// ----------------------------- EquipmentSizer --------------------------------
EquipmentSizer::EquipmentSizer(const EquipmentCatalog& catalog, FillPolicy policy)
    : catalog_(catalog), policy_(std::move(policy)) {
  policy_.validate_or_throw();
}

void EquipmentSizer::add_units(EquipmentConfig& cfg, Technology t, int n) const {
  if (t == Technology::Recip) cfg.set_recip_units(cfg.recip_units + n, catalog_);
  else if (t == Technology::Turbine) cfg.set_turbine_units(cfg.turbine_units + n, catalog_);
}

EquipmentConfig EquipmentSizer::size_equipment_to_load(double target_mw, bool require_n1) const {
  EquipmentConfig cfg;
  if (!(target_mw > 0.0)) return cfg;

  double remaining = target_mw;
  const double grid_limit = policy_.grid_import_limit_mw;

  auto take_grid = [&](double cap_mw) {
    if (grid_limit <= 0.0) return;
    const double headroom = std::min(cap_mw, grid_limit - cfg.grid_import_mw);
    const double g = std::clamp(remaining, 0.0, std::max(0.0, headroom));
    cfg.grid_import_mw += g;
    remaining -= g;
  };

  // 1) primary technologies
  for (const FillStep& step : policy_.primary) {
    if (remaining <= kEps) break;
    if (step.tech == Technology::Grid) {
      take_grid(step.cap_mw);
      continue;
    }
    const double unit = catalog_.at(step.tech).capacity_mw;
    int n = units_to_cover(remaining, unit);
    if (std::isfinite(step.cap_mw)) {
      n = std::min(n, static_cast<int>(std::floor(step.cap_mw / unit + kEps)));
    }
    add_units(cfg, step.tech, n);
    remaining -= n * unit;
  }

  // 2) fill order
  for (Technology t : policy_.fill) {
    if (remaining <= kEps) break;
    if (t == Technology::Grid) {
      take_grid(std::numeric_limits<double>::infinity());
      continue;
    }
    const double unit = catalog_.at(t).capacity_mw;
    const int n = units_to_cover(remaining, unit);
    add_units(cfg, t, n);
    remaining -= n * unit;
  }

  // 3) N-1
  if (require_n1) {
    Technology fallback = Technology::Recip;
    for (Technology t : policy_.fill) {
      if (is_thermal(t)) fallback = t;
    }
    for (int i = 0; i < kMaxN1Additions; ++i) {
      const double largest = cfg.largest_unit_mw(catalog_);
      if (cfg.firm_capacity_mw() - largest >= target_mw - kEps) break;

      Technology grow = fallback;
      double grow_unit = 0.0;
      for (Technology t : {Technology::Recip, Technology::Turbine}) {
        const int n = (t == Technology::Recip) ? cfg.recip_units : cfg.turbine_units;
        if (n > 0 && catalog_.at(t).capacity_mw > grow_unit) {
          grow = t;
          grow_unit = catalog_.at(t).capacity_mw;
        }
      }
      add_units(cfg, grow, 1);
    }
  }

  // 4) storage + solar
  if (policy_.bess_fraction > 0.0 && catalog_.has(Technology::Bess)) {
    const EquipmentSpec& bess = catalog_.at(Technology::Bess);
    cfg.bess_power_mw = policy_.bess_fraction * target_mw;
    cfg.bess_energy_mwh = cfg.bess_power_mw * bess.duration_hours;
  }
  if (policy_.solar_fraction > 0.0 && policy_.max_solar_mw > 0.0 && catalog_.has(Technology::Solar)) {
    cfg.solar_mw_dc = std::min(policy_.solar_fraction * target_mw, policy_.max_solar_mw);
  }
  return cfg;
}

} // namespace powerplan
