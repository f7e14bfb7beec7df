#include "engine/dispatch/dispatch_simulator.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "engine/core/load_model.hpp"
#include "engine/core/units.hpp"

namespace powerplan {

namespace {

constexpr double kEps = 1e-9;

struct Dispatchable {
  Technology tech = Technology::Recip;
  double cap_mw = 0.0;        // after availability de-rate
  double ramp_mw_h = 0.0;     // max change per hour
  double marginal = 0.0;      // $/MWh
  std::vector<double>* series = nullptr;
  double prev_mw = 0.0;
  double out_mw = 0.0;        // this hour
};

} // namespace

double marginal_cost_per_mwh(Technology t, const EquipmentCatalog& catalog,
                             const GlobalParameters& params) {
  if (t == Technology::Grid) return params.grid_price_mwh;
  const EquipmentSpec& s = catalog.at(t);
  return s.fuel_mmbtu_per_mwh() * params.fuel_price_mmbtu + s.vom_per_mwh;
}

double fleet_ramp_capability_mw_min(const EquipmentConfig& cfg, const EquipmentCatalog& catalog) {
  double ramp = 0.0;
  if (cfg.recip_units > 0) ramp += cfg.recip_units * catalog.at(Technology::Recip).ramp_rate_mw_min;
  if (cfg.turbine_units > 0) ramp += cfg.turbine_units * catalog.at(Technology::Turbine).ramp_rate_mw_min;
  if (cfg.bess_power_mw > 0.0) {
    const EquipmentSpec& b = catalog.at(Technology::Bess);
    ramp += (cfg.bess_power_mw / b.capacity_mw) * b.ramp_rate_mw_min;
  }
  return ramp;
}

DispatchSimulator::DispatchSimulator(const EquipmentCatalog& catalog, const GlobalParameters& params)
    : catalog_(catalog), params_(params) {
  if (catalog_.has(Technology::Solar)) {
    solar_shape_ = hourly_solar_profile(catalog_.at(Technology::Solar).capacity_factor, params_.load_seed);
  }
}

DispatchResult DispatchSimulator::simulate_peak(const EquipmentConfig& cfg, double peak_mw) const {
  return simulate(cfg, hourly_load_profile(peak_mw, params_.load_seed));
}

DispatchResult DispatchSimulator::simulate(const EquipmentConfig& cfg,
                                           const std::vector<double>& hourly_load_mw) const {
  DispatchResult r;
  const size_t H = hourly_load_mw.size();
  r.load_mw.assign(H, 0.0);
  r.recip_mw.assign(H, 0.0);
  r.turbine_mw.assign(H, 0.0);
  r.solar_mw.assign(H, 0.0);
  r.bess_discharge_mw.assign(H, 0.0);
  r.bess_charge_mw.assign(H, 0.0);
  r.bess_soc_mwh.assign(H, 0.0);
  r.grid_mw.assign(H, 0.0);
  r.unserved_mw.assign(H, 0.0);
  r.curtailed_mw.assign(H, 0.0);

  r.fleet_ramp_mw_min = fleet_ramp_capability_mw_min(cfg, catalog_);
  if (cfg.thermal_mw() > 0.0) {
    double weighted = 0.0;
    if (cfg.recip_units > 0) weighted += cfg.recip_mw * catalog_.at(Technology::Recip).ramp_rate_mw_min;
    if (cfg.turbine_units > 0) weighted += cfg.turbine_mw * catalog_.at(Technology::Turbine).ramp_rate_mw_min;
    r.effective_ramp_mw_min = weighted / cfg.thermal_mw();
  }

  // Dispatchable fleet in merit order.
  std::vector<Dispatchable> fleet;
  auto add_thermal = [&](Technology t, int n_units, double mw, std::vector<double>* series) {
    if (n_units <= 0 || mw <= 0.0) return;
    const EquipmentSpec& s = catalog_.at(t);
    Dispatchable d;
    d.tech = t;
    d.cap_mw = mw * s.availability_pct;
    d.ramp_mw_h = n_units * s.ramp_rate_mw_min * units::minutes_per_hour;
    d.marginal = marginal_cost_per_mwh(t, catalog_, params_);
    d.series = series;
    fleet.push_back(d);
  };
  add_thermal(Technology::Recip, cfg.recip_units, cfg.recip_mw, &r.recip_mw);
  add_thermal(Technology::Turbine, cfg.turbine_units, cfg.turbine_mw, &r.turbine_mw);
  if (cfg.grid_import_mw > 0.0) {
    Dispatchable d;
    d.tech = Technology::Grid;
    d.cap_mw = cfg.grid_import_mw * catalog_.at(Technology::Grid).availability_pct;
    d.ramp_mw_h = std::numeric_limits<double>::infinity();
    d.marginal = marginal_cost_per_mwh(Technology::Grid, catalog_, params_);
    d.series = &r.grid_mw;
    fleet.push_back(d);
  }
  // Grid goes first only when strictly cheaper; ties keep thermal ahead.
  std::stable_sort(fleet.begin(), fleet.end(), [](const Dispatchable& a, const Dispatchable& b) {
    if (a.marginal != b.marginal) return a.marginal < b.marginal;
    return a.tech != Technology::Grid && b.tech == Technology::Grid;
  });

  // Storage
  const bool has_bess = cfg.bess_power_mw > 0.0 && cfg.bess_energy_mwh > 0.0;
  double bess_power = 0.0, bess_energy = 0.0, sqrt_eta = 1.0, soc = 0.0;
  if (has_bess) {
    const EquipmentSpec& b = catalog_.at(Technology::Bess);
    bess_power = cfg.bess_power_mw * b.availability_pct;
    bess_energy = cfg.bess_energy_mwh;
    sqrt_eta = std::sqrt(b.roundtrip_efficiency);
    soc = params_.bess_initial_soc * bess_energy;
  }

  double solar_avail_mw = 0.0;
  if (cfg.solar_mw_dc > 0.0 && !solar_shape_.empty()) {
    solar_avail_mw = cfg.solar_mw_dc * catalog_.at(Technology::Solar).availability_pct;
  }

  for (size_t h = 0; h < H; ++h) {
    const double load = std::max(0.0, hourly_load_mw[h]);
    r.load_mw[h] = load;
    double need = load;

    // 1) solar must-take
    const double solar = solar_avail_mw * (solar_shape_.empty() ? 0.0 : solar_shape_[h % solar_shape_.size()]);
    const double solar_served = std::min(solar, need);
    need -= solar_served;
    double excess_solar = solar - solar_served;

    // 2) merit order with ramp bounds
    double forced_surplus = 0.0;
    for (Dispatchable& d : fleet) {
      const double lo = std::max(0.0, d.prev_mw - d.ramp_mw_h);
      const double hi = std::min(d.cap_mw, d.prev_mw + d.ramp_mw_h);
      const double g = std::clamp(need, lo, std::max(lo, hi));
      const double served = std::min(g, need);
      need -= served;
      forced_surplus += g - served;
      d.out_mw = g;
    }

    // 3) storage discharge for the residual
    double discharge = 0.0;
    if (has_bess && need > kEps) {
      discharge = std::min({need, bess_power, soc * sqrt_eta});
      soc -= discharge / sqrt_eta;
      need -= discharge;
    }

    // 4) unserved
    const double unserved = need > kEps ? need : 0.0;

    // 5) reliability charging
    double charge = 0.0;
    if (has_bess && discharge <= kEps) {
      double room = std::min(bess_power, (bess_energy - soc) / sqrt_eta);
      auto take = [&](double avail) {
        const double c = std::clamp(avail, 0.0, std::max(0.0, room));
        room -= c;
        charge += c;
        return c;
      };
      excess_solar -= take(excess_solar);
      forced_surplus -= take(forced_surplus);
      for (Dispatchable& d : fleet) {
        if (room <= kEps) break;
        const double hi = std::min(d.cap_mw, d.prev_mw + d.ramp_mw_h);
        d.out_mw += take(hi - d.out_mw);
      }
      soc = std::min(bess_energy, soc + charge * sqrt_eta);
    }

    // Bookkeeping
    r.solar_mw[h] = solar - excess_solar;
    r.bess_discharge_mw[h] = discharge;
    r.bess_charge_mw[h] = charge;
    r.bess_soc_mwh[h] = soc;
    r.unserved_mw[h] = unserved;
    r.curtailed_mw[h] = excess_solar + forced_surplus;

    for (Dispatchable& d : fleet) {
      (*d.series)[h] = d.out_mw;
      if (is_thermal(d.tech) && d.prev_mw <= kEps && d.out_mw > kEps) ++r.stats(d.tech).starts;
      d.prev_mw = d.out_mw;
    }
  }

  // Aggregates
  auto sum = [](const std::vector<double>& v) {
    double s = 0.0;
    for (double x : v) s += x;
    return s;
  };
  r.energy_required_mwh = sum(r.load_mw);
  r.unserved_energy_mwh = sum(r.unserved_mw);
  r.energy_delivered_mwh = std::max(0.0, r.energy_required_mwh - r.unserved_energy_mwh);
  r.unserved_energy_pct = r.energy_required_mwh > 0.0
                              ? 100.0 * r.unserved_energy_mwh / r.energy_required_mwh
                              : 0.0;
  r.curtailed_mwh = sum(r.curtailed_mw);
  r.bess_charge_mwh = sum(r.bess_charge_mw);
  for (double u : r.unserved_mw) {
    if (u > kEps) ++r.hours_with_unserved;
    r.peak_unserved_mw = std::max(r.peak_unserved_mw, u);
  }

  r.stats(Technology::Recip).energy_mwh = sum(r.recip_mw);
  r.stats(Technology::Turbine).energy_mwh = sum(r.turbine_mw);
  r.stats(Technology::Solar).energy_mwh = sum(r.solar_mw);
  r.stats(Technology::Bess).energy_mwh = sum(r.bess_discharge_mw);
  r.stats(Technology::Grid).energy_mwh = sum(r.grid_mw);

  const double hours = static_cast<double>(units::hours_per_year);
  for (Technology t : kAllTechnologies) {
    const double nameplate = cfg.mw(t);
    TechDispatchStats& st = r.stats(t);
    st.capacity_factor = nameplate > 0.0 ? st.energy_mwh / (nameplate * hours) : 0.0;
    if (is_thermal(t) && nameplate > 0.0) {
      const EquipmentSpec& s = catalog_.at(t);
      r.fuel_mmbtu += st.energy_mwh * s.fuel_mmbtu_per_mwh();
      r.gas_mcf += st.energy_mwh * s.gas_mcf_per_mwh();
    }
  }
  return r;
}

} // namespace powerplan
