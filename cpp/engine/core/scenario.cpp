#include "engine/core/scenario.hpp"

namespace powerplan {

namespace {

void hash_spec(Fnv1a64& h, const EquipmentSpec& s) {
  h.update_enum(s.technology);
  h.update_string(s.name);
  for (double v : {s.capacity_mw, s.heat_rate_btu_kwh, s.nox_lb_mwh, s.ramp_rate_mw_min,
                   s.start_time_cold_min, s.lead_time_months_min, s.lead_time_months_max,
                   s.capex_per_kw, s.capex_per_kwh, s.vom_per_mwh, s.fom_per_kw_yr,
                   s.availability_pct, s.land_acres_per_mw, s.duration_hours,
                   s.roundtrip_efficiency, s.capacity_factor}) {
    h.update_f64(v);
  }
}

void hash_params(Fnv1a64& h, const GlobalParameters& p) {
  for (double v : {p.discount_rate, p.fuel_price_mmbtu, p.fuel_escalation_rate, p.itc_rate,
                   p.voll_per_mwh, p.grid_price_mwh, p.bess_capacity_credit,
                   p.bess_degradation_per_kwh, p.bess_initial_soc, p.commissioning_offset_months,
                   p.planning_capacity_factor, p.alignment_factor, p.dr_eligibility_factor,
                   p.residual_value_pct, p.hybrid_purchase_share, p.solar_land_threshold_acres,
                   p.datacenter_mw_per_acre, p.substation_acres, p.infrastructure_land_pct}) {
    h.update_f64(v);
  }
  h.update_i64(p.project_life_years);
  h.update_u64(p.load_seed);
  h.update_u64(p.flex_scenarios.size());
  for (double f : p.flex_scenarios) h.update_f64(f);
}

void hash_site(Fnv1a64& h, const SiteConstraints& c) {
  for (double v : {c.nox_tpy, c.gas_supply_mcf_day, c.land_area_acres, c.min_availability,
                   c.min_ramp_mw_min, c.max_time_to_power_months, c.grid_capacity_mw}) {
    h.update_f64(v);
  }
  h.update_bool(c.n_minus_1_required);
  h.update_bool(c.grid_available_year.has_value());
  if (c.grid_available_year) h.update_i64(*c.grid_available_year);
}

} // namespace

Hash64 scenario_key(const Scenario& s) {
  Fnv1a64 h;
  h.update_string("powerplan.scenario.v1");
  h.update_string(s.site_name);

  h.update_u64(s.catalog.entries().size());
  for (const auto& [tech, spec] : s.catalog.entries()) hash_spec(h, spec);

  hash_params(h, s.params);
  hash_site(h, s.site);

  h.update_u64(s.trajectory.peak_mw_by_year.size());
  for (const auto& [year, mw] : s.trajectory.peak_mw_by_year) {
    h.update_i64(year);
    h.update_f64(mw);
  }
  h.update_u64(s.trajectory.workload_mix.size());
  for (const auto& [name, share] : s.trajectory.workload_mix) {
    h.update_string(name);
    h.update_f64(share);
  }
  h.update_u64(s.workloads.size());
  for (const auto& [name, p] : s.workloads) {
    h.update_string(name);
    h.update_f64(p.flexibility_pct);
    h.update_f64(p.ramp_factor);
  }
  return h.digest();
}

} // namespace powerplan
