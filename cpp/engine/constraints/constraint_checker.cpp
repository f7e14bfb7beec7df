#include "engine/constraints/constraint_checker.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

#include "engine/core/logging.hpp"
#include "engine/core/units.hpp"

namespace powerplan {

namespace {

constexpr double kBindingUtilMax = 0.95;
constexpr double kBindingUtilMin = 1.05;
constexpr double kUnbounded = std::numeric_limits<double>::max();

std::string fmt2(double v) {
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(2);
  oss << v;
  return oss.str();
}

double overshoot(const ConstraintEval& e) {
  if (e.limit <= 0.0) return kUnbounded;
  return e.sense == ConstraintSense::Max ? (e.value - e.limit) / e.limit
                                         : (e.limit - e.value) / e.limit;
}

double cap_from_rate(double budget_per_year, double rate_per_mwh, double cf) {
  const double per_mw_year = units::hours_per_year * cf * rate_per_mwh;
  if (!(per_mw_year > 0.0)) return kUnbounded;
  return budget_per_year / per_mw_year;
}

} // namespace

const char* to_string(ConstraintSense s) noexcept {
  return s == ConstraintSense::Max ? "max" : "min";
}

const ConstraintEval* ConstraintReport::find(const std::string& name) const noexcept {
  for (const auto& e : status) {
    if (e.name == name) return &e;
  }
  return nullptr;
}

ConstraintEval evaluate_constraint(const std::string& name, const std::string& unit,
                                   ConstraintSense sense, double value, double limit,
                                   std::vector<std::string>* warnings) {
  ConstraintEval e;
  e.name = name;
  e.unit = unit;
  e.sense = sense;
  e.value = value;
  e.limit = limit;

  if (limit <= 0.0) {
    if (sense == ConstraintSense::Min) return e;  // no requirement
    e.violated = value > 0.0;
    e.utilization = value > 0.0 ? units::degenerate_utilization : 0.0;
    e.binding = e.violated;
    if (e.violated && warnings) {
      warnings->push_back(name + ": limit is zero; utilization reported as " +
                          fmt2(units::degenerate_utilization));
    }
    return e;
  }

  e.utilization = value / limit;
  if (sense == ConstraintSense::Max) {
    e.violated = value > limit;
    e.binding = e.violated || e.utilization >= kBindingUtilMax;
  } else {
    e.violated = value < limit;
    e.binding = e.violated || e.utilization <= kBindingUtilMin;
  }
  return e;
}

std::string select_binding_constraint(const std::vector<ConstraintEval>& evals) {
  const ConstraintEval* worst = nullptr;
  for (const auto& e : evals) {
    if (!e.violated) continue;
    if (!worst || overshoot(e) > overshoot(*worst)) worst = &e;
  }
  if (worst) return worst->name;

  const ConstraintEval* closest = nullptr;
  for (const auto& e : evals) {
    if (!closest || std::fabs(e.utilization - 1.0) < std::fabs(closest->utilization - 1.0)) {
      closest = &e;
    }
  }
  return closest ? closest->name : std::string();
}

ConstraintLimits ConstraintLimits::from_caps(double nox_cap_mw, double gas_cap_mw, double land_cap_mw) {
  ConstraintLimits l;
  l.nox_cap_mw = nox_cap_mw;
  l.gas_cap_mw = gas_cap_mw;
  l.land_cap_mw = land_cap_mw;
  l.max_firm_mw = std::min({nox_cap_mw, gas_cap_mw, land_cap_mw});
  if (l.max_firm_mw == nox_cap_mw) l.binding = "nox";
  else if (l.max_firm_mw == gas_cap_mw) l.binding = "gas";
  else l.binding = "land";
  return l;
}

// ----------------------------- ConstraintChecker -----------------------------
ConstraintChecker::ConstraintChecker(const EquipmentCatalog& catalog, const GlobalParameters& params,
                                     const SiteConstraints& site, const WorkloadTable& workloads,
                                     const DispatchSimulator& dispatch)
    : catalog_(catalog), params_(params), site_(site), workloads_(workloads), dispatch_(dispatch) {}

double ConstraintChecker::aggregate_availability(const EquipmentConfig& cfg) const {
  double all_down = 1.0;
  auto fold = [&](Technology t, double n) {
    if (n <= 0.0) return;
    all_down *= std::pow(1.0 - catalog_.at(t).availability_pct, n);
  };
  fold(Technology::Recip, cfg.recip_units);
  fold(Technology::Turbine, cfg.turbine_units);
  if (cfg.bess_power_mw > 0.0) {
    fold(Technology::Bess, std::ceil(cfg.bess_power_mw / catalog_.at(Technology::Bess).capacity_mw));
  }
  if (cfg.grid_import_mw > 0.0) fold(Technology::Grid, 1.0);
  if (all_down >= 1.0) return 0.0;  // no firm units at all
  return 1.0 - all_down;
}

double ConstraintChecker::time_to_power_months(const EquipmentConfig& cfg) const {
  double lead = 0.0;
  for (Technology t : {Technology::Recip, Technology::Turbine, Technology::Bess, Technology::Solar}) {
    if (cfg.mw(t) > 0.0) lead = std::max(lead, catalog_.at(t).lead_time_months_max);
  }
  return lead + params_.commissioning_offset_months;
}

double ConstraintChecker::land_use_acres(const EquipmentConfig& cfg) const {
  double acres = 0.0;
  for (Technology t : {Technology::Recip, Technology::Turbine, Technology::Bess, Technology::Solar}) {
    const double mw = cfg.mw(t);
    if (mw > 0.0) acres += mw * catalog_.at(t).land_acres_per_mw;
  }
  return acres;
}

ConstraintReport ConstraintChecker::check_constraints(const EquipmentConfig& cfg, double peak_mw,
                                                      const std::map<std::string, double>& workload_mix) const {
  return check_constraints(cfg, dispatch_.simulate_peak(cfg, peak_mw), peak_mw, workload_mix);
}

ConstraintReport ConstraintChecker::check_constraints(const EquipmentConfig& cfg, const DispatchResult& dispatch,
                                                      double peak_mw,
                                                      const std::map<std::string, double>& workload_mix) const {
  ConstraintReport rep;
  std::vector<std::string>& warn = rep.analysis.warnings;

  // Emissions + fuel from dispatched thermal energy
  double nox_lb = 0.0;
  for (Technology t : {Technology::Recip, Technology::Turbine}) {
    if (cfg.mw(t) > 0.0) nox_lb += dispatch.stats(t).energy_mwh * catalog_.at(t).nox_lb_mwh;
  }
  const double nox_tpy = nox_lb / units::lb_per_short_ton;
  const double gas_mcf_day = dispatch.gas_mcf / units::days_per_year;

  rep.status.push_back(evaluate_constraint("nox", "tpy", ConstraintSense::Max, nox_tpy, site_.nox_tpy, &warn));
  rep.status.push_back(
      evaluate_constraint("gas", "mcf_day", ConstraintSense::Max, gas_mcf_day, site_.gas_supply_mcf_day, &warn));
  rep.status.push_back(
      evaluate_constraint("land", "acres", ConstraintSense::Max, land_use_acres(cfg), site_.land_area_acres, &warn));

  if (site_.n_minus_1_required && peak_mw > 0.0) {
    const double n1 = cfg.credited_firm_mw(params_.bess_capacity_credit) - cfg.largest_unit_mw(catalog_);
    rep.status.push_back(evaluate_constraint("n_minus_1", "mw", ConstraintSense::Min, n1, peak_mw, &warn));
  }

  if (site_.min_availability > 0.0) {
    rep.status.push_back(evaluate_constraint("availability", "fraction", ConstraintSense::Min,
                                             aggregate_availability(cfg), site_.min_availability, &warn));
  }

  const double ramp_req = site_.min_ramp_mw_min > 0.0
                              ? site_.min_ramp_mw_min
                              : required_ramp_mw_min(peak_mw, workload_mix, workloads_);
  if (ramp_req > 0.0) {
    rep.status.push_back(evaluate_constraint("ramp", "mw_min", ConstraintSense::Min,
                                             dispatch.fleet_ramp_mw_min, ramp_req, &warn));
  }

  rep.status.push_back(evaluate_constraint("time_to_power", "months", ConstraintSense::Max,
                                           time_to_power_months(cfg), site_.max_time_to_power_months, &warn));

  for (const auto& e : rep.status) {
    if (e.sense == ConstraintSense::Max) {
      rep.analysis.max_utilization = std::max(rep.analysis.max_utilization, e.utilization);
    }
    if (!e.violated) continue;
    if (e.sense == ConstraintSense::Max) {
      rep.violations.push_back(e.name + ": " + fmt2(e.value) + " " + e.unit + " exceeds limit of " +
                               fmt2(e.limit) + " " + e.unit);
    } else {
      rep.violations.push_back(e.name + ": " + fmt2(e.value) + " " + e.unit + " below required " +
                               fmt2(e.limit) + " " + e.unit);
    }
  }
  rep.analysis.binding_constraint = select_binding_constraint(rep.status);

  if (!rep.violations.empty()) {
    log(LogLevel::DEBUG, "check_constraints: " + std::to_string(rep.violations.size()) +
                             " violation(s), binding=" + rep.analysis.binding_constraint);
  }
  return rep;
}

ConstraintLimits ConstraintChecker::calculate_constraint_limits(Technology primary) const {
  const EquipmentSpec& s = catalog_.at(primary);
  const double cf = params_.planning_capacity_factor;

  const double nox_cap = cap_from_rate(site_.nox_tpy * units::lb_per_short_ton, s.nox_lb_mwh, cf);
  const double gas_cap = cap_from_rate(site_.gas_supply_mcf_day * units::days_per_year, s.gas_mcf_per_mwh(), cf);
  const double land_cap = s.land_acres_per_mw > 0.0 ? site_.land_area_acres / s.land_acres_per_mw : kUnbounded;

  return ConstraintLimits::from_caps(nox_cap, gas_cap, land_cap);
}

LandAllocation ConstraintChecker::allocate_land(double peak_mw) const {
  LandAllocation a;
  a.total_acres = site_.land_area_acres;
  a.datacenter_acres = std::max(0.0, peak_mw) / params_.datacenter_mw_per_acre;
  a.substation_acres = params_.substation_acres;
  a.infrastructure_acres = a.total_acres * params_.infrastructure_land_pct;
  a.equipment_acres =
      std::max(0.0, a.total_acres - a.datacenter_acres - a.substation_acres - a.infrastructure_acres);
  a.solar_allowed = a.equipment_acres >= params_.solar_land_threshold_acres;
  return a;
}

} // namespace powerplan
