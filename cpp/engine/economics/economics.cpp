#include "engine/economics/economics.hpp"

#include <cmath>
#include <limits>
#include <sstream>

#include "engine/core/logging.hpp"
#include "engine/core/units.hpp"

namespace powerplan {

namespace {

constexpr double kIrrLo = -0.99;
constexpr double kIrrHi = 10.0;
constexpr int kIrrMaxIter = 200;
constexpr double kIrrTol = 1e-10;

} // namespace

double capital_recovery_factor(double rate, int years) {
  if (years <= 0) return 1.0;
  if (std::fabs(rate) < 1e-12) return 1.0 / years;
  const double g = std::pow(1.0 + rate, years);
  return rate * g / (g - 1.0);
}

double npv(double rate, const std::vector<double>& flows) {
  double v = 0.0;
  double df = 1.0;
  for (double f : flows) {
    v += f * df;
    df /= (1.0 + rate);
  }
  return v;
}

std::optional<double> irr(const std::vector<double>& flows) {
  if (flows.size() < 2) return std::nullopt;
  double lo = kIrrLo, hi = kIrrHi;
  double f_lo = npv(lo, flows);
  const double f_hi = npv(hi, flows);
  if (!std::isfinite(f_lo) || !std::isfinite(f_hi) || f_lo * f_hi > 0.0) return std::nullopt;

  for (int i = 0; i < kIrrMaxIter; ++i) {
    const double mid = 0.5 * (lo + hi);
    const double f_mid = npv(mid, flows);
    if (std::fabs(f_mid) < kIrrTol || (hi - lo) < kIrrTol) return mid;
    if (f_lo * f_mid <= 0.0) {
      hi = mid;
    } else {
      lo = mid;
      f_lo = f_mid;
    }
  }
  return 0.5 * (lo + hi);
}

double annualize_fuel(double total_fuel, int active_years) {
  if (active_years <= 0) return 0.0;
  return total_fuel / active_years;
}

// ----------------------------- EconomicsCalculator ---------------------------
EconomicsCalculator::EconomicsCalculator(const EquipmentCatalog& catalog, const GlobalParameters& params,
                                         const DispatchSimulator& dispatch)
    : catalog_(catalog), params_(params), dispatch_(dispatch) {}

double EconomicsCalculator::calculate_capex(const EquipmentConfig& cfg) const {
  const double kw = units::kw_per_mw;
  const double itc_keep = 1.0 - params_.itc_rate;
  double capex = 0.0;
  if (cfg.recip_mw > 0.0) capex += cfg.recip_mw * kw * catalog_.at(Technology::Recip).capex_per_kw;
  if (cfg.turbine_mw > 0.0) capex += cfg.turbine_mw * kw * catalog_.at(Technology::Turbine).capex_per_kw;
  if (cfg.solar_mw_dc > 0.0) {
    capex += cfg.solar_mw_dc * kw * catalog_.at(Technology::Solar).capex_per_kw * itc_keep;
  }
  if (cfg.bess_energy_mwh > 0.0) {
    capex += cfg.bess_energy_mwh * kw * catalog_.at(Technology::Bess).capex_per_kwh * itc_keep;
  }
  if (cfg.grid_import_mw > 0.0) {
    capex += cfg.grid_import_mw * kw * catalog_.at(Technology::Grid).capex_per_kw;
  }
  return capex;
}

OpexBreakdown EconomicsCalculator::calculate_annual_opex(const EquipmentConfig& cfg,
                                                         const DispatchResult& dispatch,
                                                         double fuel_multiplier) const {
  OpexBreakdown o;
  for (Technology t : {Technology::Recip, Technology::Turbine, Technology::Bess, Technology::Solar}) {
    const double mw = cfg.mw(t);
    if (mw <= 0.0) continue;
    const EquipmentSpec& s = catalog_.at(t);
    o.fixed_om += mw * units::kw_per_mw * s.fom_per_kw_yr;
    o.variable_om += dispatch.stats(t).energy_mwh * s.vom_per_mwh;
  }
  o.fuel = dispatch.fuel_mmbtu * params_.fuel_price_mmbtu * fuel_multiplier;
  o.grid_energy = dispatch.stats(Technology::Grid).energy_mwh * params_.grid_price_mwh;
  o.bess_degradation =
      dispatch.stats(Technology::Bess).energy_mwh * units::kw_per_mw * params_.bess_degradation_per_kwh;
  return o;
}

OpexBreakdown EconomicsCalculator::calculate_annual_opex(const EquipmentConfig& cfg,
                                                         double reference_peak_mw) const {
  return calculate_annual_opex(cfg, dispatch_.simulate_peak(cfg, reference_peak_mw));
}

LcoeResult EconomicsCalculator::calculate_lcoe(const EquipmentConfig& cfg, const DispatchResult& dispatch,
                                               std::optional<double> annual_energy_mwh) const {
  LcoeResult r;
  r.capex = calculate_capex(cfg);
  r.annualized_capex = r.capex * crf();
  r.opex = calculate_annual_opex(cfg, dispatch);
  r.annual_cost = r.annualized_capex + r.opex.total();
  r.unserved_energy_mwh = dispatch.unserved_energy_mwh;
  r.unserved_energy_pct = dispatch.unserved_energy_pct;
  r.voll_adjusted_cost = r.annual_cost + r.unserved_energy_mwh * params_.voll_per_mwh;
  r.energy_delivered_mwh = annual_energy_mwh ? *annual_energy_mwh : dispatch.energy_delivered_mwh;

  if (!(r.energy_delivered_mwh > 0.0)) {
    r.lcoe = std::numeric_limits<double>::infinity();
    r.warnings.push_back("No energy delivered; LCOE undefined (reported as infinite cost)");
    log(LogLevel::WARN, "calculate_lcoe: zero delivered energy for " + summarize(cfg));
    return r;
  }
  r.lcoe = r.annual_cost / r.energy_delivered_mwh;

  if (r.unserved_energy_mwh > 0.0) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(2);
    oss << "Unserved energy " << r.unserved_energy_mwh << " MWh (" << r.unserved_energy_pct << "%)";
    r.warnings.push_back(oss.str());
  }
  return r;
}

LcoeResult EconomicsCalculator::calculate_lcoe(const EquipmentConfig& cfg, double reference_peak_mw,
                                               std::optional<double> annual_energy_mwh) const {
  return calculate_lcoe(cfg, dispatch_.simulate_peak(cfg, reference_peak_mw), annual_energy_mwh);
}

} // namespace powerplan
