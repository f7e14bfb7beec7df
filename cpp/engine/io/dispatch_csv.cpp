#include "engine/io/dispatch_csv.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace powerplan {

namespace {

std::string csv_double(double x, int precision) {
  if (!std::isfinite(x)) return "";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

double at_or_zero(const std::vector<double>& v, size_t i) { return i < v.size() ? v[i] : 0.0; }

bool write_text(const std::string& text, const std::string& file_path) {
  std::ofstream f(file_path, std::ios::out | std::ios::trunc);
  if (!f.is_open()) return false;
  f << text;
  f.close();
  return !f.fail();
}

} // namespace

std::string dispatch_to_csv(const DispatchResult& d, const CsvExportOptions& opt) {
  const char c = opt.delimiter;
  std::ostringstream os;
  if (opt.include_header) {
    os << "hour" << c << "load_mw" << c << "recip_mw" << c << "turbine_mw" << c << "solar_mw" << c
       << "bess_discharge_mw" << c << "bess_charge_mw" << c << "bess_soc_mwh" << c << "grid_mw" << c
       << "unserved_mw" << c << "curtailed_mw" << "\n";
  }

  const int p = opt.precision;
  for (size_t h = 0; h < d.load_mw.size(); ++h) {
    os << h << c << csv_double(d.load_mw[h], p) << c << csv_double(at_or_zero(d.recip_mw, h), p) << c
       << csv_double(at_or_zero(d.turbine_mw, h), p) << c << csv_double(at_or_zero(d.solar_mw, h), p) << c
       << csv_double(at_or_zero(d.bess_discharge_mw, h), p) << c
       << csv_double(at_or_zero(d.bess_charge_mw, h), p) << c
       << csv_double(at_or_zero(d.bess_soc_mwh, h), p) << c << csv_double(at_or_zero(d.grid_mw, h), p) << c
       << csv_double(at_or_zero(d.unserved_mw, h), p) << c << csv_double(at_or_zero(d.curtailed_mw, h), p)
       << "\n";
  }
  return os.str();
}

std::string annual_stack_to_csv(const std::vector<AnnualStackRow>& rows, const CsvExportOptions& opt) {
  const char c = opt.delimiter;
  std::ostringstream os;
  if (opt.include_header) {
    os << "year" << c << "peak_mw" << c << "recip_units" << c << "turbine_units" << c << "recip_mw" << c
       << "turbine_mw" << c << "bess_power_mw" << c << "bess_energy_mwh" << c << "solar_mw_dc" << c
       << "grid_import_mw" << c << "capex_added_usd" << c << "capex_cumulative_usd" << c << "opex_usd" << c
       << "fuel_cost_usd" << c << "annual_cost_usd" << c << "energy_required_mwh" << c
       << "energy_delivered_mwh" << c << "unserved_energy_mwh" << c << "unserved_energy_pct" << c
       << "annual_lcoe_usd_mwh" << c << "grid_available" << "\n";
  }

  const int p = opt.precision;
  for (const AnnualStackRow& r : rows) {
    const EquipmentConfig& e = r.equipment;
    os << r.year << c << csv_double(r.peak_mw, p) << c << e.recip_units << c << e.turbine_units << c
       << csv_double(e.recip_mw, p) << c << csv_double(e.turbine_mw, p) << c
       << csv_double(e.bess_power_mw, p) << c << csv_double(e.bess_energy_mwh, p) << c
       << csv_double(e.solar_mw_dc, p) << c << csv_double(e.grid_import_mw, p) << c
       << csv_double(r.capex_added, p) << c << csv_double(r.capex_cumulative, p) << c
       << csv_double(r.opex, p) << c << csv_double(r.fuel_cost, p) << c << csv_double(r.annual_cost, p) << c
       << csv_double(r.energy_required_mwh, p) << c << csv_double(r.energy_delivered_mwh, p) << c
       << csv_double(r.unserved_energy_mwh, p) << c << csv_double(r.unserved_energy_pct, p) << c
       << csv_double(r.annual_lcoe, p) << c << (r.grid_available ? "true" : "false") << "\n";
  }
  return os.str();
}

bool write_dispatch_csv_file(const DispatchResult& d, const std::string& file_path,
                             const CsvExportOptions& opt) {
  return write_text(dispatch_to_csv(d, opt), file_path);
}

bool write_annual_stack_csv_file(const std::vector<AnnualStackRow>& rows, const std::string& file_path,
                                 const CsvExportOptions& opt) {
  return write_text(annual_stack_to_csv(rows, opt), file_path);
}

} // namespace powerplan
