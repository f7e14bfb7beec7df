/*
  Fragment 5.2 - Economics Selftest

  Framework-free checks for CAPEX / OPEX / LCOE and the cash-flow helpers:
    1) CRF degenerate cases and a textbook value.
    2) NPV / IRR agree on a simple cash flow; IRR is absent without a sign change.
    3) ITC discounts solar and BESS capex only.
    4) Zero delivered energy gives the +inf LCOE sentinel and a warning.

  Run: ./economics_selftest (non-zero exit on failure)
*/

#include <cmath>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/equipment.hpp"
#include "engine/core/settings.hpp"
#include "engine/dispatch/dispatch_simulator.hpp"
#include "engine/economics/economics.hpp"

namespace powerplan {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void expect_near(double got, double exp, double tol, std::string_view msg) {
  if (!(std::fabs(got - exp) <= tol)) {
    fail(msg);
    std::cerr << "  expected " << exp << ", got " << got << "\n";
  } else {
    pass(msg);
  }
}

void test_crf() {
  expect_near(capital_recovery_factor(0.0, 20), 0.05, 1e-12, "CRF at zero rate is 1/n");
  expect_near(capital_recovery_factor(0.08, 0), 1.0, 1e-12, "CRF with no life is 1");
  expect_near(capital_recovery_factor(0.08, 20), 0.101852, 1e-6, "CRF(8%, 20y)");
}

void test_npv_irr() {
  const std::vector<double> flows{-100.0, 60.0, 60.0};
  expect_near(npv(0.0, flows), 20.0, 1e-12, "NPV at zero rate is the plain sum");
  const std::optional<double> r = irr(flows);
  expect_true(r.has_value(), "IRR found for a conventional cash flow");
  if (r) {
    expect_near(npv(*r, flows), 0.0, 1e-6, "NPV at IRR is zero");
    expect_near(*r, 0.130662, 1e-5, "IRR of -100, 60, 60");
  }
  expect_true(!irr({100.0, 10.0, 10.0}).has_value(), "No IRR without a sign change");
  expect_true(!irr({-100.0}).has_value(), "No IRR for a single flow");
}

void test_capex_itc() {
  const EquipmentCatalog catalog = EquipmentCatalog::defaults();
  GlobalParameters params{};
  const DispatchSimulator sim(catalog, params);
  const EconomicsCalculator econ(catalog, params, sim);

  EquipmentConfig recip;
  recip.set_recip_units(1, catalog);
  expect_near(econ.calculate_capex(recip), 18.3 * 1000.0 * 1650.0, 1e-6, "Recip capex has no ITC");

  EquipmentConfig storage;
  storage.bess_power_mw = 10.0;
  storage.bess_energy_mwh = 40.0;
  expect_near(econ.calculate_capex(storage), 40.0 * 1000.0 * 236.0 * 0.70, 1e-6, "BESS capex net of 30% ITC");

  EquipmentConfig solar;
  solar.solar_mw_dc = 10.0;
  expect_near(econ.calculate_capex(solar), 10.0 * 1000.0 * 950.0 * 0.70, 1e-6, "Solar capex net of 30% ITC");

  expect_near(econ.calculate_capex(EquipmentConfig{}), 0.0, 1e-12, "Empty config costs nothing");
}

void test_lcoe() {
  const EquipmentCatalog catalog = EquipmentCatalog::defaults();
  const GlobalParameters params{};
  const DispatchSimulator sim(catalog, params);
  const EconomicsCalculator econ(catalog, params, sim);

  EquipmentConfig cfg;
  cfg.set_recip_units(7, catalog);

  const LcoeResult zero = econ.calculate_lcoe(cfg, 0.0);
  expect_true(std::isinf(zero.lcoe) && zero.lcoe > 0.0, "Zero delivered energy -> +inf LCOE");
  expect_true(!zero.warnings.empty(), "Zero delivered energy -> warning");
  expect_true(zero.capex > 0.0, "Capex still reported with zero energy");

  const LcoeResult r = econ.calculate_lcoe(cfg, 100.0);
  expect_true(std::isfinite(r.lcoe) && r.lcoe > 0.0, "Served load -> finite positive LCOE");
  expect_near(r.annual_cost, r.capex * econ.crf() + r.opex.total(), 1e-6, "Annual cost = capex x CRF + opex");
  expect_near(r.lcoe, r.annual_cost / r.energy_delivered_mwh, 1e-9, "LCOE = annual cost / delivered MWh");
  expect_true(r.opex.fuel > 0.0 && r.opex.fixed_om > 0.0, "Fuel and fixed O&M present");

  const LcoeResult fixed = econ.calculate_lcoe(cfg, 100.0, 500000.0);
  expect_near(fixed.lcoe, fixed.annual_cost / 500000.0, 1e-9, "Explicit annual energy overrides dispatch");

  expect_near(annualize_fuel(300.0, 3), 100.0, 1e-12, "Fuel annualized over active years");
  expect_near(annualize_fuel(300.0, 0), 0.0, 1e-12, "No active years -> zero fuel");
}

}  // namespace
}  // namespace powerplan

int main() {
  using namespace powerplan;

  test_crf();
  test_npv_irr();
  test_capex_itc();
  test_lcoe();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
