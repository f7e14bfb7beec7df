/*
  Fragment 3.2 - Equipment Sizer Selftest

  Framework-free checks for size_equipment_to_load():
    1) Pure: identical inputs give identical configs.
    2) Firm capacity covers the target, with and without N-1.
    3) Monotonic firm capacity as the target grows.
    4) Non-positive targets give an empty config.
    5) Capped primary steps spill into the fill order.

  Run: ./equipment_sizer_selftest (non-zero exit on failure)
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

#include "engine/core/equipment.hpp"
#include "engine/sizing/equipment_sizer.hpp"

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

void test_deterministic() {
  const EquipmentCatalog catalog = EquipmentCatalog::defaults();
  const EquipmentSizer sizer(catalog, FillPolicy::recip_first());
  const EquipmentConfig a = sizer.size_equipment_to_load(137.0, true);
  const EquipmentConfig b = sizer.size_equipment_to_load(137.0, true);
  expect_true(a == b, "Sizing is deterministic");
}

void test_n1_counts() {
  const EquipmentCatalog catalog = EquipmentCatalog::defaults();
  const EquipmentSizer sizer(catalog, FillPolicy::recip_first());

  const EquipmentConfig plain = sizer.size_equipment_to_load(200.0, false);
  expect_true(plain.recip_units == 11, "200 MW without N-1 -> 11 recips");
  expect_true(plain.firm_capacity_mw() >= 200.0, "Firm capacity covers target without N-1");

  const EquipmentConfig n1 = sizer.size_equipment_to_load(200.0, true);
  expect_true(n1.recip_units == 12, "200 MW with N-1 -> 12 recips");
  expect_near(n1.recip_mw, 12 * 18.3, 1e-9, "Recip MW tracks unit count");
  expect_true(n1.firm_capacity_mw() - n1.largest_unit_mw(catalog) >= 200.0 - 1e-9,
              "Firm capacity survives loss of the largest unit");
  expect_near(n1.bess_power_mw, 20.0, 1e-9, "BESS power is 10% of target");
  expect_near(n1.bess_energy_mwh, 80.0, 1e-9, "BESS energy follows spec duration");
  expect_true(n1.solar_mw_dc == 0.0, "Solar disabled when max_solar_mw is 0");
}

void test_monotonic() {
  const EquipmentCatalog catalog = EquipmentCatalog::defaults();
  const EquipmentSizer sizer(catalog, FillPolicy::recip_first());
  double prev = 0.0;
  bool ok = true;
  for (double target = 5.0; target <= 400.0; target += 7.5) {
    const double firm = sizer.size_equipment_to_load(target, true).firm_capacity_mw();
    if (firm + 1e-9 < prev || firm < target) ok = false;
    prev = firm;
  }
  expect_true(ok, "Firm capacity is monotonic in target and always covers it");
}

void test_empty_target() {
  const EquipmentCatalog catalog = EquipmentCatalog::defaults();
  const EquipmentSizer sizer(catalog, FillPolicy::recip_first());
  expect_true(sizer.size_equipment_to_load(0.0, true).empty(), "Zero target -> empty config");
  expect_true(sizer.size_equipment_to_load(-10.0, true).empty(), "Negative target -> empty config");
  expect_true(sizer.size_equipment_to_load(std::numeric_limits<double>::quiet_NaN(), true).empty(),
              "NaN target -> empty config");
}

void test_capped_primary_and_grid() {
  const EquipmentCatalog catalog = EquipmentCatalog::defaults();
  const EquipmentSizer sizer(catalog, FillPolicy::recip_then_grid(60.0, 30.0));
  const EquipmentConfig cfg = sizer.size_equipment_to_load(100.0, false);
  expect_true(cfg.recip_units == 3, "Recip cap of 60 MW allows 3 units");
  expect_near(cfg.grid_import_mw, 30.0, 1e-9, "Grid fill limited to import limit");
  expect_true(cfg.turbine_units == 1, "Remaining shortfall rounded up in turbines");
  expect_true(cfg.firm_capacity_mw() >= 100.0, "Capped policy still covers target");

  const EquipmentConfig turb = sizer.with_policy(FillPolicy::turbine_first()).size_equipment_to_load(100.0, true);
  expect_true(turb.turbine_units == 3 && turb.recip_units == 0, "Turbine-first N-1 adds a third turbine");
}

void test_policy_validation() {
  FillPolicy bad = FillPolicy::recip_first();
  bad.fill = {Technology::Grid};
  bool threw = false;
  try {
    bad.validate_or_throw();
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(threw, "Fill order without thermal technology is rejected");
}

}  // namespace
}  // namespace powerplan

int main() {
  using namespace powerplan;

  test_deterministic();
  test_n1_counts();
  test_monotonic();
  test_empty_target();
  test_capped_primary_and_grid();
  test_policy_validation();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
