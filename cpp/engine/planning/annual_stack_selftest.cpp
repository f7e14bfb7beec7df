/*
  Fragment 7.2 - Annual Stack Selftest

  Framework-free checks for optimize_annual_energy_stack():
    1) The fleet only grows; shrinking load adds no capex.
    2) Sum of per-year capex equals the capex of the final fleet.
    3) Blended LCOE is finite for a served trajectory, +inf when empty.
    4) Existing equipment is sunk cost.
    5) Zero-load years keep the fleet and report +inf annual LCOE.

  Run: ./annual_stack_selftest (non-zero exit on failure)
*/

#include <cmath>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#include "engine/core/equipment.hpp"
#include "engine/core/load_model.hpp"
#include "engine/core/settings.hpp"
#include "engine/dispatch/dispatch_simulator.hpp"
#include "engine/economics/economics.hpp"
#include "engine/planning/annual_stack.hpp"
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

struct Fixture {
  EquipmentCatalog catalog = EquipmentCatalog::defaults();
  GlobalParameters params{};
  SiteConstraints site{};
  DispatchSimulator dispatch{catalog, params};
  EconomicsCalculator economics{catalog, params, dispatch};
  EquipmentSizer sizer{catalog, FillPolicy::recip_first()};
  AnnualStackBuilder builder{sizer, dispatch, economics, params, site};
};

LoadTrajectory trajectory(std::initializer_list<std::pair<const int, double>> years) {
  LoadTrajectory t;
  t.peak_mw_by_year = years;
  return t;
}

void test_growth_only() {
  Fixture f;
  const AnnualStackResult r =
      f.builder.optimize_annual_energy_stack(trajectory({{2027, 100.0}, {2028, 200.0}, {2029, 150.0}}));

  expect_true(r.rows.size() == 3, "One row per trajectory year");
  expect_true(r.active_years == 3, "Three years with load");
  expect_true(r.rows[0].equipment.recip_units <= r.rows[1].equipment.recip_units, "Fleet grows with load");
  expect_true(r.rows[2].equipment == r.rows[1].equipment, "Fleet does not shrink when load falls");
  expect_near(r.rows[2].capex_added, 0.0, 1e-9, "No capex added in a shrinking year");
  expect_true(r.rows[1].capex_added > 0.0, "Growth year adds capex");
  expect_near(r.rows[2].capex_cumulative, r.rows[1].capex_cumulative, 1e-6, "Cumulative capex carried forward");

  double sum_added = 0.0;
  for (const AnnualStackRow& row : r.rows) sum_added += row.capex_added;
  expect_near(sum_added, f.economics.calculate_capex(r.final_equipment), 1e-3,
              "Per-year capex sums to the final fleet capex");
  expect_near(r.total_capex, sum_added, 1e-6, "total_capex is the sum of additions");

  expect_true(std::isfinite(r.blended_lcoe) && r.blended_lcoe > 0.0, "Blended LCOE is finite and positive");
  expect_true(r.npv_total_cost > 0.0, "Discounted cost is positive");
  expect_near(r.final_peak_mw, 150.0, 1e-12, "Final peak is the last loaded year");
  expect_true(r.final_dispatch.load_mw.size() == 8760, "Final dispatch kept for the last year");
}

void test_empty_and_zero_years() {
  Fixture f;
  const AnnualStackResult empty = f.builder.optimize_annual_energy_stack(LoadTrajectory{});
  expect_true(std::isinf(empty.blended_lcoe), "Empty trajectory -> +inf blended LCOE");
  expect_true(!empty.warnings.empty(), "Empty trajectory warns");

  const AnnualStackResult gap = f.builder.optimize_annual_energy_stack(trajectory({{2027, 100.0}, {2028, 0.0}}));
  expect_true(gap.active_years == 1, "Zero-load year is not active");
  expect_true(std::isinf(gap.rows[1].annual_lcoe), "Zero-load year reports +inf annual LCOE");
  expect_true(gap.rows[1].equipment == gap.rows[0].equipment, "Zero-load year keeps the fleet");
  expect_true(gap.rows[1].annual_cost > 0.0, "Zero-load year still carries capital recovery");

  const AnnualStackResult none = f.builder.optimize_annual_energy_stack(trajectory({{2027, 0.0}}));
  expect_true(std::isinf(none.blended_lcoe), "No delivered energy -> +inf blended LCOE");
}

void test_existing_is_sunk() {
  Fixture f;
  const EquipmentConfig existing = f.sizer.size_equipment_to_load(200.0, true);
  const AnnualStackResult r =
      f.builder.optimize_annual_energy_stack(trajectory({{2027, 150.0}, {2028, 180.0}}), existing);
  expect_near(r.total_capex, 0.0, 1e-9, "Existing fleet already covers load -> no new capex");
  expect_true(r.final_equipment == existing, "Existing fleet unchanged");
}

void test_grid_availability() {
  Fixture f;
  f.site.grid_capacity_mw = 50.0;
  f.site.grid_available_year = 2029;
  const FillPolicy policy = FillPolicy::recip_then_grid(60.0, 50.0);
  const AnnualStackResult r =
      f.builder.optimize_annual_energy_stack(trajectory({{2028, 100.0}, {2029, 120.0}}), policy);
  expect_true(!r.rows[0].grid_available && r.rows[1].grid_available, "Grid flag follows availability year");
  expect_near(r.rows[0].equipment.grid_import_mw, 0.0, 1e-12, "No grid import before availability");
  expect_true(r.rows[1].equipment.grid_import_mw > 0.0, "Grid import used once available");
}

}  // namespace
}  // namespace powerplan

int main() {
  using namespace powerplan;

  test_growth_only();
  test_empty_and_zero_years();
  test_existing_is_sunk();
  test_grid_availability();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
