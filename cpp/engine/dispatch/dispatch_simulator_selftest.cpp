/*
  Fragment 4.2 - Dispatch Simulator Selftest

  Framework-free checks for the hourly merit-order dispatch:
    1) Empty fleet: every MWh is unserved, nothing delivered.
    2) Merit order: cheapest thermal first, grid only when strictly cheaper.
    3) Ramp limits create unserved energy on steps and forced output on drops.
    4) Hourly energy balance with storage.
    5) simulate_peak() is deterministic.
    6) Delivered energy never exceeds available nameplate energy, per
       technology and for the whole mixed fleet.

  Run: ./dispatch_simulator_selftest (non-zero exit on failure)
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/equipment.hpp"
#include "engine/core/settings.hpp"
#include "engine/dispatch/dispatch_simulator.hpp"

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

EquipmentConfig recips(int n, const EquipmentCatalog& catalog) {
  EquipmentConfig cfg;
  cfg.set_recip_units(n, catalog);
  return cfg;
}

void test_empty_fleet() {
  const EquipmentCatalog catalog = EquipmentCatalog::defaults();
  const GlobalParameters params{};
  const DispatchSimulator sim(catalog, params);

  const DispatchResult r = sim.simulate(EquipmentConfig{}, std::vector<double>(24, 10.0));
  expect_near(r.energy_required_mwh, 240.0, 1e-9, "Empty fleet: required energy");
  expect_near(r.unserved_energy_mwh, 240.0, 1e-9, "Empty fleet: all energy unserved");
  expect_near(r.energy_delivered_mwh, 0.0, 1e-9, "Empty fleet: nothing delivered");
  expect_near(r.unserved_energy_pct, 100.0, 1e-9, "Empty fleet: 100% unserved");
  expect_true(r.hours_with_unserved == 24, "Empty fleet: every hour short");

  const DispatchResult z = sim.simulate_peak(recips(2, catalog), 0.0);
  expect_near(z.energy_required_mwh, 0.0, 1e-12, "Zero load: no required energy");
  expect_near(z.unserved_energy_pct, 0.0, 1e-12, "Zero load: unserved pct is 0, not NaN");
}

void test_merit_order() {
  const EquipmentCatalog catalog = EquipmentCatalog::defaults();
  GlobalParameters params{};
  const DispatchSimulator sim(catalog, params);

  EquipmentConfig cfg = recips(2, catalog);
  cfg.set_turbine_units(1, catalog);
  expect_true(marginal_cost_per_mwh(Technology::Recip, catalog, params) <
                  marginal_cost_per_mwh(Technology::Turbine, catalog, params),
              "Default recip marginal cost is below turbine");

  const DispatchResult r = sim.simulate(cfg, std::vector<double>(48, 30.0));
  expect_near(r.stats(Technology::Recip).energy_mwh, 30.0 * 48, 1e-9, "Cheaper recips carry the load");
  expect_near(r.stats(Technology::Turbine).energy_mwh, 0.0, 1e-9, "Turbine stays off");
  expect_true(r.stats(Technology::Recip).starts == 1, "One recip start from cold");
  expect_true(r.stats(Technology::Turbine).starts == 0, "No turbine starts");
  expect_true(r.fuel_mmbtu > 0.0 && r.gas_mcf > 0.0, "Thermal output burns fuel");

  params.grid_price_mwh = 20.0;
  const DispatchSimulator cheap_grid(catalog, params);
  EquipmentConfig with_grid = recips(2, catalog);
  with_grid.grid_import_mw = 50.0;
  const DispatchResult g = cheap_grid.simulate(with_grid, std::vector<double>(24, 30.0));
  expect_near(g.stats(Technology::Grid).energy_mwh, 30.0 * 24, 1e-9, "Cheaper grid runs first");
  expect_near(g.stats(Technology::Recip).energy_mwh, 0.0, 1e-9, "Recips idle behind cheaper grid");

  params.grid_price_mwh = 500.0;
  const DispatchSimulator dear_grid(catalog, params);
  const DispatchResult d = dear_grid.simulate(with_grid, std::vector<double>(24, 30.0));
  expect_near(d.stats(Technology::Grid).energy_mwh, 0.0, 1e-9, "Expensive grid stays off");
}

void test_ramp_limits() {
  EquipmentCatalog catalog = EquipmentCatalog::defaults();
  EquipmentSpec slow = catalog.at(Technology::Recip);
  slow.ramp_rate_mw_min = 0.01;  // 0.6 MW per hour per unit
  catalog.set(slow);
  const GlobalParameters params{};
  const DispatchSimulator sim(catalog, params);

  std::vector<double> load(40, 0.0);
  for (int h = 1; h <= 30; ++h) load[h] = 10.0;

  const DispatchResult r = sim.simulate(recips(1, catalog), load);
  expect_near(r.recip_mw[1], 0.6, 1e-9, "Ramp bounds the first loaded hour");
  expect_near(r.unserved_mw[1], 9.4, 1e-9, "Ramp shortfall is unserved");
  expect_true(r.unserved_energy_mwh > 0.0, "Slow ramp leaves unserved energy");
  expect_near(r.recip_mw[31], 10.0 - 0.6, 1e-9, "Ramp-down floor forces output after the drop");
  expect_near(r.curtailed_mw[31], 10.0 - 0.6, 1e-9, "Forced output with no load is curtailed");
  expect_true(r.stats(Technology::Recip).starts == 1, "One start across the step");
}

void test_energy_balance_with_storage() {
  const EquipmentCatalog catalog = EquipmentCatalog::defaults();
  const GlobalParameters params{};
  const DispatchSimulator sim(catalog, params);

  EquipmentConfig cfg = recips(5, catalog);  // 89.2 MW available
  cfg.bess_power_mw = 20.0;
  cfg.bess_energy_mwh = 80.0;

  std::vector<double> load;
  for (int h = 0; h < 96; ++h) load.push_back((h % 24) < 4 ? 100.0 : 60.0);
  const DispatchResult r = sim.simulate(cfg, load);

  bool balanced = true;
  bool soc_ok = true;
  for (size_t h = 0; h < load.size(); ++h) {
    const double supply = r.recip_mw[h] + r.turbine_mw[h] + r.grid_mw[h] + r.solar_mw[h] +
                          r.bess_discharge_mw[h] + r.unserved_mw[h];
    const double use = r.load_mw[h] + r.bess_charge_mw[h] + r.curtailed_mw[h];
    if (std::fabs(supply - use) > 1e-6) balanced = false;
    if (r.bess_soc_mwh[h] < -1e-9 || r.bess_soc_mwh[h] > cfg.bess_energy_mwh + 1e-9) soc_ok = false;
  }
  expect_true(balanced, "Hourly supply equals load + charge + curtailment");
  expect_true(soc_ok, "State of charge stays within [0, energy]");
  expect_true(r.stats(Technology::Bess).energy_mwh > 0.0, "Storage discharges in the shortfall hours");
  expect_true(r.energy_delivered_mwh <= r.energy_required_mwh + 1e-9, "Delivered never exceeds required");
  expect_near(r.energy_delivered_mwh, r.energy_required_mwh - r.unserved_energy_mwh, 1e-6,
              "Delivered = required - unserved");
  expect_near(r.fleet_ramp_mw_min, 5 * 3.0 + (20.0 / 50.0) * 50.0, 1e-9, "Fleet ramp includes BESS blocks");
}

void test_deterministic_peak() {
  const EquipmentCatalog catalog = EquipmentCatalog::defaults();
  const GlobalParameters params{};
  const DispatchSimulator sim(catalog, params);
  const EquipmentConfig cfg = recips(7, catalog);
  const DispatchResult a = sim.simulate_peak(cfg, 100.0);
  const DispatchResult b = sim.simulate_peak(cfg, 100.0);
  expect_true(a.load_mw.size() == 8760, "Peak simulation covers 8760 hours");
  expect_true(a.energy_delivered_mwh == b.energy_delivered_mwh && a.fuel_mmbtu == b.fuel_mmbtu,
              "simulate_peak is deterministic");
  expect_near(a.unserved_energy_mwh, 0.0, 1e-9, "128 MW of recips serves a 100 MW peak");
}

void test_delivered_bounded_by_available_capacity() {
  const EquipmentCatalog catalog = EquipmentCatalog::defaults();
  const GlobalParameters params{};
  const DispatchSimulator sim(catalog, params);

  EquipmentConfig cfg = recips(5, catalog);
  cfg.set_turbine_units(1, catalog);
  cfg.bess_power_mw = 20.0;
  cfg.bess_energy_mwh = 80.0;
  cfg.solar_mw_dc = 30.0;
  cfg.grid_import_mw = 20.0;

  const Technology techs[] = {Technology::Recip, Technology::Turbine, Technology::Bess, Technology::Solar,
                              Technology::Grid};
  double bound = 0.0;
  for (Technology t : techs) bound += cfg.mw(t) * 8760.0 * catalog.at(t).availability_pct;

  for (double peak : {50.0, 150.0, 300.0}) {
    const DispatchResult r = sim.simulate_peak(cfg, peak);
    const std::string at = " at " + std::to_string(static_cast<int>(peak)) + " MW";
    expect_true(r.energy_delivered_mwh <= bound + 1e-6, "Delivered <= sum(capacity * 8760 * availability)" + at);
    for (Technology t : techs) {
      expect_true(r.stats(t).energy_mwh <= cfg.mw(t) * 8760.0 * catalog.at(t).availability_pct + 1e-6,
                  std::string(to_string(t)) + " energy within its available capacity" + at);
    }
  }
}

}  // namespace
}  // namespace powerplan

int main() {
  using namespace powerplan;

  test_empty_fleet();
  test_merit_order();
  test_ramp_limits();
  test_energy_balance_with_storage();
  test_deterministic_peak();
  test_delivered_bounded_by_available_capacity();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
