/*
  Fragment 2.4 - Load Model Selftest

  Framework-free checks for the seeded hourly shapes:
    1) Solar profile mean equals the capacity factor after clipping to 1,
       with every hour inside [0,1].
    2) A capacity factor above the daylight share saturates daylight hours;
       zero or negative capacity factors give an all-dark year.
    3) Solar and load profiles are deterministic for a seed.
    4) Load profile stays within [0, peak].

  Run: ./load_model_selftest (non-zero exit on failure)
*/

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/load_model.hpp"
#include "engine/core/units.hpp"

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

double mean_of(const std::vector<double>& v) {
  return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

bool within_unit_interval(const std::vector<double>& v) {
  return std::all_of(v.begin(), v.end(), [](double x) { return x >= 0.0 && x <= 1.0; });
}

void test_solar_mean_after_clipping() {
  const std::vector<double> p = hourly_solar_profile(0.25, 42);
  expect_true(p.size() == static_cast<size_t>(units::hours_per_year), "Solar profile has 8760 hours");
  expect_true(within_unit_interval(p), "Solar profile stays in [0,1]");
  expect_true(std::count(p.begin(), p.end(), 1.0) > 0, "Summer noon hours clip at 1 for cf 0.25");
  expect_near(mean_of(p), 0.25, 1e-6, "Clipped solar mean equals cf 0.25");

  const std::vector<double> low = hourly_solar_profile(0.05, 42);
  expect_near(mean_of(low), 0.05, 1e-6, "Unclipped solar mean equals cf 0.05");

  const std::vector<double> high = hourly_solar_profile(0.45, 7);
  expect_true(within_unit_interval(high), "High cf profile stays in [0,1]");
  expect_near(mean_of(high), 0.45, 1e-6, "Heavily clipped solar mean equals cf 0.45");
}

void test_solar_edges() {
  const std::vector<double> sat = hourly_solar_profile(0.9, 42);
  const double daylight_share = 13.0 / units::hours_per_day;
  expect_true(std::all_of(sat.begin(), sat.end(), [](double x) { return x == 0.0 || x == 1.0; }),
              "cf above the daylight share saturates every daylight hour");
  expect_near(mean_of(sat), daylight_share, 1e-12, "Saturated mean is the daylight share");
  expect_true(sat[0] == 0.0 && sat[12] == 1.0, "Midnight dark, noon saturated");

  const std::vector<double> dark = hourly_solar_profile(0.0, 42);
  expect_true(std::all_of(dark.begin(), dark.end(), [](double x) { return x == 0.0; }), "cf 0 -> no output");
  const std::vector<double> neg = hourly_solar_profile(-0.1, 42);
  expect_true(std::all_of(neg.begin(), neg.end(), [](double x) { return x == 0.0; }), "Negative cf -> no output");
}

void test_determinism() {
  expect_true(hourly_solar_profile(0.25, 42) == hourly_solar_profile(0.25, 42), "Solar profile repeats for a seed");
  expect_true(hourly_solar_profile(0.25, 42) != hourly_solar_profile(0.25, 43), "Seed changes the weather");
  expect_true(hourly_load_profile(100.0, 42) == hourly_load_profile(100.0, 42), "Load profile repeats for a seed");
}

void test_load_profile_bounds() {
  const std::vector<double> load = hourly_load_profile(100.0, 42);
  expect_true(load.size() == static_cast<size_t>(units::hours_per_year), "Load profile has 8760 hours");
  expect_true(std::all_of(load.begin(), load.end(), [](double x) { return x >= 0.0 && x <= 100.0; }),
              "Load stays in [0, peak]");
  expect_near(mean_of(load), 85.0, 1.0, "Mean load near the 0.85 baseline");

  const std::vector<double> none = hourly_load_profile(0.0, 42);
  expect_true(std::all_of(none.begin(), none.end(), [](double x) { return x == 0.0; }), "Zero peak -> zero load");
}

}  // namespace
}  // namespace powerplan

int main() {
  using namespace powerplan;

  test_solar_mean_after_clipping();
  test_solar_edges();
  test_determinism();
  test_load_profile_bounds();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
