#include "engine/core/load_model.hpp"

#include <algorithm>
#include <cmath>
#include <random>

#include "engine/core/errors.hpp"
#include "engine/core/units.hpp"

namespace powerplan {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr int kSolarScaleIterations = 100;
constexpr double kBaseLoadFraction = 0.85;
constexpr double kDailySwing = 0.05;
constexpr double kJitter = 0.05;
constexpr int kDailyPeakHour = 14;

const WorkloadProfile& lookup(const WorkloadTable& table, const std::string& name, bool* known) {
  auto it = table.find(name);
  if (it == table.end()) {
    if (known) *known = false;
    return kUnknownWorkload;
  }
  if (known) *known = true;
  return it->second;
}

} // namespace

WorkloadTable default_workload_table() {
  return WorkloadTable{
      {"pre_training",        {0.30, 0.00}},
      {"fine_tuning",         {0.50, 0.05}},
      {"batch_inference",     {0.90, 0.00}},
      {"real_time_inference", {0.05, 0.50}},
      {"cloud_hpc",           {0.25, 0.02}},
  };
}

// ----------------------------- LoadTrajectory --------------------------------
int LoadTrajectory::first_year() const {
  return peak_mw_by_year.empty() ? 0 : peak_mw_by_year.begin()->first;
}

int LoadTrajectory::last_year() const {
  return peak_mw_by_year.empty() ? 0 : peak_mw_by_year.rbegin()->first;
}

double LoadTrajectory::peak_in(int year) const {
  auto it = peak_mw_by_year.find(year);
  return it == peak_mw_by_year.end() ? 0.0 : it->second;
}

double LoadTrajectory::max_peak_mw() const {
  double m = 0.0;
  for (const auto& [year, mw] : peak_mw_by_year) m = std::max(m, mw);
  return m;
}

void LoadTrajectory::validate_or_throw() const {
  for (const auto& [year, mw] : peak_mw_by_year) {
    if (!std::isfinite(mw) || mw < 0.0) {
      throw ValidationError("LoadTrajectory: peak MW for " + std::to_string(year) +
                            " must be finite and >= 0");
    }
  }
  if (workload_mix.empty()) return;
  double sum = 0.0;
  for (const auto& [name, share] : workload_mix) {
    if (!(share >= 0.0 && share <= 1.0)) {
      throw ValidationError("LoadTrajectory: workload share for '" + name + "' must be [0,1]");
    }
    sum += share;
  }
  if (std::fabs(sum - 1.0) > 1e-6) {
    throw ValidationError("LoadTrajectory: workload shares must sum to 1");
  }
}

// ----------------------------- Workload roll-ups -----------------------------
double flexible_mw(double peak_mw, const std::map<std::string, double>& mix,
                   const WorkloadTable& table, std::vector<std::string>* unknown) {
  double total = 0.0;
  for (const auto& [name, share] : mix) {
    bool known = true;
    const WorkloadProfile& p = lookup(table, name, &known);
    if (!known) {
      if (unknown) unknown->push_back(name);
      continue;
    }
    total += peak_mw * share * p.flexibility_pct;
  }
  return total;
}

std::map<std::string, double> flexible_mw_by_workload(double peak_mw,
                                                      const std::map<std::string, double>& mix,
                                                      const WorkloadTable& table) {
  std::map<std::string, double> out;
  for (const auto& [name, share] : mix) {
    bool known = true;
    const WorkloadProfile& p = lookup(table, name, &known);
    out[name] = known ? peak_mw * share * p.flexibility_pct : 0.0;
  }
  return out;
}

double required_ramp_mw_min(double peak_mw, const std::map<std::string, double>& mix,
                            const WorkloadTable& table) {
  if (mix.empty()) return peak_mw * kUnknownWorkload.ramp_factor;
  double total = 0.0;
  for (const auto& [name, share] : mix) {
    total += peak_mw * share * lookup(table, name, nullptr).ramp_factor;
  }
  return total;
}

// ----------------------------- Profiles --------------------------------------
std::vector<double> hourly_load_profile(double peak_mw, uint64_t seed) {
  std::vector<double> load(units::hours_per_year, 0.0);
  if (!(peak_mw > 0.0)) return load;

  std::mt19937_64 rng(seed);
  std::uniform_real_distribution<double> jitter(-kJitter, kJitter);

  for (int h = 0; h < units::hours_per_year; ++h) {
    const int hod = h % units::hours_per_day;
    // cos peaks at hod == kDailyPeakHour
    const double daily =
        1.0 + kDailySwing * std::cos(2.0 * kPi * (hod - kDailyPeakHour) / units::hours_per_day);
    const double v = kBaseLoadFraction * peak_mw * daily * (1.0 + jitter(rng));
    load[h] = std::clamp(v, 0.0, peak_mw);
  }
  return load;
}

std::vector<double> hourly_solar_profile(double capacity_factor, uint64_t seed) {
  std::vector<double> shape(units::hours_per_year, 0.0);
  if (!(capacity_factor > 0.0)) return shape;

  std::mt19937_64 rng(seed ^ 0x5a5a5a5aull);
  std::uniform_real_distribution<double> weather(0.7, 1.0);

  double sum = 0.0;
  int lit_hours = 0;
  for (int day = 0; day < units::days_per_year; ++day) {
    const double seasonal = 0.7 + 0.3 * std::sin(2.0 * kPi * (day - 80) / units::days_per_year);
    const double w = weather(rng);
    for (int hod = 6; hod <= 18; ++hod) {
      const double x = hod - 12.0;
      const double v = std::exp(-(x * x) / 8.0) * seasonal * w * 0.9;
      shape[day * units::hours_per_day + hod] = v;
      sum += v;
      ++lit_hours;
    }
  }

  const double mean = sum / units::hours_per_year;
  if (mean <= 0.0) return shape;

  // Every lit hour at 1 is the most the shape can deliver.
  if (capacity_factor * units::hours_per_year >= lit_hours) {
    for (double& v : shape) v = v > 0.0 ? 1.0 : 0.0;
    return shape;
  }

  const auto clipped_mean = [&shape](double k) {
    double total = 0.0;
    for (double v : shape) total += std::min(1.0, v * k);
    return total / units::hours_per_year;
  };

  // Clipping at 1 removes energy, so grow the scale until the clipped mean
  // reaches capacity_factor, then bisect.
  double lo = capacity_factor / mean;
  double hi = lo;
  while (clipped_mean(hi) < capacity_factor) {
    lo = hi;
    hi *= 2.0;
  }
  for (int it = 0; it < kSolarScaleIterations && hi - lo > 1e-12 * hi; ++it) {
    const double mid = 0.5 * (lo + hi);
    if (clipped_mean(mid) < capacity_factor) lo = mid;
    else hi = mid;
  }

  for (double& v : shape) v = std::min(1.0, v * hi);
  return shape;
}

} // namespace powerplan
