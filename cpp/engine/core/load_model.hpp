#pragma once
/*
================================================================================
Fragment 2.2 - Core: Load Model
FILE: cpp/engine/core/load_model.hpp

Purpose:
  - LoadTrajectory: year -> facility peak MW, plus the workload mix.
  - WorkloadProfile table: flexibility + ramp factor per workload type.
  - Deterministic 8760 synthetic load and solar shapes.

Hardening:
  - Profiles are seeded (std::mt19937_64) so identical inputs always give
    identical series.
  - Workload shares are validated to [0,1] and must sum to 1 when present.
================================================================================
*/

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace powerplan {

struct WorkloadProfile {
  double flexibility_pct = 0.0;  // share of the workload's MW that can curtail
  double ramp_factor = 0.0;      // MW/min required per MW of workload
};

// Workload name -> profile. Unknown names fall back to kUnknownWorkload.
using WorkloadTable = std::map<std::string, WorkloadProfile>;

WorkloadTable default_workload_table();
inline constexpr WorkloadProfile kUnknownWorkload{0.0, 0.10};

struct LoadTrajectory {
  std::map<int, double> peak_mw_by_year;
  std::map<std::string, double> workload_mix;  // name -> share

  bool empty() const { return peak_mw_by_year.empty(); }
  int first_year() const;
  int last_year() const;
  double peak_in(int year) const;  // 0 for years outside the trajectory
  double max_peak_mw() const;

  void validate_or_throw() const;
};

// Flexible MW = sum(peak * share * flexibility_pct). Unknown workloads are
// listed in *unknown (if non-null) and contribute nothing.
double flexible_mw(double peak_mw, const std::map<std::string, double>& mix,
                   const WorkloadTable& table, std::vector<std::string>* unknown = nullptr);

// Per-workload flexible MW.
std::map<std::string, double> flexible_mw_by_workload(double peak_mw,
                                                      const std::map<std::string, double>& mix,
                                                      const WorkloadTable& table);

// Ramp requirement (MW/min) implied by the workload mix.
double required_ramp_mw_min(double peak_mw, const std::map<std::string, double>& mix,
                            const WorkloadTable& table);

// 8760 hourly load (MW): 0.85 * peak baseline, +/-5% daily shape peaking at
// hour 14, +/-5% seeded jitter, clipped to [0, peak].
std::vector<double> hourly_load_profile(double peak_mw, uint64_t seed);

// 8760 per-MWdc solar output in [0,1]. The shape is scaled so that its mean
// after clipping to 1 equals capacity_factor. A capacity_factor at or above
// the daylight share of the year saturates every daylight hour at 1.
std::vector<double> hourly_solar_profile(double capacity_factor, uint64_t seed);

} // namespace powerplan
