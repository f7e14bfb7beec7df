#pragma once
/*
================================================================================
Fragment 6.1 - Constraints: Site Constraint Checker + Firm-Capacity Limits
FILE: cpp/engine/constraints/constraint_checker.hpp

Purpose:
  - check_constraints(): evaluate NOx, gas, land, N-1, availability, ramp
    and time-to-power for an EquipmentConfig against SiteConstraints.
  - calculate_constraint_limits(): max firm MW independently implied by the
    NOx cap, gas supply and land area; binding = the smallest.
  - allocate_land(): site land budget (datacenter, substation,
    infrastructure, equipment remainder, solar eligibility).

Evaluation rules (per constraint):
  - utilization = value / limit
  - Max sense: violated when value > limit; binding when utilization >= 0.95
  - Min sense: violated when value < limit; binding when utilization <= 1.05
  - limit <= 0 on a Max constraint: utilization 0 (value 0) or 999 + warning
  - Min constraints with limit <= 0 are not evaluated

Overall binding constraint: the violated constraint with the largest
relative overshoot, else the one with utilization closest to 1.

Hardening:
  - Never throws for infeasible plans; violations are returned.
  - Deterministic evaluation order: nox, gas, land, n_minus_1,
    availability, ramp, time_to_power.
================================================================================
*/

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "engine/core/equipment.hpp"
#include "engine/core/load_model.hpp"
#include "engine/core/settings.hpp"
#include "engine/dispatch/dispatch_simulator.hpp"

namespace powerplan {

enum class ConstraintSense : std::uint8_t {
  Max = 0,  // value <= limit
  Min = 1   // value >= limit
};

const char* to_string(ConstraintSense s) noexcept;

struct ConstraintEval {
  std::string name;
  std::string unit;
  ConstraintSense sense = ConstraintSense::Max;
  double value = 0.0;
  double limit = 0.0;
  double utilization = 0.0;
  bool binding = false;
  bool violated = false;
};

struct ConstraintAnalysis {
  std::string binding_constraint;  // empty when nothing was evaluated
  double max_utilization = 0.0;    // among Max-sense constraints
  std::vector<std::string> warnings;
};

struct ConstraintReport {
  std::vector<ConstraintEval> status;
  std::vector<std::string> violations;
  ConstraintAnalysis analysis;

  bool feasible() const noexcept { return violations.empty(); }
  const ConstraintEval* find(const std::string& name) const noexcept;
};

// Single-constraint evaluation. Appends to *warnings for degenerate limits.
ConstraintEval evaluate_constraint(const std::string& name, const std::string& unit,
                                   ConstraintSense sense, double value, double limit,
                                   std::vector<std::string>* warnings);

// Overall binding constraint name per the rule above ("" for an empty list).
std::string select_binding_constraint(const std::vector<ConstraintEval>& evals);

struct ConstraintLimits {
  double nox_cap_mw = 0.0;
  double gas_cap_mw = 0.0;
  double land_cap_mw = 0.0;
  double max_firm_mw = 0.0;
  std::string binding;  // "nox" | "gas" | "land"; ties resolve in that order

  static ConstraintLimits from_caps(double nox_cap_mw, double gas_cap_mw, double land_cap_mw);
};

struct LandAllocation {
  double total_acres = 0.0;
  double datacenter_acres = 0.0;
  double substation_acres = 0.0;
  double infrastructure_acres = 0.0;
  double equipment_acres = 0.0;     // remainder available for generation
  bool solar_allowed = false;       // remainder >= solar threshold
};

class ConstraintChecker {
 public:
  ConstraintChecker(const EquipmentCatalog& catalog, const GlobalParameters& params,
                    const SiteConstraints& site, const WorkloadTable& workloads,
                    const DispatchSimulator& dispatch);

  ConstraintReport check_constraints(const EquipmentConfig& cfg, const DispatchResult& dispatch,
                                     double peak_mw,
                                     const std::map<std::string, double>& workload_mix) const;

  // Runs a dispatch at peak_mw first.
  ConstraintReport check_constraints(const EquipmentConfig& cfg, double peak_mw,
                                     const std::map<std::string, double>& workload_mix) const;

  // Caps for a single thermal technology running at planning_capacity_factor.
  ConstraintLimits calculate_constraint_limits(Technology primary) const;

  LandAllocation allocate_land(double peak_mw) const;

  // Parallel-redundancy availability 1 - prod(1 - a_i) over every firm unit.
  double aggregate_availability(const EquipmentConfig& cfg) const;

  // Max on-site lead time (months) + commissioning offset.
  double time_to_power_months(const EquipmentConfig& cfg) const;

  double land_use_acres(const EquipmentConfig& cfg) const;

  const SiteConstraints& site() const noexcept { return site_; }

 private:
  const EquipmentCatalog& catalog_;
  const GlobalParameters& params_;
  const SiteConstraints& site_;
  const WorkloadTable& workloads_;
  const DispatchSimulator& dispatch_;
};

} // namespace powerplan
