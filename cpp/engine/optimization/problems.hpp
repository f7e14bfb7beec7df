#pragma once
/*
================================================================================
Fragment 8.2 - Optimization: Problem Variants + Factory
FILE: cpp/engine/optimization/problems.hpp

Purpose:
  - One tagged record per planning problem, combined in ProblemVariant.
  - make_problem(): resolve the integer problem type {1..5} to a variant.
    Anything else is a ConfigurationError, raised immediately.
================================================================================
*/

#include <string>
#include <variant>
#include <vector>

#include "engine/core/equipment.hpp"
#include "engine/optimization/heuristic_result.hpp"

namespace powerplan {

// Minimize blended LCOE over the trajectory subject to site constraints.
struct GreenfieldProblem {};

// Maximize incremental MW beyond an existing fleet under an LCOE ceiling.
struct BrownfieldProblem {
  EquipmentConfig existing{};
  double existing_lcoe = 80.0;      // $/MWh of the existing fleet
  double lcoe_threshold = 100.0;    // ceiling on blended $/MWh
};

// Max firm MW allowed by NOx / gas / land, across flexibility scenarios.
struct LandDevProblem {
  Technology primary = Technology::Recip;
};

struct DrService {
  std::string name;
  double payment_mw_hr = 0.0;       // availability $/MW-hr
  double payment_kw_yr = 0.0;       // availability $/kW-yr (used when > 0)
  double activation_per_mwh = 0.0;
  double expected_hours_yr = 0.0;
  double min_capacity_mw = 0.0;
};

std::vector<DrService> default_dr_services();

// Demand-response revenue from flexible workloads.
struct GridServicesProblem {
  std::vector<DrService> services = default_dr_services();
};

// Rental vs purchase vs hybrid until the grid arrives.
struct BridgePowerProblem {
  int grid_available_month = 60;
  double rental_cost_kw_month = 50.0;
};

using ProblemVariant = std::variant<GreenfieldProblem, BrownfieldProblem, LandDevProblem,
                                    GridServicesProblem, BridgePowerProblem>;

// Inputs for every variant; make_problem() picks the one it needs.
struct ProblemInputs {
  BrownfieldProblem brownfield{};
  LandDevProblem land_dev{};
  GridServicesProblem grid_services{};
  BridgePowerProblem bridge_power{};

  void validate_or_throw() const;
};

ProblemVariant make_problem(int problem_type, const ProblemInputs& inputs = ProblemInputs{});

ProblemType problem_type_of(const ProblemVariant& p) noexcept;

} // namespace powerplan
