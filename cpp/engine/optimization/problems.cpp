#include "engine/optimization/problems.hpp"

#include <cmath>

#include "engine/core/errors.hpp"

namespace powerplan {

std::vector<DrService> default_dr_services() {
  std::vector<DrService> s;
  //                name        $/MW-hr  $/kW-yr  act $/MWh  hours/yr  min MW
  s.push_back(DrService{"econ_dr",   0.0,   0.0,    50.0,    100.0,    1.0});
  s.push_back(DrService{"ers_10",    7.5,   0.0,    75.0,     20.0,    0.1});
  s.push_back(DrService{"ers_30",    5.0,   0.0,    60.0,     30.0,    0.1});
  s.push_back(DrService{"capacity",  0.0,  60.0,     0.0,      0.0,    1.0});
  return s;
}

void ProblemInputs::validate_or_throw() const {
  if (!(brownfield.existing_lcoe >= 0.0) || !(brownfield.lcoe_threshold >= 0.0)) {
    throw ValidationError("BrownfieldProblem: LCOE values must be >= 0");
  }
  if (!is_thermal(land_dev.primary)) {
    throw ValidationError("LandDevProblem: primary technology must be recip or turbine");
  }
  for (const DrService& s : grid_services.services) {
    if (s.name.empty()) throw ValidationError("DrService: name is required");
    if (s.payment_mw_hr < 0.0 || s.payment_kw_yr < 0.0 || s.activation_per_mwh < 0.0 ||
        s.expected_hours_yr < 0.0 || s.min_capacity_mw < 0.0) {
      throw ValidationError("DrService '" + s.name + "': values must be >= 0");
    }
  }
  if (bridge_power.grid_available_month < 0) {
    throw ValidationError("BridgePowerProblem: grid_available_month must be >= 0");
  }
  if (bridge_power.rental_cost_kw_month < 0.0) {
    throw ValidationError("BridgePowerProblem: rental_cost_kw_month must be >= 0");
  }
}

ProblemVariant make_problem(int problem_type, const ProblemInputs& inputs) {
  const auto t = problem_type_from_int(problem_type);
  if (!t) {
    throw ConfigurationError("Unknown problem type " + std::to_string(problem_type) +
                             " (expected 1..5)");
  }
  switch (*t) {
    case ProblemType::Greenfield:   return GreenfieldProblem{};
    case ProblemType::Brownfield:   return inputs.brownfield;
    case ProblemType::LandDev:      return inputs.land_dev;
    case ProblemType::GridServices: return inputs.grid_services;
    case ProblemType::BridgePower:  return inputs.bridge_power;
  }
  throw ConfigurationError("Unknown problem type " + std::to_string(problem_type));
}

ProblemType problem_type_of(const ProblemVariant& p) noexcept {
  return static_cast<ProblemType>(static_cast<int>(p.index()) + 1);
}

} // namespace powerplan
