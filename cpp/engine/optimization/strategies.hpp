#pragma once
/*
================================================================================
Fragment 8.4 - Optimization: Strategy Functions (internal)
FILE: cpp/engine/optimization/strategies.hpp

Purpose:
  - One free function per ProblemVariant alternative, plus the helpers they
    share for copying dispatch / constraint outcomes into a HeuristicResult.
  - Only planning_engine.cpp and the strategy sources include this header.
================================================================================
*/

#include <string>
#include <vector>

#include "engine/optimization/planning_engine.hpp"

namespace powerplan::strategy {

HeuristicResult solve_greenfield(const GreenfieldProblem& p, const PlanningServices& s);
HeuristicResult solve_brownfield(const BrownfieldProblem& p, const PlanningServices& s);
HeuristicResult solve_land_dev(const LandDevProblem& p, const PlanningServices& s);
HeuristicResult solve_grid_services(const GridServicesProblem& p, const PlanningServices& s);
HeuristicResult solve_bridge_power(const BridgePowerProblem& p, const PlanningServices& s);

// Dispatch summary + unserved / delivered energy.
void apply_dispatch(HeuristicResult& r, const DispatchResult& d);

// Constraint table, binding constraint, violations, constraint warnings.
void apply_constraints(HeuristicResult& r, const ConstraintReport& rep);

// Appends warnings not already present.
void add_warnings(HeuristicResult& r, const std::vector<std::string>& w);

} // namespace powerplan::strategy
