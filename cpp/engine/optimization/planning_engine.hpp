#pragma once
/*
================================================================================
Fragment 8.3 - Optimization: Planning Engine (strategy table)
FILE: cpp/engine/optimization/planning_engine.hpp

Purpose:
  - PlanningServices: the shared sizing / dispatch / economics / constraint /
    annual-stack services, injected by reference into every strategy.
  - optimize(): dispatch a ProblemVariant through a fixed strategy table
    (one free function per variant, no virtual dispatch).
  - PlanningEngine: owns one set of services for a Scenario.

Failure semantics:
  - Infeasible plans and degenerate arithmetic come back inside the
    HeuristicResult (feasible=false, violations, warnings).
  - Invalid scenarios raise ValidationError, unknown problem types and
    missing catalog entries raise ConfigurationError. Nothing else escapes.

Concurrency:
  - optimize() keeps no state between calls. Independent PlanningEngine
    instances may run on separate threads.
================================================================================
*/

#include "engine/constraints/constraint_checker.hpp"
#include "engine/core/scenario.hpp"
#include "engine/dispatch/dispatch_simulator.hpp"
#include "engine/economics/economics.hpp"
#include "engine/optimization/heuristic_result.hpp"
#include "engine/optimization/problems.hpp"
#include "engine/planning/annual_stack.hpp"
#include "engine/sizing/equipment_sizer.hpp"

namespace powerplan {

struct PlanningServices {
  const Scenario& scenario;
  const EquipmentSizer& sizer;
  const DispatchSimulator& dispatch;
  const EconomicsCalculator& economics;
  const ConstraintChecker& checker;
  const AnnualStackBuilder& stack;
};

HeuristicResult optimize(const ProblemVariant& problem, const PlanningServices& services);

class PlanningEngine {
 public:
  // Validates the scenario and policy. The scenario is copied.
  explicit PlanningEngine(Scenario scenario, FillPolicy policy = FillPolicy::recip_first());

  PlanningEngine(const PlanningEngine&) = delete;
  PlanningEngine& operator=(const PlanningEngine&) = delete;

  HeuristicResult optimize(const ProblemVariant& problem) const;

  // Factory + optimize in one call.
  HeuristicResult optimize(int problem_type, const ProblemInputs& inputs = ProblemInputs{}) const;

  const Scenario& scenario() const noexcept { return scenario_; }
  const PlanningServices& services() const noexcept { return services_; }

 private:
  Scenario scenario_;
  EquipmentSizer sizer_;
  DispatchSimulator dispatch_;
  EconomicsCalculator economics_;
  ConstraintChecker checker_;
  AnnualStackBuilder stack_;
  PlanningServices services_;
};

} // namespace powerplan
