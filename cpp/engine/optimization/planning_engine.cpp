#include "engine/optimization/planning_engine.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <sstream>
#include <utility>
#include <variant>

#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"
#include "engine/optimization/strategies.hpp"

namespace powerplan {

namespace {

using StrategyFn = HeuristicResult (*)(const ProblemVariant&, const PlanningServices&);

template <class P, HeuristicResult (*Solve)(const P&, const PlanningServices&)>
HeuristicResult run(const ProblemVariant& v, const PlanningServices& s) {
  return Solve(std::get<P>(v), s);
}

// Indexed by ProblemVariant::index(); order must match the variant.
constexpr std::array<StrategyFn, std::variant_size_v<ProblemVariant>> kStrategies = {
    &run<GreenfieldProblem, &strategy::solve_greenfield>,
    &run<BrownfieldProblem, &strategy::solve_brownfield>,
    &run<LandDevProblem, &strategy::solve_land_dev>,
    &run<GridServicesProblem, &strategy::solve_grid_services>,
    &run<BridgePowerProblem, &strategy::solve_bridge_power>,
};

Scenario validated(Scenario s) {
  s.validate_or_throw();
  return s;
}

} // namespace

namespace strategy {

void apply_dispatch(HeuristicResult& r, const DispatchResult& d) {
  r.dispatch_summary = summarize_dispatch(d);
  r.unserved_energy_mwh = d.unserved_energy_mwh;
  r.unserved_energy_pct = d.unserved_energy_pct;
  r.energy_delivered_mwh = d.energy_delivered_mwh;
}

void apply_constraints(HeuristicResult& r, const ConstraintReport& rep) {
  r.constraint_status = rep.status;
  r.binding_constraint = rep.analysis.binding_constraint;
  r.violations.insert(r.violations.end(), rep.violations.begin(), rep.violations.end());
  add_warnings(r, rep.analysis.warnings);
}

void add_warnings(HeuristicResult& r, const std::vector<std::string>& w) {
  for (const std::string& s : w) {
    if (std::find(r.warnings.begin(), r.warnings.end(), s) == r.warnings.end()) r.warnings.push_back(s);
  }
}

} // namespace strategy

HeuristicResult optimize(const ProblemVariant& problem, const PlanningServices& services) {
  const auto t0 = std::chrono::steady_clock::now();
  const ProblemType type = problem_type_of(problem);
  Fnv1a64 key;
  key.update_u64(scenario_key(services.scenario).value);
  hash_fill_policy(key, services.sizer.policy());
  const std::string scenario_id = hash_to_hex(key.digest());

  log(LogLevel::INFO, std::string("optimize: ") + to_string(type) + " site='" +
                          services.scenario.site_name + "' scenario=" + scenario_id);

  HeuristicResult r = kStrategies[problem.index()](problem, services);
  r.problem_type = type;
  r.problem_name = to_string(type);
  r.scenario_id = scenario_id;
  r.solve_time_seconds =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

  std::ostringstream oss;
  oss << "optimize: " << to_string(type) << " done feasible=" << (r.feasible ? "true" : "false")
      << " " << r.objective_label << "=" << r.objective_value
      << " violations=" << r.violations.size() << " t=" << r.solve_time_seconds << "s";
  log(r.feasible ? LogLevel::INFO : LogLevel::WARN, oss.str());
  return r;
}

// ----------------------------- PlanningEngine --------------------------------
PlanningEngine::PlanningEngine(Scenario scenario, FillPolicy policy)
    : scenario_(validated(std::move(scenario))),
      sizer_(scenario_.catalog, std::move(policy)),
      dispatch_(scenario_.catalog, scenario_.params),
      economics_(scenario_.catalog, scenario_.params, dispatch_),
      checker_(scenario_.catalog, scenario_.params, scenario_.site, scenario_.workloads, dispatch_),
      stack_(sizer_, dispatch_, economics_, scenario_.params, scenario_.site),
      services_{scenario_, sizer_, dispatch_, economics_, checker_, stack_} {}

HeuristicResult PlanningEngine::optimize(const ProblemVariant& problem) const {
  return powerplan::optimize(problem, services_);
}

HeuristicResult PlanningEngine::optimize(int problem_type, const ProblemInputs& inputs) const {
  const ProblemVariant problem = make_problem(problem_type, inputs);
  inputs.validate_or_throw();
  return optimize(problem);
}

} // namespace powerplan
