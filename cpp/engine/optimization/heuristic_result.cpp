#include "engine/optimization/heuristic_result.hpp"

namespace powerplan {

const char* to_string(ProblemType t) noexcept {
  switch (t) {
    case ProblemType::Greenfield:   return "greenfield";
    case ProblemType::Brownfield:   return "brownfield";
    case ProblemType::LandDev:      return "land_dev";
    case ProblemType::GridServices: return "grid_services";
    case ProblemType::BridgePower:  return "bridge_power";
    default:                        return "unknown";
  }
}

std::optional<ProblemType> problem_type_from_int(int v) noexcept {
  if (v < static_cast<int>(ProblemType::Greenfield) || v > static_cast<int>(ProblemType::BridgePower)) {
    return std::nullopt;
  }
  return static_cast<ProblemType>(v);
}

DispatchSummary summarize_dispatch(const DispatchResult& d) {
  DispatchSummary s;
  s.energy_required_mwh = d.energy_required_mwh;
  s.energy_delivered_mwh = d.energy_delivered_mwh;
  s.unserved_energy_mwh = d.unserved_energy_mwh;
  s.unserved_energy_pct = d.unserved_energy_pct;
  s.curtailed_mwh = d.curtailed_mwh;
  s.peak_unserved_mw = d.peak_unserved_mw;
  s.hours_with_unserved = d.hours_with_unserved;
  s.fuel_mmbtu = d.fuel_mmbtu;
  s.gas_mcf = d.gas_mcf;
  s.fleet_ramp_mw_min = d.fleet_ramp_mw_min;
  s.effective_ramp_mw_min = d.effective_ramp_mw_min;
  for (Technology t : kAllTechnologies) {
    const TechDispatchStats& st = d.stats(t);
    s.generation_mwh[to_string(t)] = st.energy_mwh;
    s.capacity_factor[to_string(t)] = st.capacity_factor;
    if (is_thermal(t)) s.starts[to_string(t)] = st.starts;
  }
  return s;
}

} // namespace powerplan
