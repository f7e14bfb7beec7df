#pragma once
/*
================================================================================
Fragment 2.3 - Core: Scenario
FILE: cpp/engine/core/scenario.hpp

Purpose:
  - Aggregate of everything one optimize() call reads: catalog, global
    parameters, site limits, load trajectory, workload table.
  - validate_or_throw() validates every member once, up front.
  - scenario_key(): deterministic fingerprint reported as the result's
    scenario_id.
================================================================================
*/

#include <string>

#include "engine/core/equipment.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/load_model.hpp"
#include "engine/core/settings.hpp"

namespace powerplan {

struct Scenario {
  std::string site_name = "site";
  EquipmentCatalog catalog = EquipmentCatalog::defaults();
  GlobalParameters params{};
  SiteConstraints site{};
  LoadTrajectory trajectory{};
  WorkloadTable workloads = default_workload_table();

  void validate_or_throw() const {
    catalog.validate_or_throw();
    params.validate_or_throw();
    site.validate_or_throw();
    trajectory.validate_or_throw();
  }

  // Catalog + parameters + constraints with a single-year trajectory.
  static Scenario defaults(double peak_mw = 200.0, int year = 2027) {
    Scenario s;
    s.trajectory.peak_mw_by_year[year] = peak_mw;
    return s;
  }
};

Hash64 scenario_key(const Scenario& s);

} // namespace powerplan
