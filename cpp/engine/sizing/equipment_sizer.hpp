#pragma once
/*
================================================================================
Fragment 3.1 - Sizing: Equipment Sizer
FILE: cpp/engine/sizing/equipment_sizer.hpp

Purpose:
  - size_equipment_to_load(target_mw, require_n1): firm capacity mix that
    covers target_mw, optionally surviving the loss of the largest unit.

Fill precedence (FillPolicy, overridable):
  1) primary technologies in order, each optionally capped (MW). Counts are
     min(ceil(remaining/unit), floor(cap/unit)).
  2) fill technologies in order. Grid import only when
     grid_import_limit_mw > 0; thermal fill is uncapped and rounded up.
  3) N-1: while firm - largest_unit < target, add one unit of the present
     thermal technology with the largest unit size.
  4) BESS (fraction of target, spec duration) and solar (fraction of target,
     capped by max_solar_mw) are sized last and are not counted as firm.

Hardening:
  - Pure: identical inputs -> identical config. No hidden state.
  - Monotonic in target_mw for a fixed policy.
  - target_mw <= 0 (or NaN) returns an empty config.
================================================================================
*/

#include <limits>
#include <utility>
#include <string>
#include <vector>

#include "engine/core/equipment.hpp"
#include "engine/core/hashing.hpp"

namespace powerplan {

struct FillStep {
  Technology tech = Technology::Recip;
  double cap_mw = std::numeric_limits<double>::infinity();
};

struct FillPolicy {
  std::string name = "recip_first";
  std::vector<FillStep> primary{FillStep{Technology::Recip}};
  std::vector<Technology> fill{Technology::Grid, Technology::Turbine};

  double grid_import_limit_mw = 0.0;  // 0 disables grid fill
  double bess_fraction = 0.10;        // BESS power as share of target
  double solar_fraction = 0.25;       // solar MWdc as share of target
  double max_solar_mw = 0.0;          // 0 disables solar

  static FillPolicy recip_first();
  static FillPolicy turbine_first();
  // Recip primary capped at recip_cap_mw, then grid up to grid_limit_mw,
  // then turbines.
  static FillPolicy recip_then_grid(double recip_cap_mw, double grid_limit_mw);

  void validate_or_throw() const;
};

// Folds every policy field into h. Part of the result's scenario_id.
void hash_fill_policy(Fnv1a64& h, const FillPolicy& p);

class EquipmentSizer {
 public:
  EquipmentSizer(const EquipmentCatalog& catalog, FillPolicy policy);

  EquipmentConfig size_equipment_to_load(double target_mw, bool require_n1) const;

  const FillPolicy& policy() const noexcept { return policy_; }
  const EquipmentCatalog& catalog() const noexcept { return catalog_; }

  // Copy of this sizer with another policy (same catalog).
  EquipmentSizer with_policy(FillPolicy policy) const { return EquipmentSizer(catalog_, std::move(policy)); }

 private:
  void add_units(EquipmentConfig& cfg, Technology t, int n) const;

  const EquipmentCatalog& catalog_;
  FillPolicy policy_;
};

} // namespace powerplan
