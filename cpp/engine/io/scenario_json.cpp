#include "engine/io/scenario_json.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <utility>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"

namespace powerplan {

namespace {

// One JSON object plus its key path ("parameters", "equipment.recip", ...)
// for error messages. Absent keys leave the target untouched.
class Section {
 public:
  Section(const JsonValue& v, std::string path) : v_(v), path_(std::move(path)) {
    if (!v_.is_object()) bad_type(path_, "object", v_);
  }

  const JsonValue& value() const noexcept { return v_; }
  const std::string& path() const noexcept { return path_; }

  std::string at(const std::string& key) const { return path_.empty() ? key : path_ + "." + key; }

  void number(const char* key, double& out) const {
    if (const JsonValue* x = v_.find(key)) {
      if (!x->is_number()) bad_type(at(key), "number", *x);
      out = x->number;
    }
  }

  void integer(const char* key, int& out) const {
    if (const JsonValue* x = v_.find(key)) out = as_int(*x, at(key));
  }

  void boolean(const char* key, bool& out) const {
    if (const JsonValue* x = v_.find(key)) {
      if (!x->is_bool()) bad_type(at(key), "boolean", *x);
      out = x->boolean;
    }
  }

  void text(const char* key, std::string& out) const {
    if (const JsonValue* x = v_.find(key)) {
      if (!x->is_string()) bad_type(at(key), "string", *x);
      out = x->string;
    }
  }

  std::optional<Section> child(const char* key) const {
    const JsonValue* x = v_.find(key);
    if (!x) return std::nullopt;
    return Section(*x, at(key));
  }

  static int as_int(const JsonValue& x, const std::string& path) {
    if (!x.is_number() || x.number != std::floor(x.number) || std::fabs(x.number) > 2.0e9) {
      bad_type(path, "integer", x);
    }
    return static_cast<int>(x.number);
  }

  [[noreturn]] static void bad_type(const std::string& path, const char* want, const JsonValue& got) {
    throw ValidationError("scenario: '" + path + "' must be " + want + ", got " + to_string(got.type));
  }

 private:
  const JsonValue& v_;
  std::string path_;
};

Technology technology_or_throw(const std::string& name, const std::string& path) {
  const auto t = technology_from_string(name);
  if (!t) throw ValidationError("scenario: '" + path + "' unknown technology '" + name + "'");
  return *t;
}

void read_site(const Section& s, Scenario& sc) {
  SiteConstraints& c = sc.site;
  s.text("name", sc.site_name);
  s.number("nox_tpy", c.nox_tpy);
  s.number("gas_supply_mcf_day", c.gas_supply_mcf_day);
  s.number("land_area_acres", c.land_area_acres);
  s.boolean("n_minus_1_required", c.n_minus_1_required);
  s.number("min_availability", c.min_availability);
  s.number("min_ramp_mw_min", c.min_ramp_mw_min);
  s.number("max_time_to_power_months", c.max_time_to_power_months);
  s.number("grid_capacity_mw", c.grid_capacity_mw);
  if (const JsonValue* y = s.value().find("grid_available_year")) {
    if (y->is_null()) c.grid_available_year.reset();
    else c.grid_available_year = Section::as_int(*y, s.at("grid_available_year"));
  }
}

void read_trajectory(const Section& s, LoadTrajectory& t) {
  t.peak_mw_by_year.clear();
  for (const auto& [key, v] : s.value().object) {
    errno = 0;
    char* end = nullptr;
    const long year = std::strtol(key.c_str(), &end, 10);
    if (key.empty() || *end != '\0' || errno == ERANGE || year < 1900 || year > 3000) {
      throw ValidationError("scenario: '" + s.at(key) + "' is not a calendar year");
    }
    if (!v.is_number()) Section::bad_type(s.at(key), "number", v);
    t.peak_mw_by_year[static_cast<int>(year)] = v.number;
  }
}

void read_number_map(const Section& s, std::map<std::string, double>& out) {
  out.clear();
  for (const auto& [key, v] : s.value().object) {
    if (!v.is_number()) Section::bad_type(s.at(key), "number", v);
    out[key] = v.number;
  }
}

void read_workloads(const Section& s, WorkloadTable& table) {
  for (const auto& entry : s.value().object) {
    const Section w(entry.second, s.at(entry.first));
    WorkloadProfile p = table.count(entry.first) ? table.at(entry.first) : WorkloadProfile{};
    w.number("flexibility_pct", p.flexibility_pct);
    w.number("ramp_factor", p.ramp_factor);
    if (p.flexibility_pct < 0.0 || p.flexibility_pct > 1.0 || p.ramp_factor < 0.0) {
      throw ValidationError("scenario: '" + w.path() + "' flexibility_pct must be [0,1], ramp_factor >= 0");
    }
    table[entry.first] = p;
  }
}

void read_parameters(const Section& s, GlobalParameters& p) {
  s.number("discount_rate", p.discount_rate);
  s.integer("project_life_years", p.project_life_years);
  s.number("fuel_price_mmbtu", p.fuel_price_mmbtu);
  s.number("fuel_escalation_rate", p.fuel_escalation_rate);
  s.number("itc_rate", p.itc_rate);
  s.number("voll_per_mwh", p.voll_per_mwh);
  s.number("grid_price_mwh", p.grid_price_mwh);
  s.number("bess_capacity_credit", p.bess_capacity_credit);
  s.number("bess_degradation_per_kwh", p.bess_degradation_per_kwh);
  s.number("bess_initial_soc", p.bess_initial_soc);
  s.number("commissioning_offset_months", p.commissioning_offset_months);
  s.number("planning_capacity_factor", p.planning_capacity_factor);
  s.number("alignment_factor", p.alignment_factor);
  s.number("dr_eligibility_factor", p.dr_eligibility_factor);
  s.number("residual_value_pct", p.residual_value_pct);
  s.number("hybrid_purchase_share", p.hybrid_purchase_share);
  s.number("solar_land_threshold_acres", p.solar_land_threshold_acres);
  s.number("datacenter_mw_per_acre", p.datacenter_mw_per_acre);
  s.number("substation_acres", p.substation_acres);
  s.number("infrastructure_land_pct", p.infrastructure_land_pct);

  if (const JsonValue* f = s.value().find("flex_scenarios")) {
    if (!f->is_array()) Section::bad_type(s.at("flex_scenarios"), "array", *f);
    p.flex_scenarios.clear();
    for (const JsonValue& e : f->array) {
      if (!e.is_number()) Section::bad_type(s.at("flex_scenarios[]"), "number", e);
      p.flex_scenarios.push_back(e.number);
    }
  }
  if (const JsonValue* seed = s.value().find("load_seed")) {
    const int v = Section::as_int(*seed, s.at("load_seed"));
    if (v < 0) throw ValidationError("scenario: '" + s.at("load_seed") + "' must be >= 0");
    p.load_seed = static_cast<uint64_t>(v);
  }
}

void read_spec(const Section& s, EquipmentSpec& e) {
  s.text("name", e.name);
  s.number("capacity_mw", e.capacity_mw);
  s.number("heat_rate_btu_kwh", e.heat_rate_btu_kwh);
  s.number("nox_lb_mwh", e.nox_lb_mwh);
  s.number("ramp_rate_mw_min", e.ramp_rate_mw_min);
  s.number("start_time_cold_min", e.start_time_cold_min);
  s.number("lead_time_months_min", e.lead_time_months_min);
  s.number("lead_time_months_max", e.lead_time_months_max);
  s.number("capex_per_kw", e.capex_per_kw);
  s.number("capex_per_kwh", e.capex_per_kwh);
  s.number("vom_per_mwh", e.vom_per_mwh);
  s.number("fom_per_kw_yr", e.fom_per_kw_yr);
  s.number("availability_pct", e.availability_pct);
  s.number("land_acres_per_mw", e.land_acres_per_mw);
  s.number("duration_hours", e.duration_hours);
  s.number("roundtrip_efficiency", e.roundtrip_efficiency);
  s.number("capacity_factor", e.capacity_factor);
}

void read_equipment_overrides(const Section& s, EquipmentCatalog& catalog) {
  for (const auto& entry : s.value().object) {
    const Technology t = technology_or_throw(entry.first, s.at(entry.first));
    EquipmentSpec spec;
    if (catalog.has(t)) {
      spec = catalog.at(t);
    } else {
      spec.technology = t;
      spec.name = to_string(t);
    }
    read_spec(Section(entry.second, s.at(entry.first)), spec);
    spec.technology = t;
    catalog.set(std::move(spec));
  }
}

void read_config(const Section& s, EquipmentConfig& e, const EquipmentCatalog& catalog) {
  int recip = e.recip_units;
  int turbine = e.turbine_units;
  s.integer("recip_units", recip);
  s.integer("turbine_units", turbine);
  if (recip < 0 || turbine < 0) throw ValidationError("scenario: '" + s.path() + "' unit counts must be >= 0");
  if (recip > 0) e.set_recip_units(recip, catalog);
  if (turbine > 0) e.set_turbine_units(turbine, catalog);
  s.number("bess_power_mw", e.bess_power_mw);
  s.number("bess_energy_mwh", e.bess_energy_mwh);
  s.number("solar_mw_dc", e.solar_mw_dc);
  s.number("grid_import_mw", e.grid_import_mw);
  if (e.bess_power_mw < 0.0 || e.bess_energy_mwh < 0.0 || e.solar_mw_dc < 0.0 || e.grid_import_mw < 0.0) {
    throw ValidationError("scenario: '" + s.path() + "' capacities must be >= 0");
  }
}

FillPolicy read_policy(const Section& s) {
  std::string name = "recip_first";
  s.text("name", name);

  FillPolicy p;
  if (name == "recip_first") {
    p = FillPolicy::recip_first();
  } else if (name == "turbine_first") {
    p = FillPolicy::turbine_first();
  } else if (name == "recip_then_grid") {
    double cap = std::numeric_limits<double>::infinity();
    double grid = 0.0;
    s.number("recip_cap_mw", cap);
    s.number("grid_import_limit_mw", grid);
    p = FillPolicy::recip_then_grid(cap, grid);
  } else {
    throw ValidationError("scenario: '" + s.at("name") + "' unknown fill policy '" + name + "'");
  }
  s.number("grid_import_limit_mw", p.grid_import_limit_mw);
  s.number("bess_fraction", p.bess_fraction);
  s.number("solar_fraction", p.solar_fraction);
  s.number("max_solar_mw", p.max_solar_mw);
  return p;
}

DrService read_service(const Section& s) {
  DrService d;
  s.text("name", d.name);
  s.number("payment_mw_hr", d.payment_mw_hr);
  s.number("payment_kw_yr", d.payment_kw_yr);
  s.number("activation_per_mwh", d.activation_per_mwh);
  s.number("expected_hours_yr", d.expected_hours_yr);
  s.number("min_capacity_mw", d.min_capacity_mw);
  return d;
}

void read_problem(const Section& s, ProblemInputs& in, const EquipmentCatalog& catalog) {
  if (auto ex = s.child("existing")) read_config(*ex, in.brownfield.existing, catalog);
  s.number("existing_lcoe", in.brownfield.existing_lcoe);
  s.number("lcoe_threshold", in.brownfield.lcoe_threshold);

  std::string primary;
  s.text("primary", primary);
  if (!primary.empty()) in.land_dev.primary = technology_or_throw(primary, s.at("primary"));

  if (const JsonValue* sv = s.value().find("services")) {
    if (!sv->is_array()) Section::bad_type(s.at("services"), "array", *sv);
    in.grid_services.services.clear();
    for (const JsonValue& e : sv->array) {
      in.grid_services.services.push_back(read_service(Section(e, s.at("services[]"))));
    }
  }

  s.integer("grid_available_month", in.bridge_power.grid_available_month);
  s.number("rental_cost_kw_month", in.bridge_power.rental_cost_kw_month);
}

} // namespace

ScenarioDocument scenario_from_json(const JsonValue& root_value) {
  const Section root(root_value, "");
  ScenarioDocument doc;
  Scenario& sc = doc.scenario;

  root.integer("problem_type", doc.problem_type);

  // Catalog first: problem inputs size existing units from it.
  if (auto eq = root.child("equipment")) read_equipment_overrides(*eq, sc.catalog);
  if (auto site = root.child("site")) read_site(*site, sc);
  if (auto params = root.child("parameters")) read_parameters(*params, sc.params);
  if (auto wl = root.child("workloads")) read_workloads(*wl, sc.workloads);

  const auto traj = root.child("load_trajectory");
  if (!traj) throw ValidationError("scenario: 'load_trajectory' is required");
  read_trajectory(*traj, sc.trajectory);
  if (auto mix = root.child("workload_mix")) read_number_map(*mix, sc.trajectory.workload_mix);

  if (auto pol = root.child("fill_policy")) doc.policy = read_policy(*pol);
  if (auto prob = root.child("problem")) read_problem(*prob, doc.inputs, sc.catalog);

  sc.validate_or_throw();
  doc.inputs.validate_or_throw();
  doc.policy.validate_or_throw();
  return doc;
}

bool parse_scenario_json(std::string_view json, ScenarioDocument* out, JsonParseError* err) {
  if (!out) return false;
  JsonValue root;
  if (!parse_json(json, &root, err)) return false;
  *out = scenario_from_json(root);
  return true;
}

std::string read_text_file(const std::string& path) {
  std::ifstream f(path, std::ios::in | std::ios::binary);
  POWERPLAN_ENSURE(f.is_open(), IOError, "cannot open '" + path + "'");
  std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  if (f.bad()) POWERPLAN_THROW(IOError, "read failed for '" + path + "'");
  return text;
}

ScenarioDocument load_scenario_file(const std::string& path) {
  const std::string text = read_text_file(path);
  ScenarioDocument doc;
  JsonParseError err;
  if (!parse_scenario_json(text, &doc, &err)) {
    throw ValidationError(path + ": " + describe(err));
  }
  log(LogLevel::DEBUG, "loaded scenario '" + doc.scenario.site_name + "' from " + path);
  return doc;
}

ScenarioDocument load_scenario_file(const std::string& path, ScenarioFileCache& cache) {
  return cache.get_or_load(path, [&path] { return load_scenario_file(path); });
}

} // namespace powerplan
