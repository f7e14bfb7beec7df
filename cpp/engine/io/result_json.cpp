/*
================================================================================
Fragment 9.3 - IO: HeuristicResult JSON (Implementation)
FILE: cpp/engine/io/result_json.cpp
================================================================================
*/

#include "engine/io/result_json.hpp"

#include <cmath>
#include <fstream>
#include <istream>
#include <iterator>
#include <limits>
#include <utility>

#include "engine/io/json_writer.hpp"

namespace powerplan {

namespace {

// ----------------------------- writer ----------------------------------------
void emit_equipment(JsonWriter& j, const EquipmentConfig& e) {
  j.begin_object();
  j.field("recip_units", e.recip_units);
  j.field("recip_mw", e.recip_mw);
  j.field("turbine_units", e.turbine_units);
  j.field("turbine_mw", e.turbine_mw);
  j.field("bess_power_mw", e.bess_power_mw);
  j.field("bess_energy_mwh", e.bess_energy_mwh);
  j.field("solar_mw_dc", e.solar_mw_dc);
  j.field("grid_import_mw", e.grid_import_mw);
  j.end_object();
}

template <class V>
void emit_map(JsonWriter& j, const std::map<std::string, V>& m) {
  j.begin_object();
  for (const auto& [k, v] : m) j.field(k, v);
  j.end_object();
}

void emit_strings(JsonWriter& j, const std::vector<std::string>& v) {
  j.begin_array();
  for (const std::string& s : v) j.value(s);
  j.end_array();
}

void emit_dispatch(JsonWriter& j, const DispatchSummary& d) {
  j.begin_object();
  j.field("energy_required_mwh", d.energy_required_mwh);
  j.field("energy_delivered_mwh", d.energy_delivered_mwh);
  j.field("unserved_energy_mwh", d.unserved_energy_mwh);
  j.field("unserved_energy_pct", d.unserved_energy_pct);
  j.field("curtailed_mwh", d.curtailed_mwh);
  j.field("peak_unserved_mw", d.peak_unserved_mw);
  j.field("hours_with_unserved", d.hours_with_unserved);
  j.field("fuel_mmbtu", d.fuel_mmbtu);
  j.field("gas_mcf", d.gas_mcf);
  j.field("fleet_ramp_mw_min", d.fleet_ramp_mw_min);
  j.field("effective_ramp_mw_min", d.effective_ramp_mw_min);
  j.key("generation_mwh");
  emit_map(j, d.generation_mwh);
  j.key("capacity_factor");
  emit_map(j, d.capacity_factor);
  j.key("starts");
  emit_map(j, d.starts);
  j.end_object();
}

void emit_constraints(JsonWriter& j, const std::vector<ConstraintEval>& evals) {
  j.begin_array();
  for (const ConstraintEval& e : evals) {
    j.begin_object();
    j.field("name", e.name);
    j.field("unit", e.unit);
    j.field("sense", to_string(e.sense));
    j.field("value", e.value);
    j.field("limit", e.limit);
    j.field("utilization", e.utilization);
    j.field("binding", e.binding);
    j.field("violated", e.violated);
    j.end_object();
  }
  j.end_array();
}

void emit_stack(JsonWriter& j, const std::vector<AnnualStackRow>& rows) {
  j.begin_array();
  for (const AnnualStackRow& row : rows) {
    j.begin_object();
    j.field("year", row.year);
    j.field("peak_mw", row.peak_mw);
    j.key("equipment");
    emit_equipment(j, row.equipment);
    j.field("capex_added", row.capex_added);
    j.field("capex_cumulative", row.capex_cumulative);
    j.field("opex", row.opex);
    j.field("fuel_cost", row.fuel_cost);
    j.field("annual_cost", row.annual_cost);
    j.field("energy_required_mwh", row.energy_required_mwh);
    j.field("energy_delivered_mwh", row.energy_delivered_mwh);
    j.field("unserved_energy_mwh", row.unserved_energy_mwh);
    j.field("unserved_energy_pct", row.unserved_energy_pct);
    j.field("annual_lcoe", row.annual_lcoe);
    j.field("grid_available", row.grid_available);
    j.end_object();
  }
  j.end_array();
}

void emit_flex(JsonWriter& j, const std::vector<FlexScenarioRow>& rows) {
  j.begin_array();
  for (const FlexScenarioRow& row : rows) {
    j.begin_object();
    j.field("key", row.key);
    j.field("flex_pct", row.flex_pct);
    j.field("load_max_mw", row.load_max_mw);
    j.field("firm_mw", row.firm_mw);
    j.field("lcoe", row.lcoe);
    j.field("binding", row.binding);
    j.end_object();
  }
  j.end_array();
}

void emit_services(JsonWriter& j, const std::vector<ServiceRevenue>& rows) {
  j.begin_array();
  for (const ServiceRevenue& s : rows) {
    j.begin_object();
    j.field("service", s.service);
    j.field("qualified", s.qualified);
    j.field("eligible_mw", s.eligible_mw);
    j.field("availability_revenue", s.availability_revenue);
    j.field("activation_revenue", s.activation_revenue);
    j.field("total_revenue", s.total_revenue);
    j.end_object();
  }
  j.end_array();
}

void emit_bridge(JsonWriter& j, const std::vector<BridgeScenario>& rows) {
  j.begin_array();
  for (const BridgeScenario& b : rows) {
    j.begin_object();
    j.field("strategy", b.strategy);
    j.field("npv", b.npv);
    j.field("capex", b.capex);
    j.field("monthly_cost", b.monthly_cost);
    j.end_object();
  }
  j.end_array();
}

// ----------------------------- reader ----------------------------------------
// Schema errors carry no source position; offset/line/col stay at the start.
class Reader {
 public:
  explicit Reader(JsonParseError* err) : err_(err) {}

  bool fail(const std::string& msg) {
    if (err_) {
      err_->message = msg;
      err_->offset = 0;
      err_->line = 1;
      err_->col = 1;
    }
    return false;
  }

  // Optional field: absent leaves out untouched; null reads as +inf.
  bool number(const JsonValue& o, const char* k, double& out) {
    const JsonValue* v = o.find(k);
    if (!v) return true;
    if (v->is_null()) {
      out = std::numeric_limits<double>::infinity();
      return true;
    }
    if (!v->is_number()) return fail(std::string("Invalid numeric field: ") + k);
    out = v->number;
    return true;
  }

  bool integer(const JsonValue& o, const char* k, int& out) {
    const JsonValue* v = o.find(k);
    if (!v) return true;
    if (!v->is_number() || v->number != std::floor(v->number) || std::fabs(v->number) > 2.0e9) {
      return fail(std::string("Invalid integer field: ") + k);
    }
    out = static_cast<int>(v->number);
    return true;
  }

  bool boolean(const JsonValue& o, const char* k, bool& out) {
    const JsonValue* v = o.find(k);
    if (!v) return true;
    if (!v->is_bool()) return fail(std::string("Invalid boolean field: ") + k);
    out = v->boolean;
    return true;
  }

  bool text(const JsonValue& o, const char* k, std::string& out) {
    const JsonValue* v = o.find(k);
    if (!v) return true;
    if (!v->is_string()) return fail(std::string("Invalid string field: ") + k);
    out = v->string;
    return true;
  }

  bool strings(const JsonValue& o, const char* k, std::vector<std::string>& out) {
    const JsonValue* v = o.find(k);
    if (!v) return true;
    if (!v->is_array()) return fail(std::string(k) + " must be an array");
    out.clear();
    for (const JsonValue& e : v->array) {
      if (!e.is_string()) return fail(std::string(k) + " elements must be strings");
      out.push_back(e.string);
    }
    return true;
  }

  bool number_map(const JsonValue& o, const char* k, std::map<std::string, double>& out) {
    const JsonValue* v = o.find(k);
    if (!v) return true;
    if (!v->is_object()) return fail(std::string(k) + " must be an object");
    out.clear();
    for (const auto& entry : v->object) {
      if (!number(*v, entry.first.c_str(), out[entry.first])) return false;
    }
    return true;
  }

  bool int_map(const JsonValue& o, const char* k, std::map<std::string, int>& out) {
    const JsonValue* v = o.find(k);
    if (!v) return true;
    if (!v->is_object()) return fail(std::string(k) + " must be an object");
    out.clear();
    for (const auto& entry : v->object) {
      if (!integer(*v, entry.first.c_str(), out[entry.first])) return false;
    }
    return true;
  }

  // Array of objects, each handed to fn(const JsonValue&, T&).
  template <class T, class Fn>
  bool objects(const JsonValue& o, const char* k, std::vector<T>& out, Fn fn) {
    const JsonValue* v = o.find(k);
    if (!v) return true;
    if (!v->is_array()) return fail(std::string(k) + " must be an array");
    out.clear();
    for (const JsonValue& e : v->array) {
      if (!e.is_object()) return fail(std::string(k) + " elements must be objects");
      T item{};
      if (!fn(e, item)) return false;
      out.push_back(std::move(item));
    }
    return true;
  }

  // Optional nested object; absent is fine, any other type is an error.
  bool object(const JsonValue& o, const char* k, const JsonValue*& out) {
    out = o.find(k);
    if (out && !out->is_object()) return fail(std::string(k) + " must be an object");
    return true;
  }

 private:
  JsonParseError* err_;
};

bool read_equipment(Reader& rd, const JsonValue& o, EquipmentConfig& e) {
  return rd.integer(o, "recip_units", e.recip_units) && rd.number(o, "recip_mw", e.recip_mw) &&
         rd.integer(o, "turbine_units", e.turbine_units) && rd.number(o, "turbine_mw", e.turbine_mw) &&
         rd.number(o, "bess_power_mw", e.bess_power_mw) &&
         rd.number(o, "bess_energy_mwh", e.bess_energy_mwh) &&
         rd.number(o, "solar_mw_dc", e.solar_mw_dc) && rd.number(o, "grid_import_mw", e.grid_import_mw);
}

bool read_dispatch(Reader& rd, const JsonValue& o, DispatchSummary& d) {
  return rd.number(o, "energy_required_mwh", d.energy_required_mwh) &&
         rd.number(o, "energy_delivered_mwh", d.energy_delivered_mwh) &&
         rd.number(o, "unserved_energy_mwh", d.unserved_energy_mwh) &&
         rd.number(o, "unserved_energy_pct", d.unserved_energy_pct) &&
         rd.number(o, "curtailed_mwh", d.curtailed_mwh) &&
         rd.number(o, "peak_unserved_mw", d.peak_unserved_mw) &&
         rd.integer(o, "hours_with_unserved", d.hours_with_unserved) &&
         rd.number(o, "fuel_mmbtu", d.fuel_mmbtu) && rd.number(o, "gas_mcf", d.gas_mcf) &&
         rd.number(o, "fleet_ramp_mw_min", d.fleet_ramp_mw_min) &&
         rd.number(o, "effective_ramp_mw_min", d.effective_ramp_mw_min) &&
         rd.number_map(o, "generation_mwh", d.generation_mwh) &&
         rd.number_map(o, "capacity_factor", d.capacity_factor) && rd.int_map(o, "starts", d.starts);
}

bool read_constraint(Reader& rd, const JsonValue& o, ConstraintEval& e) {
  std::string sense = "max";
  if (!(rd.text(o, "name", e.name) && rd.text(o, "unit", e.unit) && rd.text(o, "sense", sense) &&
        rd.number(o, "value", e.value) && rd.number(o, "limit", e.limit) &&
        rd.number(o, "utilization", e.utilization) && rd.boolean(o, "binding", e.binding) &&
        rd.boolean(o, "violated", e.violated))) {
    return false;
  }
  if (sense == "max") e.sense = ConstraintSense::Max;
  else if (sense == "min") e.sense = ConstraintSense::Min;
  else return rd.fail("Unknown constraint sense: " + sense);
  return true;
}

bool read_stack_row(Reader& rd, const JsonValue& o, AnnualStackRow& row) {
  const JsonValue* eq = nullptr;
  if (!rd.object(o, "equipment", eq)) return false;
  if (eq && !read_equipment(rd, *eq, row.equipment)) return false;
  return rd.integer(o, "year", row.year) && rd.number(o, "peak_mw", row.peak_mw) &&
         rd.number(o, "capex_added", row.capex_added) &&
         rd.number(o, "capex_cumulative", row.capex_cumulative) && rd.number(o, "opex", row.opex) &&
         rd.number(o, "fuel_cost", row.fuel_cost) && rd.number(o, "annual_cost", row.annual_cost) &&
         rd.number(o, "energy_required_mwh", row.energy_required_mwh) &&
         rd.number(o, "energy_delivered_mwh", row.energy_delivered_mwh) &&
         rd.number(o, "unserved_energy_mwh", row.unserved_energy_mwh) &&
         rd.number(o, "unserved_energy_pct", row.unserved_energy_pct) &&
         rd.number(o, "annual_lcoe", row.annual_lcoe) && rd.boolean(o, "grid_available", row.grid_available);
}

bool fill_result(Reader& rd, const JsonValue& root, HeuristicResult& r) {
  if (!root.is_object()) return rd.fail("Root must be an object");

  const JsonValue* pt = root.find("problem_type");
  if (!pt || !pt->is_number()) return rd.fail("Missing/invalid field: problem_type");
  const auto type = problem_type_from_int(static_cast<int>(pt->number));
  if (!type || pt->number != std::floor(pt->number)) return rd.fail("Unknown problem_type");
  r.problem_type = *type;

  if (!(rd.text(root, "problem_name", r.problem_name) && rd.text(root, "scenario_id", r.scenario_id) &&
        rd.boolean(root, "feasible", r.feasible) && rd.number(root, "objective_value", r.objective_value) &&
        rd.text(root, "objective_label", r.objective_label) && rd.number(root, "lcoe", r.lcoe) &&
        rd.number(root, "capex_total", r.capex_total) && rd.number(root, "opex_annual", r.opex_annual) &&
        rd.number(root, "timeline_months", r.timeline_months) &&
        rd.number(root, "solve_time_seconds", r.solve_time_seconds) &&
        rd.number(root, "unserved_energy_mwh", r.unserved_energy_mwh) &&
        rd.number(root, "unserved_energy_pct", r.unserved_energy_pct) &&
        rd.number(root, "energy_delivered_mwh", r.energy_delivered_mwh) &&
        rd.text(root, "selected_strategy", r.selected_strategy) &&
        rd.text(root, "binding_constraint", r.binding_constraint))) {
    return false;
  }

  const JsonValue* eq = nullptr;
  const JsonValue* ds = nullptr;
  if (!rd.object(root, "equipment_config", eq) || !rd.object(root, "dispatch_summary", ds)) return false;
  if (eq && !read_equipment(rd, *eq, r.equipment_config)) return false;
  if (ds && !read_dispatch(rd, *ds, r.dispatch_summary)) return false;

  auto constraint = [&](const JsonValue& o, ConstraintEval& e) { return read_constraint(rd, o, e); };
  auto stack_row = [&](const JsonValue& o, AnnualStackRow& row) { return read_stack_row(rd, o, row); };
  auto flex_row = [&](const JsonValue& o, FlexScenarioRow& row) {
    return rd.text(o, "key", row.key) && rd.number(o, "flex_pct", row.flex_pct) &&
           rd.number(o, "load_max_mw", row.load_max_mw) && rd.number(o, "firm_mw", row.firm_mw) &&
           rd.number(o, "lcoe", row.lcoe) && rd.text(o, "binding", row.binding);
  };
  auto service = [&](const JsonValue& o, ServiceRevenue& s) {
    return rd.text(o, "service", s.service) && rd.boolean(o, "qualified", s.qualified) &&
           rd.number(o, "eligible_mw", s.eligible_mw) &&
           rd.number(o, "availability_revenue", s.availability_revenue) &&
           rd.number(o, "activation_revenue", s.activation_revenue) &&
           rd.number(o, "total_revenue", s.total_revenue);
  };
  auto bridge = [&](const JsonValue& o, BridgeScenario& b) {
    return rd.text(o, "strategy", b.strategy) && rd.number(o, "npv", b.npv) &&
           rd.number(o, "capex", b.capex) && rd.number(o, "monthly_cost", b.monthly_cost);
  };

  return rd.objects(root, "constraint_status", r.constraint_status, constraint) &&
         rd.strings(root, "violations", r.violations) && rd.strings(root, "warnings", r.warnings) &&
         rd.number_map(root, "metrics", r.metrics) &&
         rd.objects(root, "annual_stack", r.annual_stack, stack_row) &&
         rd.objects(root, "flex_matrix", r.flex_matrix, flex_row) &&
         rd.number_map(root, "flex_by_workload", r.flex_by_workload) &&
         rd.objects(root, "service_revenue", r.service_revenue, service) &&
         rd.objects(root, "bridge_scenarios", r.bridge_scenarios, bridge);
}

} // namespace

std::string heuristic_result_to_json(const HeuristicResult& r, int indent_spaces) {
  JsonWriter j(indent_spaces);
  j.begin_object();

  j.field("problem_type", static_cast<int>(r.problem_type));
  j.field("problem_name", r.problem_name);
  j.field("scenario_id", r.scenario_id);
  j.field("feasible", r.feasible);
  j.field("objective_value", r.objective_value);
  j.field("objective_label", r.objective_label);
  j.field("lcoe", r.lcoe);
  j.field("capex_total", r.capex_total);
  j.field("opex_annual", r.opex_annual);
  j.field("timeline_months", r.timeline_months);
  j.field("solve_time_seconds", r.solve_time_seconds);
  j.field("unserved_energy_mwh", r.unserved_energy_mwh);
  j.field("unserved_energy_pct", r.unserved_energy_pct);
  j.field("energy_delivered_mwh", r.energy_delivered_mwh);
  j.field("selected_strategy", r.selected_strategy);
  j.field("binding_constraint", r.binding_constraint);

  j.key("equipment_config");
  emit_equipment(j, r.equipment_config);
  j.key("dispatch_summary");
  emit_dispatch(j, r.dispatch_summary);
  j.key("constraint_status");
  emit_constraints(j, r.constraint_status);
  j.key("violations");
  emit_strings(j, r.violations);
  j.key("warnings");
  emit_strings(j, r.warnings);
  j.key("metrics");
  emit_map(j, r.metrics);
  j.key("annual_stack");
  emit_stack(j, r.annual_stack);
  j.key("flex_matrix");
  emit_flex(j, r.flex_matrix);
  j.key("flex_by_workload");
  emit_map(j, r.flex_by_workload);
  j.key("service_revenue");
  emit_services(j, r.service_revenue);
  j.key("bridge_scenarios");
  emit_bridge(j, r.bridge_scenarios);

  j.end_object();
  return j.str() + "\n";
}

bool parse_heuristic_result_json(std::string_view json, HeuristicResult* out, JsonParseError* err) {
  if (!out) return false;
  JsonValue root;
  if (!parse_json(json, &root, err)) return false;

  Reader rd(err);
  HeuristicResult r;
  if (!fill_result(rd, root, r)) return false;
  *out = std::move(r);
  return true;
}

bool parse_heuristic_result_json(std::istream& is, HeuristicResult* out, JsonParseError* err) {
  const std::string buf((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
  return parse_heuristic_result_json(std::string_view(buf), out, err);
}

bool write_heuristic_result_json_file(const HeuristicResult& r, const std::string& file_path,
                                      int indent_spaces) {
  std::ofstream f(file_path, std::ios::out | std::ios::trunc);
  if (!f.is_open()) return false;
  f << heuristic_result_to_json(r, indent_spaces);
  f.close();
  return !f.fail();
}

} // namespace powerplan
