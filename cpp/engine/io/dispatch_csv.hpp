#pragma once
/*
================================================================================
Fragment 9.5 - IO: Dispatch + Annual Stack CSV Export
FILE: cpp/engine/io/dispatch_csv.hpp

Purpose:
  - Tabular export of an hourly dispatch (one row per hour) and of the
    annual energy stack (one row per year) for spreadsheets and plotting.

Hardening:
  - Stable column order; header row carries units.
  - Non-finite values (e.g. +inf annual LCOE) export as an empty cell.
================================================================================
*/

#include <string>
#include <vector>

#include "engine/dispatch/dispatch_simulator.hpp"
#include "engine/planning/annual_stack.hpp"

namespace powerplan {

struct CsvExportOptions {
  bool include_header = true;
  char delimiter = ',';
  int precision = 4;  // digits after the decimal point
};

// hour,load_mw,recip_mw,turbine_mw,solar_mw,bess_discharge_mw,bess_charge_mw,
// bess_soc_mwh,grid_mw,unserved_mw,curtailed_mw
std::string dispatch_to_csv(const DispatchResult& d, const CsvExportOptions& opt = CsvExportOptions());

std::string annual_stack_to_csv(const std::vector<AnnualStackRow>& rows,
                                const CsvExportOptions& opt = CsvExportOptions());

// Returns true on success, false on I/O error.
bool write_dispatch_csv_file(const DispatchResult& d, const std::string& file_path,
                             const CsvExportOptions& opt = CsvExportOptions());

bool write_annual_stack_csv_file(const std::vector<AnnualStackRow>& rows, const std::string& file_path,
                                 const CsvExportOptions& opt = CsvExportOptions());

} // namespace powerplan
