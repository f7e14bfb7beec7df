/*
  Fragment 9.9 - CSV Export Selftest

  Framework-free checks for the dispatch and annual-stack CSV exports:
    1) Header plus one row per hour; short series pad with zeros.
    2) Delimiter, precision and header options are honoured.
    3) +inf annual LCOE exports as an empty cell.
    4) Unwritable paths report failure instead of throwing.

  Run: ./dispatch_csv_selftest (non-zero exit on failure)
*/

#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/io/dispatch_csv.hpp"

namespace powerplan {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

std::vector<std::string> lines_of(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream is(text);
  for (std::string line; std::getline(is, line);) out.push_back(line);
  return out;
}

void test_dispatch_csv() {
  DispatchResult d;
  d.load_mw = {10.0, 12.5};
  d.recip_mw = {10.0, 12.0};
  d.unserved_mw = {0.0, 0.5};

  const std::vector<std::string> rows = lines_of(dispatch_to_csv(d));
  expect_true(rows.size() == 3, "Header plus one row per hour");
  expect_true(rows[0].rfind("hour,load_mw,recip_mw,", 0) == 0, "Header names the columns");
  expect_eq_str(rows[2], "1,12.5000,12.0000,0.0000,0.0000,0.0000,0.0000,0.0000,0.0000,0.5000,0.0000",
                "Missing series export as zero");

  CsvExportOptions opt;
  opt.include_header = false;
  opt.delimiter = ';';
  opt.precision = 1;
  const std::vector<std::string> bare = lines_of(dispatch_to_csv(d, opt));
  expect_true(bare.size() == 2, "No header when disabled");
  expect_eq_str(bare[0], "0;10.0;10.0;0.0;0.0;0.0;0.0;0.0;0.0;0.0;0.0", "Delimiter and precision applied");
}

void test_annual_stack_csv() {
  AnnualStackRow year;
  year.year = 2028;
  year.peak_mw = 0.0;
  year.equipment.recip_units = 3;
  year.annual_lcoe = std::numeric_limits<double>::infinity();
  year.grid_available = true;

  const std::vector<std::string> rows = lines_of(annual_stack_to_csv({year}));
  expect_true(rows.size() == 2, "Header plus one row per year");
  expect_true(rows[1].rfind("2028,0.0000,3,0,", 0) == 0, "Year, peak and unit counts lead the row");
  expect_true(rows[1].size() >= 6 && rows[1].substr(rows[1].size() - 6) == ",,true", "+inf LCOE is an empty cell");
}

void test_unwritable_path() {
  const DispatchResult d{};
  expect_true(!write_dispatch_csv_file(d, "/nonexistent/powerplan/dispatch.csv"), "Unwritable dispatch path -> false");
  expect_true(!write_annual_stack_csv_file({}, "/nonexistent/powerplan/stack.csv"), "Unwritable stack path -> false");
}

}  // namespace
}  // namespace powerplan

int main() {
  using namespace powerplan;

  test_dispatch_csv();
  test_annual_stack_csv();
  test_unwritable_path();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
