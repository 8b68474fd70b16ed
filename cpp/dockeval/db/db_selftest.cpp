/*
  Fragment 6.4 - DB Selftest

  Objective
  ---------
  Framework-free checks for the storage layer:
    1) Series CSV export is exact and keeps NaN as an empty field.
    2) Database lines: duplicate Flight IDs upsert, serialization fills the
       column union with null, null-only columns drop.
    3) Reference columns report integer typing and nulls.
    4) add_flight strips identity fields and reports replacements.
    5) Path resolution and rebuild of a stored scenario, including a flight
       whose series file is gone.

  Expected use
  ------------
      ./dockeval_db_selftest
  Non-zero return code indicates failure. Writes below the system temp
  directory and removes it again.
*/

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "dockeval/core/diagnostics.hpp"
#include "dockeval/core/errors.hpp"
#include "dockeval/core/settings.hpp"
#include "dockeval/db/historical_database.hpp"
#include "dockeval/db/rebuild.hpp"
#include "dockeval/db/series_csv.hpp"
#include "dockeval/eval/result_record.hpp"
#include "dockeval/eval/schema.hpp"
#include "dockeval/log/structurer.hpp"

namespace dockeval {
namespace {

namespace fs = std::filesystem;

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

void expect_near(double a, double b, double tol, std::string_view msg) {
  if (!(std::fabs(a - b) <= tol)) {
    fail(msg);
    std::cerr << "  got " << a << " expected " << b << "\n";
  } else {
    pass(msg);
  }
}

// Fresh scratch directory per test.
fs::path scratch_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() / ("dockeval_db_selftest_" + name);
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

StorageSettings storage_in(const fs::path& root) {
  StorageSettings s;
  s.database_dir = (root / "database").string();
  s.series_dir = (root / "data").string();
  return s;
}

void write_text(const fs::path& p, const std::string& text) {
  fs::create_directories(p.parent_path());
  std::ofstream f(p, std::ios::binary);
  f << text;
}

// Every column the Total phase touches when it collects error timestamps.
FlightSeries docking_series(const std::vector<double>& thc_y) {
  const std::size_t n = thc_y.size();
  std::vector<double> t(n);
  for (std::size_t i = 0; i < n; ++i) t[i] = static_cast<double>(i);
  const std::vector<double> zeros(n, 0.0);

  std::vector<std::string> names{kSimTime,        col::kThcX,       col::kThcY,     col::kThcZ,
                                 col::kRhcX,      col::kRhcY,       col::kRhcZ,     col::kCogPosX,
                                 col::kCogPosY,   col::kCogPosZ,    col::kCogVelX,  col::kCogVelY,
                                 col::kCogVelZ,   col::kRotAngleX,  col::kRotAngleY, col::kRotAngleZ,
                                 col::kIdealApproachVel};
  std::vector<std::vector<double>> cols{t, zeros, thc_y, zeros, zeros, zeros, zeros, zeros, zeros,
                                        zeros, zeros, zeros, zeros, zeros, zeros, zeros, zeros};
  return FlightSeries::from_columns(std::move(names), std::move(cols));
}

void test_series_csv() {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const FlightSeries s = FlightSeries::from_columns(
      {kSimTime, "a,b", "c"}, {{0.0, 0.1, 0.30000000000000004}, {0.1 + 0.2, nan, -1e-300}, {1.0, 2.0, 3.0}});

  const std::string text = series_to_csv(s);
  expect_true(text.rfind("SimTime,\"a,b\",c\n", 0) == 0, "csv: header quotes names with commas");

  const FlightSeries back = series_from_csv(text);
  expect_true(back.names() == s.names(), "csv: column order kept");
  expect_true(back.at("a,b", 0) == 0.1 + 0.2, "csv: doubles survive exactly");
  expect_true(back.at("a,b", 2) == -1e-300, "csv: tiny values survive exactly");
  expect_true(back.sim_time()[2] == 0.30000000000000004, "csv: SimTime survives exactly");
  expect_true(std::isnan(back.at("a,b", 1)), "csv: NaN reads back as NaN");

  try {
    series_from_csv("SimTime,x\n0,1\n1\n", "short.csv");
    fail("csv: short row must throw");
  } catch (const ValidationError& e) {
    expect_true(std::string(e.what()).find("short.csv:3") != std::string::npos, "csv: short row names its line");
  }

  try {
    series_from_csv("", "empty.csv");
    fail("csv: empty text must throw");
  } catch (const ValidationError&) {
    pass("csv: empty text rejected");
  }
}

void test_database_lines() {
  const std::string text =
      "{\"Flight ID\":\"a\",\"Scenario\":\"S\",\"Fuel_Total\":1.5,\"THCy_Total\":2}\n"
      "\n"
      "{\"Flight ID\":\"b\",\"Scenario\":\"S\",\"Fuel_Total\":2.5,\"Extra\":null}\n"
      "{\"Flight ID\":\"a\",\"Scenario\":\"S\",\"Fuel_Total\":3.5,\"THCy_Total\":4}\n";
  HistoricalDatabase db = HistoricalDatabase::parse(text, "S.json");

  expect_true(db.size() == 2, "db: duplicate Flight ID resolves to one record");
  expect_true(db.records().back().text("Flight ID") == "a", "db: newest duplicate moves to the end");
  expect_near(*db.find("a")->number("Fuel_Total"), 3.5, 0.0, "db: newest duplicate wins");

  const std::vector<std::string> cols = db.columns();
  expect_true(cols.size() == 5 && cols[3] == "Extra" && cols[4] == "THCy_Total", "db: column union in first-seen order");

  const std::string out = db.serialize();
  expect_true(out.find("{\"Flight ID\":\"b\",\"Scenario\":\"S\",\"Fuel_Total\":2.5,\"Extra\":null,\"THCy_Total\":null}") !=
                  std::string::npos,
              "db: serialize fills missing columns with null");
  expect_true(out.find("\"THCy_Total\":4}") != std::string::npos, "db: integers stay integers");

  const ReferenceColumn thc = db.column("THCy_Total");
  expect_true(thc.integral && thc.has_nulls && thc.values.size() == 1, "db: reference column skips nulls");
  const ReferenceColumn fuel = db.column("Fuel_Total");
  expect_true(!fuel.integral && !fuel.has_nulls && fuel.values.size() == 2, "db: float column");

  db.drop_null_columns();
  expect_true(!db.has_column("Extra") && db.has_column("THCy_Total"), "db: only null-only columns drop");

  db.align_to_schema(Schema::from_names({"Flight ID", "Scenario", "Fuel_Total", "Time_Dock"}));
  expect_true(!db.has_column("THCy_Total"), "db: align drops columns outside the schema");
  expect_true(db.find("b")->get("Time_Dock")->is_null(), "db: align adds schema columns as null");

  try {
    HistoricalDatabase::parse("{\"Flight ID\":\"a\"}\n[1,2]\n", "bad.json");
    fail("db: non-object line must throw");
  } catch (const ValidationError& e) {
    expect_true(std::string(e.what()).find("bad.json:2") != std::string::npos, "db: bad line names its line");
  }
}

void test_add_flight() {
  const fs::path root = scratch_dir("add");
  const StorageSettings storage = storage_in(root);

  ResultRecord rec;
  rec.set_string("Flight ID", "f1");
  rec.set_string("Scenario", "Dock1");
  rec.set_string("Pilot", "P");
  rec.set_string("Session ID", "0000");
  rec.set_string("Logger Version", "1.0");
  rec.set_number("Fuel_Total", 4.0);
  rec.set_null("NoVisTime_Total");

  const FlightSeries series = docking_series({0, 1, 0});
  const AddFlightResult first = add_flight(rec, series, storage);
  expect_true(!first.replaced && first.record_count == 1, "add: first flight added");
  expect_true(fs::path(first.database_path).filename() == "Dock1_flight_data.json", "add: database file name");
  expect_true(fs::path(first.series_path) == root / "data" / "Dock1" / "f1.csv", "add: series file path");

  const HistoricalDatabase db = HistoricalDatabase::load(first.database_path);
  const ResultRecord* stored = db.find("f1");
  expect_true(stored && !stored->has("Pilot") && !stored->has("Session ID") && !stored->has("Logger Version"),
              "add: identity fields removed");
  expect_true(stored && !stored->has("NoVisTime_Total"), "add: null-only column dropped");

  const FlightSeries back = read_series_csv(first.series_path);
  expect_true(back.rows() == 3 && back.at(col::kThcY, 1) == 1.0, "add: series exported");

  rec.set_number("Fuel_Total", 5.0);
  const AddFlightResult second = add_flight(rec, series, storage);
  expect_true(second.replaced && second.record_count == 1, "add: same Flight ID replaces");
  expect_near(*HistoricalDatabase::load(second.database_path).find("f1")->number("Fuel_Total"), 5.0, 0.0,
              "add: replacement stored");

  ResultRecord anonymous;
  anonymous.set_string("Scenario", "Dock1");
  try {
    add_flight(anonymous, series, storage);
    fail("add: record without Flight ID must throw");
  } catch (const ValidationError&) {
    pass("add: record without Flight ID rejected");
  }

  fs::remove_all(root);
}

void test_path_resolution() {
  const fs::path root = scratch_dir("paths");
  const StorageSettings storage = storage_in(root);

  try {
    resolve_database_path(storage, "Nowhere");
    fail("paths: missing database must throw");
  } catch (const ReferenceDatabaseMissing& e) {
    expect_true(e.scenario() == "Nowhere", "paths: missing database names its scenario");
  }

  write_text(root / "database" / "Legacy.json", "");
  expect_true(fs::path(resolve_database_path(storage, "Legacy")).filename() == "Legacy.json",
              "paths: <Scenario>.json accepted");

  write_text(root / "database" / "Legacy_flight_data.json", "");
  expect_true(fs::path(resolve_database_path(storage, "Legacy")).filename() == "Legacy_flight_data.json",
              "paths: <Scenario>_flight_data.json preferred");

  fs::remove_all(root);
}

void test_rebuild() {
  ResultRecord partial;
  partial.set_number("Start_Align", 1.0);
  partial.set_number("Start_Appr", 3.0);
  try {
    stored_boundaries(partial);
    fail("rebuild: missing boundary must throw");
  } catch (const ValidationError& e) {
    expect_true(std::string(e.what()).find("Start_FA") != std::string::npos, "rebuild: missing boundary named");
  }

  const fs::path root = scratch_dir("rebuild");
  Settings settings;
  settings.storage = storage_in(root);

  write_text(root / "database" / "Dock2_flight_data.json",
             "{\"Flight ID\":\"good\",\"Scenario\":\"Dock2\",\"Start_Align\":1.0,\"Start_Appr\":3.0,"
             "\"Start_FA\":5.0,\"Time_Dock\":8.0,\"Duration_Total\":999.0,\"THCy_Total\":0,\"Stale\":1}\n"
             "{\"Flight ID\":\"lost\",\"Scenario\":\"Dock2\",\"Start_Align\":1.0,\"Start_Appr\":3.0,"
             "\"Start_FA\":5.0,\"Time_Dock\":8.0,\"Duration_Total\":42.0,\"THCy_Total\":0,\"Stale\":1}\n");
  write_series_csv(docking_series({0, 0, 1, 1, 0, 1, 1, 1, 0, 0}),
                   series_file_path(settings.storage, "Dock2", "good"));

  const Schema schema = Schema::from_names({"Flight ID", "Scenario", "Start_Align", "Start_Appr", "Start_FA",
                                            "Time_Dock", "Duration_Total", "THCy_Total"});
  CollectingDiagnosticSink sink;
  const RebuildReport report = rebuild_database(schema, settings, sink);

  expect_true(report.processed == 2 && report.rebuilt == 1 && report.failed() == 1, "rebuild: one of two flights rebuilt");
  expect_true(!report.failures.empty() && report.failures[0].rfind("lost: ", 0) == 0, "rebuild: failure names the flight");

  const HistoricalDatabase db = HistoricalDatabase::load(database_file_path(settings.storage, "Dock2"));
  expect_true(db.size() == 2, "rebuild: failing flight kept");
  expect_true(!db.has_column("Stale"), "rebuild: columns outside the schema dropped");
  expect_near(*db.find("good")->number("Duration_Total"), 7.0, 0.0, "rebuild: duration recomputed");
  expect_near(*db.find("good")->number("THCy_Total"), 2.0, 0.0, "rebuild: inputs recomputed");
  expect_near(*db.find("lost")->number("Duration_Total"), 42.0, 0.0, "rebuild: failing flight unchanged");

  fs::remove_all(root);
}

} // namespace
} // namespace dockeval

int main() {
  using namespace dockeval;

  try {
    test_series_csv();
    test_database_lines();
    test_add_flight();
    test_path_resolution();
    test_rebuild();
  } catch (const std::exception& e) {
    fail(std::string("unexpected exception: ") + e.what());
  }

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
