/*
  Fragment 7.2 - Pipeline Selftest

  Objective
  ---------
  End-to-end run of the facade on a synthetic three-file session:
    1) parse_and_structure from disk and from memory agree.
    2) detect() finds the four boundaries of a clean profile:
         first input t=0, approach t=50, final approach t=80, docking t=120.
    3) evaluate("Total") fills phase and flight-level metrics and returns
       error timestamps.
    4) grade() refuses a scenario without a reference database and tiers
       against one once it exists.
    5) Unknown phase names and descending boundaries are rejected.

  Expected use
  ------------
      ./dockeval_pipeline_selftest
  Non-zero return code indicates failure. Writes below the system temp
  directory and removes it again.
*/

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "dockeval/core/diagnostics.hpp"
#include "dockeval/core/errors.hpp"
#include "dockeval/core/hashing.hpp"
#include "dockeval/core/settings.hpp"
#include "dockeval/db/historical_database.hpp"
#include "dockeval/eval/metric_catalog.hpp"
#include "dockeval/eval/result_record.hpp"
#include "dockeval/eval/schema.hpp"
#include "dockeval/grading/reference_cache.hpp"
#include "dockeval/log/structurer.hpp"
#include "dockeval/pipeline/pipeline.hpp"

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

template <class E, class F>
void expect_throws(F&& fn, std::string_view msg) {
  try {
    fn();
  } catch (const E&) {
    pass(msg);
    return;
  }
  fail(msg);
}

const char* kHeader =
    "SimTime; THC.x; THC.y; THC.z; RHC.x; RHC.y; RHC.z; "
    "COG Pos.x [m]; COG Pos.y [m]; COG Pos.z [m]; COG Vel.x [m]; COG Vel.y [m]; COG Vel.z [m]; "
    "Port Pos.x [m]; Port Pos.y [m]; Port Pos.z [m]; "
    "Rot Angle.x [deg]; Rot Angle.y [deg]; Rot Angle.z [deg]; "
    "Rot. Rate.x [deg/s]; Rot. Rate.y [deg/s]; Rot. Rate.Z [deg/s]; Tank mass [kg];";

constexpr int kLastRow = 125;
constexpr double kTankStart = 1000.0;
constexpr double kBurnPerSecond = 0.5;

// One sample per second. Approach velocity passes -0.1 at t=50 while still
// falling, COG Pos.x drops below 20 at t=80, the port reaches x=0 at t=120.
std::string sample_row(int t) {
  const double thc_y = t <= 3 ? 0.5 : 0.0;
  const double rhc_y = (t >= 90 && t <= 92) ? 1.0 : 0.0;
  const double pos_x = 99.5 - t;
  double vel_x = -0.05;
  if (t >= 50 && t <= 60) vel_x = -0.1 - 0.01 * (t - 50);
  else if (t > 60) vel_x = -0.2;
  const double port_x = t < 120 ? 120.0 - t : 0.0;
  const double tank = kTankStart - kBurnPerSecond * t;

  std::ostringstream os;
  os << t << "; 0; " << thc_y << "; 0; 0; " << rhc_y << "; 0; " << pos_x << "; 0.5; 0; " << vel_x << "; 0; 0; "
     << port_x << "; 0; 0; 0; 0; 0; 0; 0; 0; " << tank << ";\n";
  return os.str();
}

std::string rows_text(int from, int to) {
  std::string out;
  for (int t = from; t <= to; ++t) out += sample_row(t);
  return out;
}

std::vector<LogSegment> session_segments() {
  const std::string metadata =
      "# Logger Version: 2.0.1\n"
      "# SESSION_ID: 7\n"
      "# PILOT: tester\n"
      "# TIME: 2024-02-09 08:00:00\n"
      "# SCENARIO: Soyuz\n";
  return {
      LogSegment{"FDL_test_0000.log", metadata + kHeader + "\n" + rows_text(0, 40)},
      LogSegment{"FDL_test_0001.log", std::string(kHeader) + "\n" + rows_text(41, 90)},
      LogSegment{"FDL_test_0002.log", std::string(kHeader) + "\n" + rows_text(91, kLastRow) + "# Log stopped.\n"},
  };
}

Schema full_schema() {
  std::vector<std::string> names{field::kFlightId, field::kScenario,      field::kPilot,
                                 field::kSessionId, field::kDate,         field::kLoggerVersion,
                                 field::kManuallyModified};
  for (const auto& id : all_metrics()) names.push_back(metric_name(id));
  return Schema::from_names(names);
}

void test_end_to_end() {
  const fs::path root = fs::temp_directory_path() / "dockeval_pipeline_selftest";
  fs::remove_all(root);
  fs::create_directories(root / "logs");

  std::vector<std::string> paths;
  for (const auto& seg : session_segments()) {
    const fs::path p = root / "logs" / seg.name;
    std::ofstream f(p, std::ios::binary);
    f << seg.text;
    paths.push_back(p.string());
  }

  Settings settings;
  settings.storage.database_dir = (root / "database").string();
  settings.storage.series_dir = (root / "data").string();
  const Schema schema = full_schema();

  // Reversed selection: the validator sorts by file number.
  const StructuredFlight flight = parse_and_structure({paths[2], paths[0], paths[1]}, schema, settings);
  expect_true(flight.series.rows() == kLastRow + 1, "pipeline: all rows from three files");
  expect_true(flight.record.text(field::kFlightId) == sha256_hex("FDL_test_0000.log"), "pipeline: Flight ID");
  expect_true(flight.record.text(field::kScenario) == "Soyuz", "pipeline: scenario from metadata");
  expect_true(flight.record.text(field::kManuallyModified) == "No", "pipeline: boundaries not modified yet");
  expect_true(flight.series.has(col::kIdealApproachVel) && flight.series.has(col::kLateralOffset),
              "pipeline: derived columns present");

  const std::vector<LogSegment> segs = session_segments();
  const StructuredFlight in_memory = parse_and_structure({segs[1], segs[2], segs[0]}, schema, settings);
  expect_true(in_memory.series.rows() == flight.series.rows() &&
                  in_memory.record.text(field::kFlightId) == flight.record.text(field::kFlightId),
              "pipeline: in-memory session matches files");

  CollectingDiagnosticSink sink;
  const PhaseDetection det = detect(flight.series, settings, sink);
  expect_true(!det.any_backup(), "pipeline: no backup boundaries");
  expect_near(det.boundaries[0], 0.0, 0.0, "pipeline: alignment starts at first input");
  expect_near(det.boundaries[1], 50.0, 0.0, "pipeline: approach starts at t=50");
  expect_near(det.boundaries[2], 80.0, 0.0, "pipeline: final approach starts at t=80");
  expect_near(det.boundaries[3], 120.0, 0.0, "pipeline: docking at t=120");

  ResultRecord record = flight.record;
  const ErrorTimestamps errors =
      evaluate(flight.series, "Total", 0, 3, det.boundaries, schema, record, sink, settings);
  expect_near(*record.number("Time_Dock"), 120.0, 0.0, "pipeline: Time_Dock");
  expect_near(*record.number("Start_Total"), 0.0, 0.0, "pipeline: Start_Total");
  expect_near(*record.number("Duration_Total"), 120.0, 0.0, "pipeline: Duration_Total");
  expect_near(*record.number("Fuel_Total"), kBurnPerSecond * 120.0, 1e-9, "pipeline: Fuel_Total is tank(0) - tank(120)");
  expect_near(*record.number("THCy_Total"), 1.0, 0.0, "pipeline: one THC.y input");
  expect_near(*record.number("RHCy_Total"), 1.0, 0.0, "pipeline: one RHC.y input");
  expect_near(*record.number("LatOffAvg_Total"), 0.5, 1e-12, "pipeline: lateral offset mean");
  expect_true(errors.size() == 6, "pipeline: error timestamps per controller axis");
  expect_true(errors.count(col::kThcY) && errors.at(col::kThcY).size() == 1 && errors.at(col::kThcY)[0] == 0.0,
              "pipeline: THC.y push away from the axis at t=0");
  expect_true(record.get("Fuel_Align")->is_null(), "pipeline: other phases untouched");

  const ErrorTimestamps none = evaluate_all(flight.series, det.boundaries, schema, record, sink, settings);
  expect_near(*record.number("Fuel_Appr"), kBurnPerSecond * 30.0, 1e-9, "pipeline: Fuel_Appr");
  expect_near(*record.number("Duration_FA"), 40.0, 0.0, "pipeline: Duration_FA");
  expect_true(none.size() == 6, "pipeline: evaluate_all returns the Total error timestamps");

  expect_throws<ValidationError>(
      [&] { evaluate(flight.series, "Docking", 0, 3, det.boundaries, schema, record, sink, settings); },
      "pipeline: unknown phase name rejected");
  expect_throws<ValidationError>(
      [&] {
        evaluate(flight.series, "Total", 0, 3, PhaseBoundaries{0.0, 80.0, 50.0, 120.0}, schema, record, sink,
                 settings);
      },
      "pipeline: descending boundaries rejected");

  expect_throws<ReferenceDatabaseMissing>([&] { grade(record, "Total Flight", schema, settings); },
                                          "pipeline: grading without reference database");

  HistoricalDatabase reference;
  for (int i = 0; i < 12; ++i) {
    ResultRecord r;
    r.set_string(field::kFlightId, "ref" + std::to_string(i));
    r.set_string(field::kScenario, "Soyuz");
    r.set_number("Fuel_Total", 50.0 + 1.5 * i);
    r.set_number("THCy_Total", static_cast<double>(i % 4), true);
    r.set_number("Time_Dock", 110.0 + i);
    reference.upsert(std::move(r));
  }
  reference.save(database_file_path(settings.storage, "Soyuz"));

  expect_throws<ValidationError>([&] { grade(record, "Docking", schema, settings); },
                                 "pipeline: unknown grading phase rejected");

  ReferenceStatsCache cache;
  const GradeReport report = grade(record, "Total Flight", schema, settings, &cache);
  expect_true(report.scenario == "Soyuz" && report.tiered.size() == 3, "pipeline: three reference metrics graded");
  const TieredMetric* fuel = report.find("Fuel_Total");
  expect_true(fuel && fuel->tier != Tier::kNotTierable, "pipeline: Fuel_Total tiered");
  expect_true(report.required_rows.size() == 12, "pipeline: complete reference rows");

  const GradeReport again = grade(record, "Total Flight", schema, settings, &cache);
  expect_true(again.find("Fuel_Total") && again.find("Fuel_Total")->tier == fuel->tier,
              "pipeline: cached grading is stable");

  fs::remove_all(root);
}

} // namespace
} // namespace dockeval

int main() {
  using namespace dockeval;

  try {
    test_end_to_end();
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
