/*
  Fragment 4.9 - Evaluation Selftest

  Objective
  ---------
  Framework-free checks for the evaluation layer:
    1) Edge-run reconciliation on hand-computed signals (run already active
       at window start, still active at window stop, unmatched fallback).
    2) Engine dispatch for requested metrics only, with count metrics stored
       as integers.
    3) Lookup misses: required metrics throw, optional ones are skipped.
    4) Spectral power equals mean(x^2).
    5) Catalog naming and schema-driven requests.
    6) Hand-computed run conditions: THC.x error flags, velocity-gated THC
       vs ungated RHC steering errors, IndErr, CombJoy (plus yz/xyz), level
       runs (OutOfCone, AboveClosingVel, NoVisTime) and Fuel_on_Error.

  Expected use
  ------------
      ./dockeval_eval_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "dockeval/core/diagnostics.hpp"
#include "dockeval/core/errors.hpp"
#include "dockeval/core/json.hpp"
#include "dockeval/eval/edge_runs.hpp"
#include "dockeval/eval/evaluation_engine.hpp"
#include "dockeval/eval/metric_catalog.hpp"
#include "dockeval/eval/result_record.hpp"
#include "dockeval/eval/run_conditions.hpp"
#include "dockeval/eval/schema.hpp"
#include "dockeval/eval/spectral.hpp"
#include "dockeval/log/structurer.hpp"

namespace dockeval {
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

void expect_near(double a, double b, double tol, std::string_view msg) {
  if (!(std::fabs(a - b) <= tol)) {
    fail(msg);
    std::cerr << "  got " << a << " expected " << b << "\n";
  } else {
    pass(msg);
  }
}

// SimTime 0..n-1, six controller axes (THC.y carries `thc_y`), plus extras.
FlightSeries controller_series(const std::vector<double>& thc_y,
                               std::vector<std::string> extra_names = {},
                               std::vector<std::vector<double>> extra_cols = {}) {
  const std::size_t n = thc_y.size();
  std::vector<double> t(n);
  for (std::size_t i = 0; i < n; ++i) t[i] = static_cast<double>(i);
  const std::vector<double> zeros(n, 0.0);

  std::vector<std::string> names{kSimTime, col::kThcX, col::kThcY, col::kThcZ,
                                 col::kRhcX, col::kRhcY, col::kRhcZ};
  std::vector<std::vector<double>> cols{t, zeros, thc_y, zeros, zeros, zeros, zeros};
  for (std::size_t i = 0; i < extra_names.size(); ++i) {
    names.push_back(std::move(extra_names[i]));
    cols.push_back(std::move(extra_cols[i]));
  }
  return FlightSeries::from_columns(std::move(names), std::move(cols));
}

using ColumnOverrides = std::vector<std::pair<std::string, std::vector<double>>>;

// SimTime 0..n-1 plus every column the engine reads, zero unless overridden.
FlightSeries docking_series(std::size_t n, const ColumnOverrides& overrides) {
  std::vector<std::string> names{kSimTime,           col::kThcX,          col::kThcY,           col::kThcZ,
                                 col::kRhcX,         col::kRhcY,          col::kRhcZ,           col::kCogPosX,
                                 col::kCogPosY,      col::kCogPosZ,       col::kCogVelX,        col::kCogVelY,
                                 col::kCogVelZ,      col::kRotAngleX,     col::kRotAngleY,      col::kRotAngleZ,
                                 col::kTankMass,     col::kLateralOffset, col::kApproachCone,   col::kIdealApproachVel,
                                 col::kAngleToPort};
  std::vector<std::vector<double>> cols(names.size(), std::vector<double>(n, 0.0));
  for (std::size_t i = 0; i < n; ++i) cols[0][i] = static_cast<double>(i);

  for (const auto& [name, values] : overrides) {
    std::size_t c = 0;
    while (c < names.size() && names[c] != name) ++c;
    if (c == names.size()) throw ValidationError("docking_series: unknown column " + name);
    cols[c] = values;
  }
  return FlightSeries::from_columns(std::move(names), std::move(cols));
}

void test_edge_run_example() {
  const FlightSeries s = controller_series({0, 0, 1, 1, 0, 1, 1, 1, 0});
  const PhaseWindow w = make_window(s, 1.0, 8.0);
  const RunConditions rc = controller_run_conditions(s, w, Controller::kThc, Axis::kY);

  CollectingDiagnosticSink sink;
  const RunPairs runs = reconcile_runs(s, rc.start, rc.stop, w.t0, w.t1, "THC.y", sink);
  expect_true(runs.size() == 2, "edge runs: 2 occurrences in [1, 8)");
  expect_near(runs.total_duration(), 5.0, 0.0, "edge runs: (4-2) + (8-5) = 5");
  expect_near(runs.mean_duration(), 2.5, 0.0, "edge runs: mean duration 2.5");
  expect_true(!runs.used_fallback && sink.items().empty(), "edge runs: no fallback");
}

void test_edge_run_active_at_entry() {
  const FlightSeries s = controller_series({0, 1, 1, 1, 0, 0});
  const PhaseWindow w = make_window(s, 2.0, 6.0);
  const RunConditions rc = controller_run_conditions(s, w, Controller::kThc, Axis::kY);

  CollectingDiagnosticSink sink;
  const RunPairs runs = reconcile_runs(s, rc.start, rc.stop, w.t0, w.t1, "THC.y", sink);
  expect_true(runs.size() == 1 && runs.starts[0] == 2.0, "edge runs: window start prepended");
  expect_near(runs.total_duration(), 2.0, 0.0, "edge runs: active-at-entry duration");
}

void test_edge_run_fallback() {
  const FlightSeries s = controller_series({0, 0, 0, 0, 0, 0});
  const RowMask start{false, true, false, true, false, true};
  const RowMask stop(6, false);

  CollectingDiagnosticSink sink;
  const RunPairs runs = reconcile_runs(s, start, stop, 0.0, 6.0, "THC.y", sink);
  expect_true(runs.used_fallback && sink.contains(DiagnosticKind::kEdgeMismatch),
              "edge runs: unmatched lists use the next-sample fallback");
  expect_true(runs.stops.size() == 3 && runs.stops[0] == 2.0 && runs.stops[1] == 4.0,
              "edge runs: fallback stop is the next SimTime");
  expect_true(std::isnan(runs.stops[2]) && std::isnan(runs.total_duration()),
              "edge runs: last row has no next sample");
}

MetricRequest request_for(std::initializer_list<const char*> names, bool optional = false) {
  MetricRequest r;
  for (const char* n : names) {
    const auto id = parse_metric_name(n);
    if (!id) throw ValidationError(std::string("unknown metric in test: ") + n);
    r.add(*id, optional);
  }
  return r;
}

void test_engine_dispatch() {
  const FlightSeries s = controller_series({0, 0, 1, 1, 0, 1, 1, 1, 0, 0});
  const PhaseBoundaries b{1.0, 3.0, 5.0, 8.0};
  const MetricRequest req = request_for({"THCy_Align", "THCyAvgTime_Align", "Start_Align", "Duration_Align"});

  ResultRecord rec;
  CollectingDiagnosticSink sink;
  const ErrorTimestamps e = evaluate_phase(s, Phase::kAlign, 0, 3, b, req, rec, sink);

  expect_true(e.empty(), "engine: non-Total phase returns no error timestamps");
  expect_near(rec.number("THCy_Align").value_or(-1.0), 2.0, 0.0, "engine: THCy_Align = 2");
  expect_true(rec.get("THCy_Align")->integral, "engine: count metric stored as integer");
  expect_near(rec.number("THCyAvgTime_Align").value_or(-1.0), 2.5, 0.0, "engine: THCyAvgTime_Align = 2.5");
  expect_near(rec.number("Start_Align").value_or(-1.0), 1.0, 0.0, "engine: Start_Align = b[0]");
  expect_near(rec.number("Duration_Align").value_or(-1.0), 7.0, 0.0, "engine: Duration_Align = b[3] - b[0]");
  expect_true(rec.get("THCx_Align") == nullptr, "engine: unrequested metric not computed");

  try {
    evaluate_phase(s, Phase::kAlign, 2, 1, b, req, rec, sink);
    fail("engine: reversed indices must throw");
  } catch (const ValidationError&) {
    pass("engine: reversed indices rejected");
  }
}

void test_lookup_miss() {
  const FlightSeries s = controller_series({0, 0, 0, 0}, {col::kTankMass, col::kLateralOffset},
                                          {{10, 9, 8, 7}, {1, 2, 3, 4}});
  const PhaseBoundaries b{0.5, 2.0, 2.0, 3.0};

  ResultRecord rec;
  CollectingDiagnosticSink sink;
  try {
    evaluate_phase(s, Phase::kAlign, b, request_for({"Fuel_Align"}), rec, sink);
    fail("lookup: required metric must throw");
  } catch (const PhaseDataUnavailable& e) {
    expect_true(e.metric() == "Fuel_Align" && e.sim_time() == 0.5, "lookup: miss names metric and SimTime");
  }

  evaluate_phase(s, Phase::kAlign, b, request_for({"Fuel_Align"}, true), rec, sink);
  expect_true(rec.get("Fuel_Align") == nullptr && sink.contains(DiagnosticKind::kSkippedMetric),
              "lookup: optional metric skipped with diagnostic");

  // Exact rows: fuel burned between t=2 and t=3, averages over [2, 3).
  evaluate_phase(s, Phase::kFA, b, request_for({"Fuel_FA", "LatOffAvg_FA", "LatOffRms_FA"}), rec, sink);
  expect_near(rec.number("Fuel_FA").value_or(-1.0), 1.0, 0.0, "engine: Fuel_FA = tank(t0) - tank(t1)");
  expect_near(rec.number("LatOffAvg_FA").value_or(-1.0), 3.0, 0.0, "engine: LatOffAvg_FA over one row");
  expect_near(rec.number("LatOffRms_FA").value_or(-1.0), 3.0, 0.0, "engine: LatOffRms_FA over one row");
}

void test_thc_x_error_flags() {
  // Ideal approach velocity -0.2. Flags:
  //   t=1 fresh push while too fast, t=4 too fast again under a held push,
  //   t=7 fresh outward push while moving away.
  // Not flagged: t=2 (held push, already too fast), t=5 (push was not
  // released), t=8 (pushing out while still closing).
  const FlightSeries s = docking_series(
      9, {{col::kCogVelX, {-0.1, -0.3, -0.3, -0.1, -0.3, 0.1, 0.1, 0.1, -0.05}},
          {col::kThcX, {0, -1, -1, -1, -1, 1, 0, 1, 1}},
          {col::kThcZ, {0, 0, 0, 0, 1, 0, 0, 0, 0}},
          {col::kIdealApproachVel, std::vector<double>(9, -0.2)}});
  const PhaseWindow w = make_window(s, 0.0, 9.0);
  const RowMask flagged = thc_x_error_rows(s, w);
  expect_true(count_true(flagged) == 3 && flagged[1] && flagged[4] && flagged[7],
              "thc.x errors: rows 1, 4 and 7");

  ResultRecord rec;
  CollectingDiagnosticSink sink;
  const ErrorTimestamps e = evaluate_phase(s, Phase::kTotal, PhaseBoundaries{0.0, 3.0, 6.0, 9.0},
                                           request_for({"THCxErr_Total", "THCxIndErr_Total"}), rec, sink);
  expect_near(rec.number("THCxErr_Total").value_or(-1.0), 3.0, 0.0, "engine: THCxErr_Total = 3");
  expect_near(rec.number("THCxIndErr_Total").value_or(-1.0), 1.0, 0.0,
              "engine: THCxIndErr_Total counts THC.z at t=4");
  expect_true(e.at(col::kThcX) == std::vector<double>({1.0, 4.0, 7.0}), "engine: THC.x error timestamps");
}

void test_steering_error_gating() {
  // Same deviation and input pattern on THC.y and RHC.y. The craft drifts
  // back toward the axis from t=3 on, so the second THC.y push is braking.
  const std::vector<double> input{0, 1, 0, 1, 0, 0};
  const FlightSeries s = docking_series(
      6, {{col::kThcY, input},
          {col::kCogPosY, std::vector<double>(6, 1.0)},
          {col::kCogVelY, {0.1, 0.1, 0.1, -0.1, -0.1, -0.1}},
          {col::kRhcY, input},
          {col::kRotAngleY, std::vector<double>(6, 1.0)},
          {col::kThcZ, {0, 1, 1, 0, 0, 0}},
          {col::kCogPosZ, std::vector<double>(6, -1.0)}});
  const PhaseWindow w = make_window(s, 0.0, 6.0);
  CollectingDiagnosticSink sink;

  const RunConditions thc = steering_error_conditions(s, w, Controller::kThc, Axis::kY);
  const RunPairs thc_runs = reconcile_runs(s, thc.start, thc.stop, w.t0, w.t1, "THC.y", sink);
  expect_true(count_true(thc.start) == 1 && thc.start[1] && thc.stop[2], "steering: THC.y error only at t=1");
  expect_near(thc_runs.total_duration(), 1.0, 0.0, "steering: THC.y error run [1, 2)");

  const RunConditions rhc = steering_error_conditions(s, w, Controller::kRhc, Axis::kY);
  const RunPairs rhc_runs = reconcile_runs(s, rhc.start, rhc.stop, w.t0, w.t1, "RHC.y", sink);
  expect_true(count_true(rhc.start) == 2 && rhc.start[1] && rhc.start[3], "steering: RHC.y is not velocity-gated");
  expect_near(rhc_runs.total_duration(), 2.0, 0.0, "steering: RHC.y error runs [1, 2) and [3, 4)");

  const RunConditions toward = steering_error_conditions(s, w, Controller::kThc, Axis::kZ);
  expect_true(count_true(toward.start) == 0, "steering: push toward the axis is not an error");
  expect_true(sink.items().empty(), "steering: start/stop lists match");

  try {
    steering_error_conditions(s, w, Controller::kThc, Axis::kX);
    fail("steering: THC.x must be rejected");
  } catch (const ValidationError&) {
    pass("steering: THC.x has its own flag rule");
  }
}

void test_independent_errors() {
  const FlightSeries s = docking_series(5, {{col::kThcX, {0, 1, 0, 0, 0}},
                                            {col::kThcZ, {0, 0, 1, 0, 0}},
                                            {col::kRhcX, {0, 1, 0, 0, 0}},
                                            {col::kRhcZ, {0, 0, 0, 0, 1}}});
  const RowMask flagged{false, true, true, false, false};

  expect_true(count_independent_errors(s, flagged, Controller::kThc, Axis::kY) == 1,
              "inderr: THC.y counts THC.z at t=2, not THC.x at t=1");
  expect_true(count_independent_errors(s, flagged, Controller::kThc, Axis::kZ) == 0,
              "inderr: THC.x is never an independent axis");
  expect_true(count_independent_errors(s, RowMask{false, true, false, true, false}, Controller::kRhc, Axis::kY) == 1,
              "inderr: RHC.y counts RHC.x at t=1, RHC.z at t=4 is not flagged");
}

void test_combined_inputs() {
  // THC on t=1..5, RHC on t=2..4: both at once over [2, 5).
  // THC.y and THC.z together over [3, 4); THC.x with y/z over [4, 5).
  // RHC.x with RHC.y over [2, 4).
  const FlightSeries s = docking_series(8, {{col::kThcX, {0, 0, 0, 0, 1, 1, 0, 0}},
                                            {col::kThcY, {0, 1, 1, 1, 0, 0, 0, 0}},
                                            {col::kThcZ, {0, 0, 0, 1, 1, 0, 0, 0}},
                                            {col::kRhcX, {0, 0, 1, 1, 1, 0, 0, 0}},
                                            {col::kRhcY, {0, 0, 1, 1, 0, 0, 0, 0}}});
  ResultRecord rec;
  CollectingDiagnosticSink sink;
  evaluate_phase(s, Phase::kAlign, PhaseBoundaries{0.0, 8.0, 9.0, 10.0},
                 request_for({"CombJoy_Align", "CombJoyTime_Align", "CombJoyTHCyz_Align",
                              "CombJoyTHCyzTime_Align", "CombJoyTHCxyz_Align", "CombJoyTHCxyzTime_Align",
                              "CombJoyRHCyz_Align", "CombJoyRHCxyz_Align", "CombJoyRHCxyzTime_Align"}),
                 rec, sink);

  expect_near(rec.number("CombJoy_Align").value_or(-1.0), 1.0, 0.0, "combjoy: one combined input");
  expect_near(rec.number("CombJoyTime_Align").value_or(-1.0), 3.0, 0.0, "combjoy: [2, 5)");
  expect_near(rec.number("CombJoyTHCyz_Align").value_or(-1.0), 1.0, 0.0, "combjoy: THC yz count");
  expect_near(rec.number("CombJoyTHCyzTime_Align").value_or(-1.0), 1.0, 0.0, "combjoy: THC yz [3, 4)");
  expect_near(rec.number("CombJoyTHCxyz_Align").value_or(-1.0), 1.0, 0.0, "combjoy: THC xyz count");
  expect_near(rec.number("CombJoyTHCxyzTime_Align").value_or(-1.0), 1.0, 0.0, "combjoy: THC xyz [4, 5)");
  expect_near(rec.number("CombJoyRHCyz_Align").value_or(-1.0), 0.0, 0.0, "combjoy: RHC.z never deflected");
  expect_near(rec.number("CombJoyRHCxyz_Align").value_or(-1.0), 1.0, 0.0, "combjoy: RHC xyz count");
  expect_near(rec.number("CombJoyRHCxyzTime_Align").value_or(-1.0), 2.0, 0.0, "combjoy: RHC xyz [2, 4)");
  expect_true(sink.items().empty(), "combjoy: no edge fallback");
}

void test_level_runs() {
  const FlightSeries s = docking_series(
      9, {{col::kLateralOffset, {5, 5, 1, 5, 5, 1, 1, 1, 1}},
          {col::kApproachCone, std::vector<double>(9, 2.0)},
          {col::kCogVelX, {-0.1, -0.3, -0.3, -0.1, -0.3, -0.3, -0.3, -0.3, -0.3}},
          {col::kIdealApproachVel, std::vector<double>(9, -0.2)},
          {col::kAngleToPort, {0, 8, 8, 12, 3, 3, 3, 3, 3}}});

  // Appr window [1, 6).
  ResultRecord rec;
  CollectingDiagnosticSink sink;
  evaluate_phase(s, Phase::kAppr, PhaseBoundaries{0.0, 1.0, 6.0, 8.0},
                 request_for({"OutOfCone_Appr", "AboveClosingVel_Appr"}), rec, sink);
  expect_near(rec.number("OutOfCone_Appr").value_or(-1.0), 3.0, 0.0,
              "level: OutOfCone [1, 2) from window start plus [3, 5)");
  expect_near(rec.number("AboveClosingVel_Appr").value_or(-1.0), 4.0, 0.0,
              "level: AboveClosingVel [1, 3) plus [4, 6) closed at window stop");

  const PhaseWindow w = make_window(s, 1.0, 6.0);
  const auto& vx = s.column(col::kCogVelX);
  const auto& ideal = s.column(col::kIdealApproachVel);
  const RunConditions rc = level_run_conditions(s, w, vx, ideal, shifted(ideal), LevelCompare::kBelow);
  expect_true(rc.start[1] && rc.start[4] && rc.stop[3] && count_true(rc.stop) == 1,
              "level: open run at window stop has no stop row");

  const PhaseBoundaries b{0.0, 6.0, 7.0, 8.0};
  evaluate_phase(s, Phase::kAlign, b, request_for({"NoVisTime_Align"}), rec, sink);
  expect_near(rec.number("NoVisTime_Align").value_or(-1.0), 3.0, 0.0, "level: NoVisTime above 7.5 deg over [1, 4)");

  EvaluationSettings wide;
  wide.visibility_angle_deg = 10.0;
  evaluate_phase(s, Phase::kAlign, b, request_for({"NoVisTime_Align"}), rec, sink, wide);
  expect_near(rec.number("NoVisTime_Align").value_or(-1.0), 1.0, 0.0, "level: NoVisTime follows the visibility angle");
}

void test_fuel_on_error() {
  // Tank 100 - 2t. THC.y error run [1, 2) burns 2, RHC.z error run [3, 6)
  // burns 6.
  std::vector<double> tank(8);
  for (std::size_t i = 0; i < tank.size(); ++i) tank[i] = 100.0 - 2.0 * static_cast<double>(i);
  const FlightSeries s = docking_series(8, {{col::kTankMass, tank},
                                            {col::kThcY, {0, 1, 0, 0, 0, 0, 0, 0}},
                                            {col::kCogPosY, std::vector<double>(8, 1.0)},
                                            {col::kCogVelY, std::vector<double>(8, 0.1)},
                                            {col::kRhcZ, {0, 0, 0, -1, -1, -1, 0, 0}},
                                            {col::kRotAngleZ, std::vector<double>(8, -2.0)}});
  ResultRecord rec;
  CollectingDiagnosticSink sink;
  evaluate_phase(s, Phase::kTotal, PhaseBoundaries{0.0, 2.0, 4.0, 7.0},
                 request_for({"Fuel_on_Error_Total", "THCyErr_Total", "RHCzErr_Total"}), rec, sink);
  expect_near(rec.number("THCyErr_Total").value_or(-1.0), 1.0, 0.0, "fuel on error: THC.y error");
  expect_near(rec.number("RHCzErr_Total").value_or(-1.0), 1.0, 0.0, "fuel on error: RHC.z error");
  expect_near(rec.number("Fuel_on_Error_Total").value_or(-1.0), 8.0, 1e-12,
              "fuel on error: sums error runs of both controllers");
}

void test_flight_level_settings() {
  const FlightSeries s = docking_series(4, {{col::kLateralOffset, {1, 2, 3, 4}}});
  const PhaseBoundaries b{0.0, 1.0, 2.0, 3.0};
  ResultRecord rec;
  CollectingDiagnosticSink sink;

  evaluate_flight_level(s, b, request_for({"Time_Dock", "LatOffsetAt_Dock"}), rec, sink);
  expect_near(rec.number("Time_Dock").value_or(-1.0), 3.0, 0.0, "flight level: Time_Dock = b[3]");
  expect_near(rec.number("LatOffsetAt_Dock").value_or(-1.0), 4.0, 0.0, "flight level: LatOffsetAt_Dock");

  EvaluationSettings bad;
  bad.visibility_angle_deg = 0.0;
  try {
    evaluate_flight_level(s, b, request_for({"Time_Dock"}), rec, sink, bad);
    fail("flight level: caller settings must be validated");
  } catch (const ValidationError&) {
    pass("flight level: uses the caller's settings");
  }
}

void test_spectral() {
  const std::vector<double> x{1.0, -2.0, 3.0, 0.5, -1.5};
  double ms = 0.0;
  for (double v : x) ms += v * v;
  ms /= static_cast<double>(x.size());

  expect_near(mean_power_spectral_density(x), ms, 1e-12, "psd: mean PSD equals mean(x^2)");
  expect_true(periodogram(x).size() == x.size(), "psd: full two-sided periodogram");
  expect_true(std::isnan(mean_power_spectral_density({})), "psd: empty input is NaN");
}

void test_catalog_and_schema() {
  expect_true(all_metrics().size() == 266, "catalog: 66 metrics per phase + 2 flight-level");

  bool names_ok = true;
  for (const auto& id : all_metrics()) {
    const auto back = parse_metric_name(metric_name(id));
    names_ok = names_ok && back && *back == id;
  }
  expect_true(names_ok, "catalog: every name parses back to its id");

  const auto err = parse_metric_name("THCzErr_FA");
  expect_true(err && err->kind == MetricKind::kSteeringErrors && err->phase == Phase::kFA &&
                  err->axis == Axis::kZ,
              "catalog: THCzErr_FA");
  expect_true(!parse_metric_name("Bogus_Align"), "catalog: unknown name");
  expect_true(parse_grading_phase("Total Flight") == Phase::kTotal, "catalog: grading phase name");

  JsonValue root;
  parse_json(R"({"columns": {"Flight ID": null, "THCxPSD_Appr": {"unit": "", "optional": true},
                 "Time_Dock": {"unit": "s", "alt_name": "Docking Time"}}})",
             &root);
  const Schema schema = Schema::from_json(root);
  const MetricRequest req = MetricRequest::from_schema(schema);
  expect_true(req.size() == 2, "schema: identity columns are not metrics");
  expect_true(req.is_optional(*parse_metric_name("THCxPSD_Appr")), "schema: optional flag carried");
  expect_true(schema.find("Time_Dock")->alt_name == "Docking Time", "schema: alt_name read");

  const ResultRecord rec = ResultRecord::from_schema(schema);
  expect_true(rec.fields().size() == 3 && rec.get("Time_Dock")->is_null(), "record: schema columns start null");

  JsonValue bad;
  parse_json(R"({"columns": {"X": {"optional": "yes"}}})", &bad);
  try {
    Schema::from_json(bad);
    fail("schema: non-boolean optional must throw");
  } catch (const ValidationError&) {
    pass("schema: non-boolean optional rejected");
  }
}

} // namespace
} // namespace dockeval

int main() {
  using namespace dockeval;

  try {
    test_edge_run_example();
    test_edge_run_active_at_entry();
    test_edge_run_fallback();
    test_engine_dispatch();
    test_lookup_miss();
    test_thc_x_error_flags();
    test_steering_error_gating();
    test_independent_errors();
    test_combined_inputs();
    test_level_runs();
    test_fuel_on_error();
    test_flight_level_settings();
    test_spectral();
    test_catalog_and_schema();
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
