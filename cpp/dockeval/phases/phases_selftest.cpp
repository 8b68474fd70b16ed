/*
  Fragment 3.9 - Phase Detection Selftest

  Objective
  ---------
  Framework-free checks for detect_phases():
    1) A clean docking profile yields ordered boundaries without backups.
    2) Degenerate series still yield four SimTime values, estimated at the
       1/3 and 2/3 (or 1/2) row fractions, each with a diagnostic.
    3) Manual boundaries snap to SimTime and must be ascending.

  Expected use
  ------------
      ./dockeval_phases_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "dockeval/core/diagnostics.hpp"
#include "dockeval/core/errors.hpp"
#include "dockeval/core/settings.hpp"
#include "dockeval/log/structurer.hpp"
#include "dockeval/phases/phase_detector.hpp"

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

void expect_boundaries(const PhaseBoundaries& got, const PhaseBoundaries& exp, std::string_view msg) {
  if (got != exp) {
    fail(msg);
    std::cerr << "  got [" << got[0] << ", " << got[1] << ", " << got[2] << ", " << got[3] << "]\n";
  } else {
    pass(msg);
  }
}

// Minimal series for the detector.
struct Profile {
  std::vector<double> t, thc_y, vel_x, pos_x, port_x;
};

FlightSeries to_series(const Profile& p) {
  const std::size_t n = p.t.size();
  const std::vector<double> zeros(n, 0.0);
  return FlightSeries::from_columns(
      {kSimTime, col::kThcX, col::kThcY, col::kThcZ, col::kRhcX, col::kRhcY, col::kRhcZ, col::kCogVelX,
       col::kCogPosX, col::kPortPosX},
      {p.t, zeros, p.thc_y, zeros, zeros, zeros, zeros, p.vel_x, p.pos_x, p.port_x});
}

Profile docking_profile() {
  Profile p;
  for (int i = 0; i <= 150; ++i) {
    const double t = static_cast<double>(i);
    p.t.push_back(t);
    p.thc_y.push_back(i >= 10 ? 0.3 : 0.0);
    p.vel_x.push_back(i < 50 ? 0.0 : -0.1 - 0.001 * (t - 50.0));
    p.pos_x.push_back(99.5 - t);
    p.port_x.push_back(i < 120 ? 120.0 - t : 0.0);
  }
  return p;
}

void test_clean_profile() {
  CollectingDiagnosticSink sink;
  const PhaseDetection d = detect_phases(to_series(docking_profile()), DetectionSettings{}, sink);

  expect_boundaries(d.boundaries, {10.0, 50.0, 80.0, 120.0}, "detect: [10, 50, 80, 120]");
  expect_true(!d.any_backup() && sink.items().empty(), "detect: no backup on clean data");
  validate_ascending(d.boundaries);
  pass("detect: boundaries ascending");
}

void test_degenerate_profile() {
  Profile p;
  for (int i = 0; i < 10; ++i) {
    p.t.push_back(static_cast<double>(i));
    p.thc_y.push_back(0.0);
    p.vel_x.push_back(0.0);
    p.pos_x.push_back(100.0);
    p.port_x.push_back(5.0);
  }
  CollectingDiagnosticSink sink;
  const PhaseDetection d = detect_phases(to_series(p), DetectionSettings{}, sink);

  expect_boundaries(d.boundaries, {0.0, 3.0, 6.0, 9.0}, "backup: thirds between first and last row");
  expect_true(d.backup[0] && d.backup[1] && d.backup[2] && d.backup[3], "backup: every slot flagged");
  expect_true(d.notices.size() == 4 && sink.contains(DiagnosticKind::kBackupBoundary),
              "backup: one diagnostic per estimate");
  expect_true(d.notices[0].find("No Controller Input") != std::string::npos &&
                  d.notices[0].find("t=0.0") != std::string::npos,
              "backup: alignment notice names the SimTime");

  for (double b : d.boundaries) {
    if (std::isnan(b)) fail("backup: boundary is NaN");
  }
}

void test_single_gap() {
  // Approach never detected: velocity stays positive.
  Profile p = docking_profile();
  for (auto& v : p.vel_x) v = 0.05;
  CollectingDiagnosticSink sink;
  const PhaseDetection d = detect_phases(to_series(p), DetectionSettings{}, sink);

  // Midpoint row between alignment (row 10) and final approach (row 80).
  expect_boundaries(d.boundaries, {10.0, 45.0, 80.0, 120.0}, "backup: midpoint for a single gap");
  expect_true(d.backup[1] && !d.backup[2], "backup: only approach flagged");
}

void test_manual_boundaries() {
  const FlightSeries s = to_series(docking_profile());
  expect_boundaries(snap_boundaries(s, {9.6, 50.2, 80.5, 500.0}), {10.0, 50.0, 80.0, 150.0},
                    "manual: boundaries snap to nearest SimTime (ties to earlier row)");

  try {
    validate_ascending({0.0, 50.0, 40.0, 120.0});
    fail("manual: descending boundaries must throw");
  } catch (const ValidationError& e) {
    expect_true(std::string(e.what()).find("ascending order") != std::string::npos,
                "manual: descending boundaries rejected");
  }

  expect_true(format_sim_time(50.0) == "50.0" && format_sim_time(0.25) == "0.25", "format: SimTime text");
}

void test_empty_series() {
  CollectingDiagnosticSink sink;
  try {
    detect_phases(FlightSeries{}, DetectionSettings{}, sink);
    fail("detect: empty series must throw");
  } catch (const ValidationError&) {
    pass("detect: empty series rejected");
  }
}

} // namespace
} // namespace dockeval

int main() {
  using namespace dockeval;

  test_clean_profile();
  test_degenerate_profile();
  test_single_gap();
  test_manual_boundaries();
  test_empty_series();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
