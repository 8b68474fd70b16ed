/*
  Fragment 2.9 - Log Parsing Selftest

  Objective
  ---------
  Framework-free checks for session loading:
    1) File selection validation (extension, prefix, numbering, session).
    2) Header fixups for the concatenated MFDRight column and the unlabeled
       rotation matrix elements.
    3) Parser idempotence, metadata extraction and Flight ID derivation.
    4) Fail-fast on short rows, non-numeric tokens and a missing sentinel.
    5) Structurer frame remap and derived columns.

  Expected use
  ------------
      ./dockeval_log_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "dockeval/core/errors.hpp"
#include "dockeval/core/hashing.hpp"
#include "dockeval/log/log_parser.hpp"
#include "dockeval/log/session_files.hpp"
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
  if (std::fabs(a - b) > tol) {
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
    "SimTime; THC.x; THC.y; THC.z; RHC.x; RHC.y; RHC.z; COG Pos.x [m]; COG Pos.y [m]; COG Pos.z [m]; "
    "COG Vel.x [m]; COG Vel.y [m]; COG Vel.z [m]; Port Pos.x [m]; Port Pos.y [m]; Port Pos.z [m]; "
    "Rot. Rate.Z [deg/s];";

std::string metadata_block() {
  return "# Logger Version: 1.4.2\n"
         "# SESSION_ID: 42\n"
         "# PILOT: tester\n"
         "# TIME: 2023-05-17 10:22:01\n"
         "# SCENARIO: Soyuz\n";
}

std::vector<LogSegment> sample_session() {
  std::vector<LogSegment> segs;
  segs.push_back(LogSegment{"FDL_test_0000.log", metadata_block() + kHeader + "\n" +
                                                     "0; 0.5; 0; -0.25; 1; 0; 2; 100; 3; 4; -0.2; 0.3; 0.4; 90; 0; 0; 0.1;\n"
                                                     "1; 0; 0; 0; 0; 0; 0; 99; 3; 4; -0.2; 0.3; 0.4; 89; 0; 0; 0.2;\n"});
  segs.push_back(LogSegment{"FDL_test_0001.log", std::string(kHeader) + "\n" +
                                                     "2; 0; 0; 0; 0; 0; 0; 98; 0; 0; -0.2; 0; 0; 88; 0; 0; 0.3;\n"
                                                     "# Log stopped.\n"});
  return segs;
}

void test_session_file_validation() {
  const auto sf = validate_session_files({"/logs/FDL_a_0001.log", "/logs/FDL_a_0000.log"});
  expect_true(sf.paths.size() == 2 && sf.paths[0] == "/logs/FDL_a_0000.log", "files: sorted by basename");
  expect_true(sf.session_prefix == "FDL_a", "files: session prefix");

  expect_throws<ValidationError>([] { validate_session_files({}); }, "files: empty selection");
  expect_throws<ValidationError>([] { validate_session_files({"FDL_a_0000.txt"}); }, "files: wrong extension");
  expect_throws<ValidationError>([] { validate_session_files({"XYZ_a_0000.log"}); }, "files: wrong prefix");
  expect_throws<ValidationError>([] { validate_session_files({"FDL_a_end.log"}); }, "files: non-numeric suffix");
  expect_throws<ValidationError>([] { validate_session_files({"FDL_a_0000.log", "FDL_a_0002.log"}); },
                                 "files: gap in numbering");
  expect_throws<ValidationError>([] { validate_session_files({"FDL_a_0000.log", "FDL_b_0001.log"}); },
                                 "files: mixed sessions");
}

void test_header_fixups() {
  const std::vector<std::string> cols = parse_header_line(
      "SimTime; MFDRightMyROT.m11; m12; m13; m21; m22; m23; m31; m32; m33; "
      "TgtRot.m11; m12; m13; m21; m22; m23; m31; m32; m33;");

  expect_true(cols.size() == 20, "header: 20 columns after split");
  if (cols.size() != 20) return;
  expect_true(cols[1] == "MFDRight" && cols[2] == "MyROT.m11", "header: MFDRight split");

  const char* sfx[] = {"m12", "m13", "m21", "m22", "m23", "m31", "m32", "m33"};
  bool ok = true;
  for (int i = 0; i < 8; ++i) {
    ok = ok && cols[3 + i] == std::string("MyROT.") + sfx[i];
    ok = ok && cols[12 + i] == std::string("TgtRot.") + sfx[i];
  }
  expect_true(ok, "header: first occurrence MyROT, second TgtRot");
}

void test_parser() {
  const auto segs = sample_session();
  const ParsedSession a = parse_session_segments(segs);
  const ParsedSession b = parse_session_segments(segs);

  expect_true(a.rows.size() == 3 && a.columns.size() == 17, "parser: 3 rows, 17 columns");
  expect_true(a.rows == b.rows && a.columns == b.columns && a.flight_id == b.flight_id,
              "parser: idempotent");
  expect_true(a.flight_id == sha256_hex("FDL_test_0000.log"), "parser: Flight ID from first basename");
  expect_true(a.metadata.scenario == "Soyuz" && a.metadata.pilot == "tester", "parser: scenario and pilot");
  expect_true(a.metadata.logger_version == "1.4.2" && a.metadata.session_id == "42", "parser: logger + session");
  expect_true(a.metadata.date_day && *a.metadata.date_day == 17, "parser: TIME keeps day of month");
}

void test_parser_failures() {
  auto segs = sample_session();
  segs.back().text = std::string(kHeader) + "\n2; 0; 0; 0; 0; 0; 0; 98; 0; 0; -0.2; 0; 0; 88; 0; 0; 0.3;\n";
  expect_throws<LogParseError>([&] { parse_session_segments(segs); }, "parser: missing sentinel");

  segs = sample_session();
  segs.back().text = std::string(kHeader) + "\n2; 0; 0;\n# Log stopped.\n";
  try {
    parse_session_segments(segs);
    fail("parser: short row must throw");
  } catch (const LogParseError& e) {
    expect_true(e.line() == 2 && e.file() == "FDL_test_0001.log", "parser: short row names file and line");
  }

  segs = sample_session();
  segs.back().text = std::string(kHeader) +
                     "\n2; 0; 0; 0; 0; 0; 0; abc; 0; 0; -0.2; 0; 0; 88; 0; 0; 0.3;\n# Log stopped.\n";
  expect_throws<LogParseError>([&] { parse_session_segments(segs); }, "parser: non-numeric token");
}

void test_structurer() {
  const ParsedSession p = parse_session_segments(sample_session());
  const FlightSeries s = structure_session(p);

  // Raw row 0: THC.x=0.5, THC.z=-0.25, RHC.x=1, RHC.z=2.
  expect_near(s.at(col::kThcX, 0), 0.25, 0.0, "remap: THC.x_new == -THC.z_old");
  expect_near(s.at(col::kThcZ, 0), -0.5, 0.0, "remap: THC.z_new == -THC.x_old");
  expect_near(s.at(col::kRhcX, 0), 2.0, 0.0, "remap: RHC.x_new == RHC.z_old");
  expect_near(s.at(col::kRhcZ, 0), 1.0, 0.0, "remap: RHC.z_new == RHC.x_old");

  expect_true(s.has(col::kRotRateZ) && !s.has("Rot. Rate.Z [deg/s]"), "structurer: Rot. Rate.Z renamed");
  expect_near(s.at(col::kLateralOffset, 0), 5.0, 1e-12, "structurer: lateral offset = |(y, z)|");
  expect_near(s.at(col::kLateralVelocity, 0), 0.5, 1e-12, "structurer: lateral velocity = |(vy, vz)|");
  expect_near(s.at(col::kIdealApproachVel, 0), -0.5, 1e-12, "structurer: ideal velocity = -x / 200");
  expect_true(std::isnan(s.at(col::kMaxRotAngle, 0)), "structurer: no rotation limit outside final approach");

  // The next segment repeats the last SimTime of the previous one.
  std::vector<LogSegment> overlap = sample_session();
  overlap.back().text = std::string(kHeader) + "\n" +
                        "1; 0; 0; 0; 0; 0; 0; 99; 3; 4; -0.2; 0.3; 0.4; 89; 0; 0; 0.2;\n"
                        "2; 0; 0; 0; 0; 0; 0; 98; 0; 0; -0.2; 0; 0; 88; 0; 0; 0.3;\n"
                        "# Log stopped.\n";
  expect_throws<ValidationError>([&] { structure_session(parse_session_segments(overlap)); },
                                 "structurer: repeated SimTime across segments rejected");

  expect_near(angle_to_port_deg({1.0, 0.0, 0.0}, {2.0, 0.0, 0.0}), 0.0, 1e-12, "angle: aligned with port");
  expect_true(std::isnan(angle_to_port_deg({0.0, 0.0, 0.0}, {1.0, 0.0, 0.0})), "angle: zero vector is NaN");
}

} // namespace
} // namespace dockeval

int main() {
  using namespace dockeval;

  test_session_file_validation();
  test_header_fixups();
  test_parser();
  test_parser_failures();
  test_structurer();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
