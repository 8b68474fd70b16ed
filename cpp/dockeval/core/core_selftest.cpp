/*
  Fragment 1.9 - Core Selftest

  Objective
  ---------
  Framework-free checks for the core layer:
    1) JSON parser keeps member order, integral flags and line/col errors.
    2) JSON writer never emits NaN/Inf literals.
    3) FNV-1a hashing is canonical for -0.0 and NaN; SHA-256 matches the
       published test vector.
    4) Text helpers and settings validation reject bad input.

  Expected use
  ------------
      ./dockeval_core_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

#include "dockeval/core/errors.hpp"
#include "dockeval/core/hashing.hpp"
#include "dockeval/core/json.hpp"
#include "dockeval/core/logging.hpp"
#include "dockeval/core/settings.hpp"
#include "dockeval/core/text.hpp"

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

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
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

void test_json_order_and_integral() {
  JsonValue v;
  JsonParseError err;
  const bool ok = parse_json(R"({"b": 3, "a": 1.0, "c": null, "s": "x\"y"})", &v, &err);
  expect_true(ok, "json: parses flat object");
  if (!ok) return;

  expect_true(v.object.size() == 4 && v.object[0].first == "b" && v.object[1].first == "a",
              "json: member order preserved");
  expect_true(v.find("b")->integral, "json: integer literal is integral");
  expect_true(!v.find("a")->integral, "json: 1.0 is not integral");
  expect_true(v.find("c")->is_null(), "json: null member");
  expect_eq_str(to_json(v), R"({"b":3,"a":1.0,"c":null,"s":"x\"y"})", "json: deterministic writer");
}

void test_json_errors() {
  JsonValue v;
  JsonParseError err;
  const bool ok = parse_json("{\n  \"a\": NaN\n}", &v, &err);
  expect_true(!ok, "json: NaN literal rejected");
  expect_true(err.line == 2, "json: error reports line 2");

  expect_true(!parse_json("{\"a\":1} x", &v, &err), "json: trailing characters rejected");
}

void test_json_writer_non_finite() {
  JsonValue o = JsonValue::make_object();
  o.set("nan", JsonValue::make_number(std::numeric_limits<double>::quiet_NaN()));
  o.set("inf", JsonValue::make_number(std::numeric_limits<double>::infinity()));
  o.set("one", JsonValue::make_number(1.0));
  expect_eq_str(to_json(o), R"({"nan":null,"inf":null,"one":1.0})", "json: non-finite written as null");
}

void test_hashing() {
  Fnv1a64 a;
  Fnv1a64 b;
  a.update_f64(0.0);
  b.update_f64(-0.0);
  expect_true(a.value() == b.value(), "fnv: -0.0 hashes like +0.0");

  Fnv1a64 n1;
  Fnv1a64 n2;
  n1.update_f64(std::numeric_limits<double>::quiet_NaN());
  n2.update_f64(-std::numeric_limits<double>::quiet_NaN());
  expect_true(n1.value() == n2.value(), "fnv: NaN payloads canonical");

  Fnv1a64 s1;
  Fnv1a64 s2;
  s1.update_string("ab");
  s1.update_string("c");
  s2.update_string("a");
  s2.update_string("bc");
  expect_true(s1.value() != s2.value(), "fnv: strings are length-delimited");

  expect_eq_str(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                "sha256: FIPS 180-2 'abc' vector");
}

void test_text() {
  const auto parts = split_trim_nonempty(" a ; ;b;  c ;", ';');
  expect_true(parts.size() == 3 && parts[0] == "a" && parts[2] == "c", "text: split_trim_nonempty");

  double v = 0.0;
  expect_true(parse_double("-2e3", &v) && v == -2000.0, "text: parse_double exponent");
  expect_true(!parse_double("1.5x", &v), "text: parse_double rejects trailing text");
  expect_true(!parse_double("", &v), "text: parse_double rejects empty");

  std::string s = "; m12; m12";
  expect_true(replace_first(s, "; m12", "; MyROT.m12") && s == "; MyROT.m12; m12", "text: replace_first");
}

void test_settings_and_logging() {
  Settings s = Settings::defaults();
  s.validate_or_throw();
  pass("settings: defaults validate");

  Settings bad = s;
  bad.grading.phase_relevance = {0.2, 0.3, 0.6};
  expect_throws<ValidationError>([&] { bad.validate_or_throw(); }, "settings: relevance must sum to 1");

  bad = s;
  bad.grading.alpha = 0.0;
  expect_throws<ValidationError>([&] { bad.validate_or_throw(); }, "settings: alpha must be positive");

  bad = s;
  bad.storage.database_dir.clear();
  expect_throws<ValidationError>([&] { bad.validate_or_throw(); }, "settings: empty database_dir");

  LogLevel lvl = LogLevel::INFO;
  expect_true(parse_log_level("warn", &lvl) && lvl == LogLevel::WARN, "logging: parse 'warn'");
  expect_true(!parse_log_level("loud", &lvl), "logging: unknown level rejected");
  expect_true(parse_log_level("WARNING", &lvl) && lvl == LogLevel::WARN, "logging: level names ignore case");
  expect_true(!parse_log_level("debugdebugdebugdebug", &lvl), "logging: overlong name rejected");

  set_log_level(LogLevel::ERROR);
  expect_true(get_log_level() == LogLevel::ERROR, "logging: level is process-wide");
  set_log_level(LogLevel::INFO);

  expect_true(current_log_context().empty(), "logging: no context by default");
  {
    ScopedLogContext scenario("Soyuz");
    {
      ScopedLogContext flight("Soyuz/abc123");
      expect_true(current_log_context() == "Soyuz/abc123", "logging: inner context active");
    }
    expect_true(current_log_context() == "Soyuz", "logging: outer context restored");
  }
  expect_true(current_log_context().empty(), "logging: context cleared");
}

void test_error_messages() {
  const LogParseError e("FDL_s_0001.log", 12, "value 'x' is not a number");
  expect_eq_str(e.what(), "FDL_s_0001.log:12: value 'x' is not a number", "errors: LogParseError what()");
  expect_true(e.line() == 12 && e.file() == "FDL_s_0001.log", "errors: LogParseError fields");
}

} // namespace
} // namespace dockeval

int main() {
  using namespace dockeval;

  test_json_order_and_integral();
  test_json_errors();
  test_json_writer_non_finite();
  test_hashing();
  test_text();
  test_settings_and_logging();
  test_error_messages();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
