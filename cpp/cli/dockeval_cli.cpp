/*
================================================================================
Fragment 8.1 - CLI: Main Entry Point (dockeval_cli)
FILE: cpp/cli/dockeval_cli.cpp

Purpose:
  - Command-line harness over the pipeline facade:
    * evaluate  - parse, detect phases, evaluate, print the record
    * add       - evaluate and append to the scenario database
    * grade     - evaluate and grade every phase against the database
    * rebuild   - re-evaluate every stored flight
    * help      - show help message

Hardening:
  - Explicit exit codes for scripting
  - Every diagnostic is printed; nothing is swallowed
  - Plain, deterministic text output
================================================================================
*/

#include "dockeval/core/diagnostics.hpp"
#include "dockeval/core/errors.hpp"
#include "dockeval/core/logging.hpp"
#include "dockeval/core/settings.hpp"
#include "dockeval/core/text.hpp"
#include "dockeval/db/historical_database.hpp"
#include "dockeval/db/rebuild.hpp"
#include "dockeval/grading/reference_cache.hpp"
#include "dockeval/grading/scoring.hpp"
#include "dockeval/pipeline/pipeline.hpp"

#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace dockeval;

// Exit codes for scripting
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3,
  IO_ERROR = 4
};

void print_help() {
  std::cout << R"(
dockeval_cli - Docking Flight Evaluation Engine

Usage:
  dockeval_cli <command> [options] [FDL_<session>_NNNN.log ...]

Commands:
  evaluate      Parse a session, detect phases and print the evaluated record
  add           Evaluate a session and append it to its scenario database
  grade         Evaluate a session and grade every phase against the database
  rebuild       Re-evaluate every flight stored in the database directory
  help          Show this help message

Options:
  --schema <path>          Schema resource (default resources/results_template.json)
  --database-dir <dir>     Scenario databases (default database)
  --series-dir <dir>       Raw series exports (default data)
  --boundaries <a,b,c,d>   Manual phase boundaries (snapped to SimTime)
  --weighting gini|critic  Metric weighting method (default gini)
  --alpha <a>              Significance level of the grading tests (default 0.05)
  --unlock-scoring         Allow score computation in this session
  --score                  Print phase sub-scores and the final score (grade)
  --log-level <level>      debug|info|warn|error (default info, or DOCKEVAL_LOG_LEVEL)

Examples:
  dockeval_cli evaluate FDL_s1_0000.log FDL_s1_0001.log
  dockeval_cli grade --unlock-scoring --score FDL_s1_0000.log FDL_s1_0001.log
  dockeval_cli rebuild --database-dir database --series-dir data

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed
  3 - Computation failed
  4 - I/O error
)";
}

struct Args {
  std::string command;
  std::vector<std::string> files;
  std::optional<PhaseBoundaries> boundaries;
  bool score = false;
  Settings settings = Settings::defaults();
};

static bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

static bool parse_boundaries(const std::string& s, PhaseBoundaries* out) {
  const auto parts = split(s, ',');
  if (parts.size() != 4) return false;
  for (std::size_t i = 0; i < 4; ++i) {
    double v = 0.0;
    if (!parse_double(trim(parts[i]), &v) || !std::isfinite(v)) return false;
    (*out)[i] = v;
  }
  return true;
}

static bool parse_args(int argc, char** argv, Args* a, std::string* err) {
  a->command = argv[1];
  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    if (std::strcmp(k, "--schema") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--schema requires a path"; return false; }
      a->settings.storage.schema_path = v;
      continue;
    }
    if (std::strcmp(k, "--database-dir") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--database-dir requires a path"; return false; }
      a->settings.storage.database_dir = v;
      continue;
    }
    if (std::strcmp(k, "--series-dir") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--series-dir requires a path"; return false; }
      a->settings.storage.series_dir = v;
      continue;
    }
    if (std::strcmp(k, "--boundaries") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--boundaries requires a,b,c,d"; return false; }
      PhaseBoundaries b{};
      if (!parse_boundaries(v, &b)) { *err = "--boundaries must be four finite numbers a,b,c,d"; return false; }
      a->boundaries = b;
      continue;
    }
    if (std::strcmp(k, "--weighting") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--weighting requires gini|critic"; return false; }
      if (std::strcmp(v, "gini") == 0) a->settings.grading.weighting = WeightingMethod::kGini;
      else if (std::strcmp(v, "critic") == 0) a->settings.grading.weighting = WeightingMethod::kCritic;
      else { *err = "--weighting must be gini or critic"; return false; }
      continue;
    }
    if (std::strcmp(k, "--alpha") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--alpha requires a value"; return false; }
      if (!parse_double(v, &a->settings.grading.alpha)) { *err = "--alpha must be a number"; return false; }
      continue;
    }
    if (std::strcmp(k, "--unlock-scoring") == 0) {
      a->settings.grading.scoring_unlocked = true;
      continue;
    }
    if (std::strcmp(k, "--score") == 0) {
      a->score = true;
      continue;
    }
    if (std::strcmp(k, "--log-level") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--log-level requires a value"; return false; }
      LogLevel lvl = LogLevel::INFO;
      if (!parse_log_level(v, &lvl)) { *err = std::string("Unknown log level: ") + v; return false; }
      set_log_level(lvl);
      continue;
    }
    if (starts_with(k, "--")) {
      *err = std::string("Unknown argument: ") + k;
      return false;
    }
    a->files.emplace_back(k);
  }
  return true;
}

// Prints diagnostics as they arrive.
class PrintingDiagnosticSink final : public DiagnosticSink {
 public:
  void on_diagnostic(const Diagnostic& d) override { std::cout << "  ! " << d.message << "\n"; }
};

struct EvaluatedFlight {
  StructuredFlight flight;
  PhaseBoundaries boundaries{};
  ErrorTimestamps errors;
};

static EvaluatedFlight evaluate_session(const Args& a, const Schema& schema, DiagnosticSink& sink) {
  EvaluatedFlight ev;
  ev.flight = parse_and_structure(a.files, schema, a.settings);
  ScopedLogContext ctx(ev.flight.record.text(field::kScenario) + "/" +
                       ev.flight.record.text(field::kFlightId).substr(0, 12));

  if (a.boundaries) {
    ev.boundaries = snap_boundaries(ev.flight.series, *a.boundaries);
    mark_manually_modified(ev.flight.record);
  } else {
    ev.boundaries = detect(ev.flight.series, a.settings, sink).boundaries;
  }

  std::cout << "Flight ID: " << ev.flight.record.text(field::kFlightId) << "\n";
  std::cout << "Scenario: " << ev.flight.record.text(field::kScenario) << "\n";
  std::cout << "Phase boundaries:";
  for (double b : ev.boundaries) std::cout << " " << format_sim_time(b);
  std::cout << "\n";

  ev.errors = evaluate_all(ev.flight.series, ev.boundaries, schema, ev.flight.record, sink, a.settings);
  return ev;
}

static void print_record(const ResultRecord& r) {
  for (const auto& [name, v] : r.fields()) {
    std::cout << "  " << name << " = " << (v.is_null() ? std::string("null") : r.text(name)) << "\n";
  }
}

static void print_report(const GradeReport& rep) {
  std::cout << "\n== " << phase_spec(rep.phase).grading_name << " ==\n";
  for (std::size_t t = 0; t < kTierCount; ++t) {
    const auto items = rep.in_tier(static_cast<Tier>(t));
    if (items.empty()) continue;
    std::cout << tier_name(static_cast<Tier>(t)) << " (" << items.size() << ")\n";
    for (const TieredMetric* m : items) {
      std::cout << "  " << std::left << std::setw(24) << m->name << " value=" << m->value;
      if (m->distribution) std::cout << " type=" << distribution_name(*m->distribution);
      if (!m->transform.empty()) std::cout << " (" << m->transform << ")";
      if (m->percentile) std::cout << " pct=" << *m->percentile;
      if (!m->note.empty()) std::cout << " [" << m->note << "]";
      std::cout << "\n";
    }
  }
}

static int cmd_evaluate(const Args& a, bool append) {
  const Schema schema = Schema::load(a.settings.storage.schema_path);
  PrintingDiagnosticSink sink;
  EvaluatedFlight ev = evaluate_session(a, schema, sink);

  std::cout << "\nResult record:\n";
  print_record(ev.flight.record);

  std::cout << "\nError timestamps (Total):\n";
  for (const auto& [axis, times] : ev.errors) std::cout << "  " << axis << ": " << times.size() << "\n";

  if (append) {
    const AddFlightResult res = add_flight(ev.flight.record, ev.flight.series, a.settings.storage);
    std::cout << "\n" << (res.replaced ? "Replaced" : "Added") << " flight in " << res.database_path << " ("
              << res.record_count << " records)\n";
    std::cout << "Series written to " << res.series_path << "\n";
  }
  return ExitCode::SUCCESS;
}

static int cmd_grade(const Args& a) {
  const Schema schema = Schema::load(a.settings.storage.schema_path);
  PrintingDiagnosticSink sink;
  EvaluatedFlight ev = evaluate_session(a, schema, sink);

  ReferenceStatsCache cache;
  std::vector<GradeReport> reports;
  for (const auto& ps : kPhaseSpecs) {
    reports.push_back(grade(ev.flight.record, ps.grading_name, schema, a.settings, &cache));
    print_report(reports.back());
  }

  if (a.score) {
    const auto cap = ScoringCapability::from_settings(a.settings.grading);
    if (!cap) {
      std::cerr << "Scoring is locked for this session (use --unlock-scoring).\n";
      return ExitCode::VALIDATION_FAILED;
    }
    const FlightScore fs = compute_score(*cap, reports, a.settings.grading);
    std::cout << "\nPhase Sub Scores: ";
    for (std::size_t i = 0; i < fs.phases.size(); ++i) {
      if (i) std::cout << " | ";
      std::cout << phase_spec(fs.phases[i].phase).grading_name << ": " << fs.phases[i].sub_score;
    }
    std::cout << "\nTotal Flight Score: " << fs.final_score << "\n";
  }
  return ExitCode::SUCCESS;
}

static int cmd_rebuild(const Args& a) {
  const Schema schema = Schema::load(a.settings.storage.schema_path);
  LoggingDiagnosticSink sink;
  const RebuildReport rep = rebuild_database(schema, a.settings, sink);
  std::cout << "Rebuilt " << rep.rebuilt << "/" << rep.processed << " flights\n";
  for (const auto& f : rep.failures) std::cout << "  failed: " << f << "\n";
  return rep.failed() == 0 ? ExitCode::SUCCESS : ExitCode::COMPUTATION_FAILED;
}

static int run(const Args& a) {
  try {
    a.settings.validate_or_throw();
    if (a.command == "evaluate") return cmd_evaluate(a, false);
    if (a.command == "add") return cmd_evaluate(a, true);
    if (a.command == "grade") return cmd_grade(a);
    if (a.command == "rebuild") return cmd_rebuild(a);
  } catch (const ValidationError& e) {
    std::cerr << "Validation FAILED: " << e.what() << "\n";
    return ExitCode::VALIDATION_FAILED;
  } catch (const LogParseError& e) {
    std::cerr << "Log parse FAILED: " << e.what() << "\n";
    return ExitCode::VALIDATION_FAILED;
  } catch (const ReferenceDatabaseMissing& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return ExitCode::IO_ERROR;
  } catch (const IOError& e) {
    std::cerr << "I/O error: " << e.what() << "\n";
    return ExitCode::IO_ERROR;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return ExitCode::COMPUTATION_FAILED;
  }

  std::cerr << "Unknown command: " << a.command << "\n";
  std::cerr << "Run 'dockeval_cli help' for usage information.\n";
  return ExitCode::INVALID_ARGS;
}

int main(int argc, char** argv) {
  const std::string cmd = (argc >= 2) ? std::string(argv[1]) : "help";
  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return ExitCode::SUCCESS;
  }

  apply_log_level_from_env();

  Args a;
  std::string err;
  if (!parse_args(argc, argv, &a, &err)) {
    std::cerr << err << "\n";
    return ExitCode::INVALID_ARGS;
  }
  if (a.command != "rebuild" && a.files.empty()) {
    std::cerr << "No Flight Log selected.\n";
    return ExitCode::INVALID_ARGS;
  }
  return run(a);
}
