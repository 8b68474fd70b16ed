/*
================================================================================
Fragment 6.3 - DB: Database Rebuild Implementation
FILE: cpp/dockeval/db/rebuild.cpp
================================================================================
*/

#include "dockeval/db/rebuild.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <optional>

#include "dockeval/core/errors.hpp"
#include "dockeval/core/logging.hpp"
#include "dockeval/db/historical_database.hpp"
#include "dockeval/db/series_csv.hpp"
#include "dockeval/eval/evaluation_engine.hpp"
#include "dockeval/eval/metric_catalog.hpp"
#include "dockeval/eval/result_record.hpp"

namespace dockeval {

namespace fs = std::filesystem;

namespace {

const char* const kBoundaryFields[4] = {"Start_Align", "Start_Appr", "Start_FA", "Time_Dock"};

void merge_scenario(RebuildReport& total, const RebuildReport& part) {
  total.processed += part.processed;
  total.rebuilt += part.rebuilt;
  total.failures.insert(total.failures.end(), part.failures.begin(), part.failures.end());
}

} // namespace

PhaseBoundaries stored_boundaries(const ResultRecord& record) {
  PhaseBoundaries b{};
  for (std::size_t i = 0; i < b.size(); ++i) {
    const std::optional<double> v = record.number(kBoundaryFields[i]);
    if (!v || std::isnan(*v)) {
      throw ValidationError(std::string("Stored record has no ") + kBoundaryFields[i]);
    }
    b[i] = *v;
  }
  return b;
}

RebuildReport rebuild_scenario(const std::string& scenario, const Schema& schema, const Settings& settings,
                               DiagnosticSink& sink) {
  const std::string path = resolve_database_path(settings.storage, scenario);
  ScopedLogContext scenario_ctx(scenario);
  log(LogLevel::INFO, "Processing file: " + path);

  HistoricalDatabase db = HistoricalDatabase::load(path);
  db.align_to_schema(schema);
  const MetricRequest request = MetricRequest::from_schema(schema);

  RebuildReport report;
  for (ResultRecord& stored : db.records()) {
    ++report.processed;
    const std::string flight_id = stored.text(field::kFlightId);
    ScopedLogContext flight_ctx(scenario + "/" + flight_id.substr(0, 12));
    try {
      const PhaseBoundaries b = stored_boundaries(stored);
      const FlightSeries series = read_series_csv(series_file_path(settings.storage, scenario, flight_id));

      ResultRecord updated = stored;
      evaluate_flight(series, b, request, updated, sink, settings.evaluation);
      stored = std::move(updated);
      ++report.rebuilt;
    } catch (const DockevalError& e) {
      log(LogLevel::ERROR, "Error processing " + flight_id + ": " + e.what());
      report.failures.push_back(flight_id + ": " + e.what());
    }
  }

  db.save(path);
  log(LogLevel::INFO, scenario + ": rebuilt " + std::to_string(report.rebuilt) + "/" +
                          std::to_string(report.processed) + " flights");
  return report;
}

RebuildReport rebuild_database(const Schema& schema, const Settings& settings, DiagnosticSink& sink) {
  std::error_code ec;
  fs::directory_iterator it(settings.storage.database_dir, ec);
  if (ec) throw IOError("Cannot list database directory " + settings.storage.database_dir + ": " + ec.message());

  std::vector<std::string> scenarios;
  for (const auto& entry : it) {
    if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
    const std::string stem = entry.path().stem().string();
    const std::string scenario = stem.substr(0, stem.find('_'));
    if (!scenario.empty() && std::find(scenarios.begin(), scenarios.end(), scenario) == scenarios.end()) {
      scenarios.push_back(scenario);
    }
  }
  std::sort(scenarios.begin(), scenarios.end());

  RebuildReport total;
  for (const auto& s : scenarios) merge_scenario(total, rebuild_scenario(s, schema, settings, sink));
  return total;
}

} // namespace dockeval
