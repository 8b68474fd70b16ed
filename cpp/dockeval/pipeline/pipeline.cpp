/*
================================================================================
Fragment 7.1 - Pipeline: Core Facade Implementation
FILE: cpp/dockeval/pipeline/pipeline.cpp
================================================================================
*/

#include "dockeval/pipeline/pipeline.hpp"

#include <optional>

#include "dockeval/core/errors.hpp"
#include "dockeval/core/logging.hpp"
#include "dockeval/eval/metric_catalog.hpp"
#include "dockeval/log/session_files.hpp"
#include "dockeval/log/structurer.hpp"

namespace dockeval {

namespace {

StructuredFlight structure(const ParsedSession& parsed, const Schema& schema, const Settings& settings) {
  StructuredFlight out;
  out.series = structure_session(parsed, settings.structure);
  out.record = ResultRecord::from_schema(schema);
  apply_session_metadata(parsed, out.record);
  log(LogLevel::INFO, "Structured flight " + parsed.flight_id + " (" + std::to_string(out.series.rows()) +
                          " rows, " + std::to_string(out.series.cols()) + " columns)");
  return out;
}

Phase parse_phase_or_throw(const std::string& name) {
  const std::optional<Phase> p = parse_phase_suffix(name);
  if (!p) throw ValidationError("Unknown phase '" + name + "' (expected Align, Appr, FA or Total)");
  return *p;
}

} // namespace

StructuredFlight parse_and_structure(const std::vector<std::string>& log_paths, const Schema& schema,
                                     const Settings& settings) {
  settings.validate_or_throw();
  const SessionFiles files = validate_session_files(log_paths);
  return structure(parse_session_files(files.paths), schema, settings);
}

StructuredFlight parse_and_structure(const std::vector<LogSegment>& segments, const Schema& schema,
                                     const Settings& settings) {
  settings.validate_or_throw();
  std::vector<std::string> names;
  names.reserve(segments.size());
  for (const auto& s : segments) names.push_back(s.name);
  const SessionFiles files = validate_session_files(names);

  // Reorder the segments the way the validator sorted their names.
  std::vector<LogSegment> ordered;
  ordered.reserve(segments.size());
  for (const auto& p : files.paths) {
    for (const auto& s : segments) {
      if (s.name == p) {
        ordered.push_back(s);
        break;
      }
    }
  }
  return structure(parse_session_segments(ordered), schema, settings);
}

PhaseDetection detect(const FlightSeries& series, const Settings& settings, DiagnosticSink& sink) {
  settings.validate_or_throw();
  return detect_phases(series, settings.detection, sink);
}

ErrorTimestamps evaluate(const FlightSeries& series, const std::string& phase_name, std::size_t start_index,
                         std::size_t stop_index, const PhaseBoundaries& boundaries, const Schema& schema,
                         ResultRecord& record, DiagnosticSink& sink, const Settings& settings) {
  settings.validate_or_throw();
  validate_ascending(boundaries);
  const Phase phase = parse_phase_or_throw(phase_name);
  const MetricRequest request = MetricRequest::from_schema(schema);

  ErrorTimestamps out = evaluate_phase(series, phase, start_index, stop_index, boundaries, request, record, sink,
                                       settings.evaluation);
  if (phase == Phase::kTotal) evaluate_flight_level(series, boundaries, request, record, sink, settings.evaluation);
  return out;
}

ErrorTimestamps evaluate_all(const FlightSeries& series, const PhaseBoundaries& boundaries, const Schema& schema,
                             ResultRecord& record, DiagnosticSink& sink, const Settings& settings) {
  settings.validate_or_throw();
  validate_ascending(boundaries);
  return evaluate_flight(series, boundaries, MetricRequest::from_schema(schema), record, sink, settings.evaluation);
}

GradeReport grade(const ResultRecord& record, const std::string& grading_phase, const Schema& schema,
                  const Settings& settings, ReferenceStatsCache* cache) {
  settings.validate_or_throw();
  const std::optional<Phase> p = parse_grading_phase(grading_phase);
  if (!p) {
    throw ValidationError("Unknown grading phase '" + grading_phase +
                          "' (expected Alignment Phase, Approach Phase, Final Approach Phase or Total Flight)");
  }
  return grade(record, *p, schema, settings.grading, settings.storage, cache);
}

} // namespace dockeval
