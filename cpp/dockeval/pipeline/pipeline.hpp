#pragma once
/*
================================================================================
Fragment 7.1 - Pipeline: Core Facade
FILE: cpp/dockeval/pipeline/pipeline.hpp

Purpose:
  The four boundary operations a GUI or CLI collaborator calls:

    1. parse_and_structure(log paths)          -> series + partial record
    2. detect(series)                          -> four phase boundaries
    3. evaluate(series, phase, i0, i1, b, rec) -> fills rec (+ error times
                                                  for "Total")
    4. grade(rec, phase name)                  -> tiered metrics, reference
                                                  columns, weighting table

  Phase names for evaluate(): "Align", "Appr", "FA", "Total".
  Phase names for grade(): "Alignment Phase", "Approach Phase",
  "Final Approach Phase", "Total Flight".

Hardening:
  - Settings are validated on every entry point.
  - Unknown phase names and non-ascending boundaries raise ValidationError.
================================================================================
*/

#include <cstddef>
#include <string>
#include <vector>

#include "dockeval/core/diagnostics.hpp"
#include "dockeval/core/settings.hpp"
#include "dockeval/eval/evaluation_engine.hpp"
#include "dockeval/eval/result_record.hpp"
#include "dockeval/eval/schema.hpp"
#include "dockeval/grading/tiering.hpp"
#include "dockeval/log/flight_series.hpp"
#include "dockeval/log/log_parser.hpp"
#include "dockeval/phases/phase_detector.hpp"

namespace dockeval {

class ReferenceStatsCache;

struct StructuredFlight {
  FlightSeries series;
  ResultRecord record;  // schema columns, identity fields filled
};

// Validates the file selection, parses and structures the session.
StructuredFlight parse_and_structure(const std::vector<std::string>& log_paths, const Schema& schema,
                                     const Settings& settings);

// Same for a session already held in memory (names are validated too).
StructuredFlight parse_and_structure(const std::vector<LogSegment>& segments, const Schema& schema,
                                     const Settings& settings);

PhaseDetection detect(const FlightSeries& series, const Settings& settings, DiagnosticSink& sink);

// For "Total" the flight-level metrics (Time_Dock, LatOffsetAt_Dock) are
// computed as well.
ErrorTimestamps evaluate(const FlightSeries& series, const std::string& phase_name, std::size_t start_index,
                         std::size_t stop_index, const PhaseBoundaries& boundaries, const Schema& schema,
                         ResultRecord& record, DiagnosticSink& sink, const Settings& settings);

// All four phases with their standard indices.
ErrorTimestamps evaluate_all(const FlightSeries& series, const PhaseBoundaries& boundaries, const Schema& schema,
                             ResultRecord& record, DiagnosticSink& sink, const Settings& settings);

GradeReport grade(const ResultRecord& record, const std::string& grading_phase, const Schema& schema,
                  const Settings& settings, ReferenceStatsCache* cache = nullptr);

} // namespace dockeval
