#pragma once
/*
================================================================================
Fragment 4.7 - Eval: Evaluation Engine
FILE: cpp/dockeval/eval/evaluation_engine.hpp

Purpose:
  Compute the requested metrics of one phase window [b[start], b[stop]) and
  write them into the result record.

  Phases and boundary indices:
      Align (0,1)   Appr (1,2)   FA (2,3)   Total (0,3)

Dispatch:
  Each MetricKind maps to one evaluator in a fixed table. Evaluators of the
  same phase share a context that caches row masks (steering-error masks
  feed Err, IndErr and Fuel_on_Error).

Lookup misses:
  Metrics that read a column at an exact boundary SimTime throw
  PhaseDataUnavailable when no row matches. If the metric is optional in the
  request, it is skipped with a kSkippedMetric diagnostic instead.

Total phase:
  Also returns the error SimTimes of every controller axis, keyed
  "THC.x" .. "RHC.z", for plotting collaborators.
================================================================================
*/

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "dockeval/core/diagnostics.hpp"
#include "dockeval/core/settings.hpp"
#include "dockeval/eval/metric_catalog.hpp"
#include "dockeval/eval/result_record.hpp"
#include "dockeval/log/flight_series.hpp"
#include "dockeval/phases/phase_detector.hpp"

namespace dockeval {

// Controller axis ("THC.x") -> SimTimes of its error rows.
using ErrorTimestamps = std::map<std::string, std::vector<double>>;

// Evaluates `phase` over [boundaries[start_index], boundaries[stop_index]).
// Returns the error timestamps for the Total phase, an empty map otherwise.
// Throws ValidationError for indices outside 0 <= start < stop <= 3.
ErrorTimestamps evaluate_phase(const FlightSeries& series, Phase phase, std::size_t start_index,
                               std::size_t stop_index, const PhaseBoundaries& boundaries,
                               const MetricRequest& request, ResultRecord& record,
                               DiagnosticSink& sink,
                               const EvaluationSettings& settings = EvaluationSettings{});

// Same, with the standard indices of `phase`.
ErrorTimestamps evaluate_phase(const FlightSeries& series, Phase phase,
                               const PhaseBoundaries& boundaries, const MetricRequest& request,
                               ResultRecord& record, DiagnosticSink& sink,
                               const EvaluationSettings& settings = EvaluationSettings{});

// Time_Dock and LatOffsetAt_Dock.
void evaluate_flight_level(const FlightSeries& series, const PhaseBoundaries& boundaries,
                           const MetricRequest& request, ResultRecord& record,
                           DiagnosticSink& sink,
                           const EvaluationSettings& settings = EvaluationSettings{});

// Align, Appr, FA, Total, then the flight-level metrics. Returns the Total
// error timestamps.
ErrorTimestamps evaluate_flight(const FlightSeries& series, const PhaseBoundaries& boundaries,
                                const MetricRequest& request, ResultRecord& record,
                                DiagnosticSink& sink,
                                const EvaluationSettings& settings = EvaluationSettings{});

} // namespace dockeval
