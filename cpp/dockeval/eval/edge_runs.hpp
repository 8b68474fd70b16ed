#pragma once
/*
================================================================================
Fragment 4.4 - Eval: Edge Runs
FILE: cpp/dockeval/eval/edge_runs.hpp

Purpose:
  Row masks and run reconstruction for the edge-run metrics.

  A metric defines a start mask (rising edge into a condition) and a stop
  mask (falling edge out of it), both clamped to the phase window
  [b[start], b[stop]). The SimTimes under each mask form the start and stop
  lists, which are then reconciled into pairs:

    - fewer starts than stops -> prepend the window start (already active on
      entry)
    - more starts than stops  -> append the window stop (still active on exit)
    - still unequal           -> every start is paired with the next row's
      SimTime (NaN after the last row) and an EdgeMismatch diagnostic is
      emitted

Conventions:
  - shifted() is a one-row lag with fill value 0 for the first row.
  - Comparisons involving NaN are false, except != which is true.
================================================================================
*/

#include <cstddef>
#include <string>
#include <vector>

#include "dockeval/core/diagnostics.hpp"
#include "dockeval/log/flight_series.hpp"

namespace dockeval {

using RowMask = std::vector<bool>;

// One-row lag; out[0] = 0.
std::vector<double> shifted(const std::vector<double>& v);

// Rows with t0 <= SimTime < t1.
RowMask window_mask(const std::vector<double>& sim_time, double t0, double t1);

std::size_t count_true(const RowMask& m);

// SimTime values of the rows under the mask, in row order.
std::vector<double> masked_times(const std::vector<double>& sim_time, const RowMask& m);

struct RunPairs {
  std::vector<double> starts;
  std::vector<double> stops;
  bool used_fallback = false;

  std::size_t size() const noexcept { return starts.size(); }

  // Sum of (stop - start); NaN if any stop is NaN.
  double total_duration() const;

  // Mean of (stop - start); 0 when there are no pairs.
  double mean_duration() const;
};

// Pairs start and stop rows as described above. `label` prefixes the
// mismatch diagnostic (controller axis or metric name).
RunPairs reconcile_runs(const FlightSeries& series, const RowMask& start, const RowMask& stop,
                        double window_start, double window_stop, const std::string& label,
                        DiagnosticSink& sink);

} // namespace dockeval
