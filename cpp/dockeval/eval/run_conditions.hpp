#pragma once
/*
================================================================================
Fragment 4.5 - Eval: Run Conditions
FILE: cpp/dockeval/eval/run_conditions.hpp

Purpose:
  Start/stop row masks for every edge-run metric. All masks are already
  clamped to the phase window and use the shifted() lag (fill 0) for the
  previous row.

  Level runs        OutOfCone, AboveClosingVel, NoVisTime
  Controller runs   <C><a> input counts and average input time
  Combined runs     CombJoy, CombJoy<C>yz, CombJoy<C>xyz
  Steering errors   per-axis deviation-increasing inputs

Steering-error asymmetry:
  THC y/z errors are velocity-gated (braking is not an error); RHC errors
  are not. THC.x uses its own flag rule against the ideal approach velocity
  and has no stop mask.
================================================================================
*/

#include <string>
#include <vector>

#include "dockeval/eval/edge_runs.hpp"
#include "dockeval/eval/metric_catalog.hpp"
#include "dockeval/log/flight_series.hpp"

namespace dockeval {

struct RunConditions {
  RowMask start;
  RowMask stop;
};

struct PhaseWindow {
  double t0 = 0.0;      // b[start]
  double t1 = 0.0;      // b[stop]
  RowMask rows;         // t0 <= SimTime < t1
};

PhaseWindow make_window(const FlightSeries& series, double t0, double t1);

enum class LevelCompare : int {
  kAbove = 0,   // inside: a > b, outside: a <= b
  kBelow = 1,   // inside: a < b, outside: a >= b
};

// start: inside now and (outside on the previous row or SimTime == t0)
// stop:  outside now and (inside on the previous row or SimTime == t1)
// `b_prev` is the previous-row reference (shifted column, or the same
// constant for a fixed limit).
RunConditions level_run_conditions(const FlightSeries& series, const PhaseWindow& w,
                                   const std::vector<double>& a, const std::vector<double>& b,
                                   const std::vector<double>& b_prev, LevelCompare cmp);

// start: input != 0 after a zero row; stop: input == 0 after a non-zero row.
RunConditions controller_run_conditions(const FlightSeries& series, const PhaseWindow& w,
                                        Controller c, Axis a);

// Both controllers deflected at once.
RunConditions combined_run_conditions(const FlightSeries& series, const PhaseWindow& w);

// <C>.y and <C>.z deflected at once.
RunConditions combined_yz_run_conditions(const FlightSeries& series, const PhaseWindow& w,
                                         Controller c);

// <C>.x together with <C>.y or <C>.z.
RunConditions combined_xyz_run_conditions(const FlightSeries& series, const PhaseWindow& w,
                                          Controller c);

// THC.x error rows:
//   (Vx < ideal, THC.x < 0, THC.x was 0) or
//   (Vx < ideal, THC.x < 0, previous Vx >= previous ideal) or
//   (Vx > 0,     THC.x > 0, THC.x was 0)
RowMask thc_x_error_rows(const FlightSeries& series, const PhaseWindow& w);

// Start/stop masks of the deviation-increasing inputs of one axis.
// Throws ValidationError for THC.x (use thc_x_error_rows()).
RunConditions steering_error_conditions(const FlightSeries& series, const PhaseWindow& w,
                                        Controller c, Axis a);

// Axes of the same controller checked for simultaneous input on an error row.
std::vector<std::string> independent_axes(Controller c, Axis a);

// Flagged rows on which any of independent_axes(c, a) is non-zero.
std::size_t count_independent_errors(const FlightSeries& series, const RowMask& flagged,
                                     Controller c, Axis a);

} // namespace dockeval
