#pragma once
/*
================================================================================
Fragment 3.1 - Phases: Phase Boundary Detection
FILE: cpp/dockeval/phases/phase_detector.hpp

Purpose:
  Find the four boundary timestamps of a docking flight:
    [0] alignment start      first row with any THC/RHC axis non-zero
                             (fallback: first SimTime)
    [1] approach start       first row after [0] with COG Vel.x <= -0.1 and
                             COG Vel.x still falling toward the next sample
    [2] final approach start first row with COG Pos.x < 20
    [3] docking time         first row with Port Pos.x == 0 exactly
                             (fallback: last SimTime)

Backup pass:
  Unresolved [1]/[2] are placed by row index between their resolved
  neighbours: both missing -> 1/3 and 2/3, one missing -> 1/2. The fractions
  are a heuristic kept for compatibility with stored results.

Contract:
  detect_phases() never throws on well-formed series and always returns four
  values drawn from the SimTime column. Every fallback emits a diagnostic.
================================================================================
*/

#include <array>
#include <string>
#include <vector>

#include "dockeval/core/diagnostics.hpp"
#include "dockeval/core/settings.hpp"
#include "dockeval/log/flight_series.hpp"

namespace dockeval {

using PhaseBoundaries = std::array<double, 4>;

enum class BoundarySlot : int {
  kAlignmentStart = 0,
  kApproachStart = 1,
  kFinalApproachStart = 2,
  kDocking = 3,
};

struct PhaseDetection {
  PhaseBoundaries boundaries{};
  std::array<bool, 4> backup{false, false, false, false};
  std::vector<std::string> notices;

  bool any_backup() const noexcept {
    return backup[0] || backup[1] || backup[2] || backup[3];
  }
};

// Throws ValidationError on an empty series or missing columns.
PhaseDetection detect_phases(const FlightSeries& series,
                             const DetectionSettings& settings,
                             DiagnosticSink& sink);

// Nearest real SimTime for a manually chosen boundary.
double snap_to_sim_time(const FlightSeries& series, double t);

// Snaps all four boundaries.
PhaseBoundaries snap_boundaries(const FlightSeries& series, const PhaseBoundaries& b);

// Throws ValidationError("Phase Timestamp have to be in ascending order ...")
// when the boundaries are not non-decreasing.
void validate_ascending(const PhaseBoundaries& b);

// Formats a boundary the way notices print it (shortest round-trip form).
std::string format_sim_time(double t);

} // namespace dockeval
