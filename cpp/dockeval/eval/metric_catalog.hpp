#pragma once
/*
================================================================================
Fragment 4.2 - Eval: Metric Catalog
FILE: cpp/dockeval/eval/metric_catalog.hpp

Purpose:
  Every metric the evaluation engine can produce, as a typed identifier:
      MetricId{kind, phase, controller, axis, quantity}
  plus the bijection with the column names used in result records and
  historical databases ("OutOfCone_Appr", "RHCyErr_FA", "Time_Dock", ...).

  A MetricRequest is the explicit set of metrics to compute. It is built
  from the schema; names the catalog does not know (identity fields) are
  ignored.
================================================================================
*/

#include <array>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "dockeval/eval/schema.hpp"

namespace dockeval {

enum class Phase : int { kAlign = 0, kAppr = 1, kFA = 2, kTotal = 3 };

struct PhaseSpec {
  Phase phase;
  const char* suffix;          // column name suffix ("Align", ...)
  const char* grading_name;    // grading selector ("Alignment Phase", ...)
  std::size_t start_index;     // into PhaseBoundaries
  std::size_t stop_index;
};

inline constexpr std::array<PhaseSpec, 4> kPhaseSpecs{{
    {Phase::kAlign, "Align", "Alignment Phase", 0, 1},
    {Phase::kAppr, "Appr", "Approach Phase", 1, 2},
    {Phase::kFA, "FA", "Final Approach Phase", 2, 3},
    {Phase::kTotal, "Total", "Total Flight", 0, 3},
}};

const PhaseSpec& phase_spec(Phase p);
std::optional<Phase> parse_phase_suffix(std::string_view s);
std::optional<Phase> parse_grading_phase(std::string_view s);

enum class Controller : int { kThc = 0, kRhc = 1 };
enum class Axis : int { kX = 0, kY = 1, kZ = 2 };

// Averaged / RMS quantities and the series column each one reads.
enum class Quantity : int {
  kLatOff = 0, kApprVel, kLatVel, kRoll, kYaw, kPitch, kRollRate, kYawRate, kPitchRate,
};
inline constexpr std::size_t kQuantityCount = 9;

const char* controller_name(Controller c);      // "THC" / "RHC"
const char* axis_name(Axis a);                  // "x" / "y" / "z"
std::string controller_column(Controller c, Axis a);  // "THC.x"
const char* quantity_name(Quantity q);          // "LatOff"
const char* quantity_column(Quantity q);        // "Lateral Offset"

enum class MetricKind : int {
  kPhaseStart = 0,
  kPhaseDuration,
  kOutOfCone,
  kAboveClosingVel,
  kFuelBurn,
  kLatOffsetAtStart,
  kNoVisibility,
  kControllerInputs,
  kControllerAvgTime,
  kSteeringErrors,
  kIndependentErrors,
  kFuelOnError,
  kCombinedInputs,
  kCombinedInputsTime,
  kCombinedYz,
  kCombinedYzTime,
  kCombinedXyz,
  kCombinedXyzTime,
  kSpectralPower,
  kAverage,
  kRms,
  kDockTime,
  kLatOffsetAtDock,
};
inline constexpr std::size_t kMetricKindCount = 23;

// Metrics whose values are occurrence counts (stored as JSON integers).
bool is_count_kind(MetricKind k) noexcept;

// Whole-flight metrics carry no phase suffix.
bool is_flight_level_kind(MetricKind k) noexcept;

struct MetricId {
  MetricKind kind = MetricKind::kPhaseStart;
  Phase phase = Phase::kTotal;
  Controller controller = Controller::kThc;
  Axis axis = Axis::kX;
  Quantity quantity = Quantity::kLatOff;

  bool operator==(const MetricId& o) const noexcept;
  bool operator<(const MetricId& o) const noexcept;
};

// Canonical column name.
std::string metric_name(const MetricId& id);

// Inverse of metric_name(); nullopt for names outside the catalog.
std::optional<MetricId> parse_metric_name(std::string_view name);

// The full catalog in canonical order (per phase, then flight-level).
const std::vector<MetricId>& all_metrics();

class MetricRequest {
 public:
  MetricRequest() = default;

  static MetricRequest from_schema(const Schema& schema);
  static MetricRequest everything();

  void add(const MetricId& id, bool optional = false);

  bool contains(const MetricId& id) const { return ids_.count(id) != 0; }
  bool is_optional(const MetricId& id) const { return optional_.count(id) != 0; }
  bool empty() const noexcept { return ids_.empty(); }
  std::size_t size() const noexcept { return ids_.size(); }

  // Requested metrics of one phase (flight-level metrics excluded).
  std::vector<MetricId> for_phase(Phase p) const;

  const std::set<MetricId>& ids() const noexcept { return ids_; }

 private:
  std::set<MetricId> ids_;
  std::set<MetricId> optional_;
};

} // namespace dockeval
