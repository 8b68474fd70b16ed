#include "dockeval/eval/metric_catalog.hpp"

#include "dockeval/core/errors.hpp"

#include <tuple>
#include <unordered_map>

namespace dockeval {

namespace {

constexpr std::array<Controller, 2> kControllers{Controller::kThc, Controller::kRhc};
constexpr std::array<Axis, 3> kAxes{Axis::kX, Axis::kY, Axis::kZ};

bool uses_phase(MetricKind k) { return !is_flight_level_kind(k); }

bool uses_controller(MetricKind k) {
  switch (k) {
    case MetricKind::kControllerInputs:
    case MetricKind::kControllerAvgTime:
    case MetricKind::kSteeringErrors:
    case MetricKind::kIndependentErrors:
    case MetricKind::kCombinedYz:
    case MetricKind::kCombinedYzTime:
    case MetricKind::kCombinedXyz:
    case MetricKind::kCombinedXyzTime:
    case MetricKind::kSpectralPower:
      return true;
    default:
      return false;
  }
}

bool uses_axis(MetricKind k) {
  switch (k) {
    case MetricKind::kControllerInputs:
    case MetricKind::kControllerAvgTime:
    case MetricKind::kSteeringErrors:
    case MetricKind::kIndependentErrors:
    case MetricKind::kSpectralPower:
      return true;
    default:
      return false;
  }
}

bool uses_quantity(MetricKind k) {
  return k == MetricKind::kAverage || k == MetricKind::kRms;
}

// Comparison key with the fields a kind ignores zeroed.
std::tuple<int, int, int, int, int> key(const MetricId& m) {
  return {static_cast<int>(m.kind),
          uses_phase(m.kind) ? static_cast<int>(m.phase) : 0,
          uses_controller(m.kind) ? static_cast<int>(m.controller) : 0,
          uses_axis(m.kind) ? static_cast<int>(m.axis) : 0,
          uses_quantity(m.kind) ? static_cast<int>(m.quantity) : 0};
}

MetricId make(MetricKind k, Phase p, Controller c = Controller::kThc, Axis a = Axis::kX,
              Quantity q = Quantity::kLatOff) {
  MetricId m;
  m.kind = k;
  m.phase = p;
  m.controller = c;
  m.axis = a;
  m.quantity = q;
  return m;
}

std::vector<MetricId> build_catalog() {
  std::vector<MetricId> out;
  for (const auto& ps : kPhaseSpecs) {
    const Phase p = ps.phase;
    out.push_back(make(MetricKind::kPhaseStart, p));
    out.push_back(make(MetricKind::kPhaseDuration, p));
    out.push_back(make(MetricKind::kOutOfCone, p));
    out.push_back(make(MetricKind::kAboveClosingVel, p));
    out.push_back(make(MetricKind::kFuelBurn, p));
    out.push_back(make(MetricKind::kLatOffsetAtStart, p));
    out.push_back(make(MetricKind::kNoVisibility, p));
    for (Controller c : kControllers) {
      for (Axis a : kAxes) {
        out.push_back(make(MetricKind::kControllerInputs, p, c, a));
        out.push_back(make(MetricKind::kControllerAvgTime, p, c, a));
      }
    }
    for (Axis a : kAxes) {
      for (Controller c : kControllers) {
        out.push_back(make(MetricKind::kSteeringErrors, p, c, a));
        out.push_back(make(MetricKind::kIndependentErrors, p, c, a));
      }
    }
    out.push_back(make(MetricKind::kFuelOnError, p));
    out.push_back(make(MetricKind::kCombinedInputs, p));
    out.push_back(make(MetricKind::kCombinedInputsTime, p));
    for (Controller c : kControllers) {
      out.push_back(make(MetricKind::kCombinedYz, p, c));
      out.push_back(make(MetricKind::kCombinedYzTime, p, c));
    }
    for (Controller c : kControllers) {
      out.push_back(make(MetricKind::kCombinedXyz, p, c));
      out.push_back(make(MetricKind::kCombinedXyzTime, p, c));
    }
    for (Controller c : kControllers) {
      for (Axis a : kAxes) out.push_back(make(MetricKind::kSpectralPower, p, c, a));
    }
    for (std::size_t q = 0; q < kQuantityCount; ++q) {
      out.push_back(make(MetricKind::kAverage, p, Controller::kThc, Axis::kX, static_cast<Quantity>(q)));
      out.push_back(make(MetricKind::kRms, p, Controller::kThc, Axis::kX, static_cast<Quantity>(q)));
    }
  }
  out.push_back(make(MetricKind::kDockTime, Phase::kTotal));
  out.push_back(make(MetricKind::kLatOffsetAtDock, Phase::kTotal));
  return out;
}

const std::unordered_map<std::string, MetricId>& name_index() {
  static const std::unordered_map<std::string, MetricId> idx = [] {
    std::unordered_map<std::string, MetricId> m;
    for (const auto& id : all_metrics()) m.emplace(metric_name(id), id);
    return m;
  }();
  return idx;
}

} // namespace

const PhaseSpec& phase_spec(Phase p) {
  return kPhaseSpecs[static_cast<std::size_t>(p)];
}

std::optional<Phase> parse_phase_suffix(std::string_view s) {
  for (const auto& ps : kPhaseSpecs) {
    if (s == ps.suffix) return ps.phase;
  }
  return std::nullopt;
}

std::optional<Phase> parse_grading_phase(std::string_view s) {
  for (const auto& ps : kPhaseSpecs) {
    if (s == ps.grading_name) return ps.phase;
  }
  return std::nullopt;
}

const char* controller_name(Controller c) {
  return c == Controller::kThc ? "THC" : "RHC";
}

const char* axis_name(Axis a) {
  switch (a) {
    case Axis::kX: return "x";
    case Axis::kY: return "y";
    case Axis::kZ: return "z";
  }
  return "x";
}

std::string controller_column(Controller c, Axis a) {
  return std::string(controller_name(c)) + "." + axis_name(a);
}

const char* quantity_name(Quantity q) {
  switch (q) {
    case Quantity::kLatOff: return "LatOff";
    case Quantity::kApprVel: return "ApprVel";
    case Quantity::kLatVel: return "LatVel";
    case Quantity::kRoll: return "Roll";
    case Quantity::kYaw: return "Yaw";
    case Quantity::kPitch: return "Pitch";
    case Quantity::kRollRate: return "RollRate";
    case Quantity::kYawRate: return "YawRate";
    case Quantity::kPitchRate: return "PitchRate";
  }
  return "LatOff";
}

const char* quantity_column(Quantity q) {
  switch (q) {
    case Quantity::kLatOff: return "Lateral Offset";
    case Quantity::kApprVel: return "COG Vel.x [m]";
    case Quantity::kLatVel: return "Lateral Velocity";
    case Quantity::kRoll: return "Rot Angle.x [deg]";
    case Quantity::kYaw: return "Rot Angle.y [deg]";
    case Quantity::kPitch: return "Rot Angle.z [deg]";
    case Quantity::kRollRate: return "Rot. Rate.x [deg/s]";
    case Quantity::kYawRate: return "Rot. Rate.y [deg/s]";
    case Quantity::kPitchRate: return "Rot. Rate.z [deg/s]";
  }
  return "Lateral Offset";
}

bool is_count_kind(MetricKind k) noexcept {
  switch (k) {
    case MetricKind::kControllerInputs:
    case MetricKind::kSteeringErrors:
    case MetricKind::kIndependentErrors:
    case MetricKind::kCombinedInputs:
    case MetricKind::kCombinedYz:
    case MetricKind::kCombinedXyz:
      return true;
    default:
      return false;
  }
}

bool is_flight_level_kind(MetricKind k) noexcept {
  return k == MetricKind::kDockTime || k == MetricKind::kLatOffsetAtDock;
}

bool MetricId::operator==(const MetricId& o) const noexcept {
  return key(*this) == key(o);
}

bool MetricId::operator<(const MetricId& o) const noexcept {
  return key(*this) < key(o);
}

std::string metric_name(const MetricId& id) {
  const std::string p = phase_spec(id.phase).suffix;
  const std::string c = controller_name(id.controller);
  const std::string a = axis_name(id.axis);

  switch (id.kind) {
    case MetricKind::kPhaseStart: return "Start_" + p;
    case MetricKind::kPhaseDuration: return "Duration_" + p;
    case MetricKind::kOutOfCone: return "OutOfCone_" + p;
    case MetricKind::kAboveClosingVel: return "AboveClosingVel_" + p;
    case MetricKind::kFuelBurn: return "Fuel_" + p;
    case MetricKind::kLatOffsetAtStart: return "LatOffsetAtStart_" + p;
    case MetricKind::kNoVisibility: return "NoVisTime_" + p;
    case MetricKind::kControllerInputs: return c + a + "_" + p;
    case MetricKind::kControllerAvgTime: return c + a + "AvgTime_" + p;
    case MetricKind::kSteeringErrors: return c + a + "Err_" + p;
    case MetricKind::kIndependentErrors: return c + a + "IndErr_" + p;
    case MetricKind::kFuelOnError: return "Fuel_on_Error_" + p;
    case MetricKind::kCombinedInputs: return "CombJoy_" + p;
    case MetricKind::kCombinedInputsTime: return "CombJoyTime_" + p;
    case MetricKind::kCombinedYz: return "CombJoy" + c + "yz_" + p;
    case MetricKind::kCombinedYzTime: return "CombJoy" + c + "yzTime_" + p;
    case MetricKind::kCombinedXyz: return "CombJoy" + c + "xyz_" + p;
    case MetricKind::kCombinedXyzTime: return "CombJoy" + c + "xyzTime_" + p;
    case MetricKind::kSpectralPower: return c + a + "PSD_" + p;
    case MetricKind::kAverage: return std::string(quantity_name(id.quantity)) + "Avg_" + p;
    case MetricKind::kRms: return std::string(quantity_name(id.quantity)) + "Rms_" + p;
    case MetricKind::kDockTime: return "Time_Dock";
    case MetricKind::kLatOffsetAtDock: return "LatOffsetAt_Dock";
  }
  throw DockevalError("metric_name: unknown MetricKind");
}

std::optional<MetricId> parse_metric_name(std::string_view name) {
  const auto& idx = name_index();
  auto it = idx.find(std::string(name));
  if (it == idx.end()) return std::nullopt;
  return it->second;
}

const std::vector<MetricId>& all_metrics() {
  static const std::vector<MetricId> catalog = build_catalog();
  return catalog;
}

MetricRequest MetricRequest::from_schema(const Schema& schema) {
  MetricRequest r;
  for (const auto& c : schema.columns()) {
    if (auto id = parse_metric_name(c.name)) r.add(*id, c.optional);
  }
  return r;
}

MetricRequest MetricRequest::everything() {
  MetricRequest r;
  for (const auto& id : all_metrics()) r.add(id);
  return r;
}

void MetricRequest::add(const MetricId& id, bool optional) {
  ids_.insert(id);
  if (optional) optional_.insert(id);
  else optional_.erase(id);
}

std::vector<MetricId> MetricRequest::for_phase(Phase p) const {
  std::vector<MetricId> out;
  // Catalog order keeps diagnostics in a stable sequence.
  for (const auto& id : all_metrics()) {
    if (is_flight_level_kind(id.kind) || id.phase != p) continue;
    if (contains(id)) out.push_back(id);
  }
  return out;
}

} // namespace dockeval
