#include "dockeval/eval/evaluation_engine.hpp"

#include "dockeval/core/errors.hpp"
#include "dockeval/core/logging.hpp"
#include "dockeval/eval/edge_runs.hpp"
#include "dockeval/eval/run_conditions.hpp"
#include "dockeval/eval/spectral.hpp"
#include "dockeval/log/structurer.hpp"

#include <array>
#include <cmath>
#include <limits>
#include <optional>

namespace dockeval {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

struct EvalContext {
  const FlightSeries& series;
  PhaseWindow window;
  const EvaluationSettings& settings;
  DiagnosticSink& sink;

  std::map<int, RunConditions> steering;
  std::optional<RowMask> thc_x_flags;

  const RowMask& thc_x_errors() {
    if (!thc_x_flags) thc_x_flags = thc_x_error_rows(series, window);
    return *thc_x_flags;
  }

  const RunConditions& steering_conditions(Controller c, Axis a) {
    const int key = static_cast<int>(c) * 3 + static_cast<int>(a);
    auto it = steering.find(key);
    if (it == steering.end()) {
      it = steering.emplace(key, steering_error_conditions(series, window, c, a)).first;
    }
    return it->second;
  }

  // Error rows of one axis: THC.x flags or the start mask of the others.
  const RowMask& error_rows(Controller c, Axis a) {
    if (c == Controller::kThc && a == Axis::kX) return thc_x_errors();
    return steering_conditions(c, a).start;
  }

  std::vector<double> window_values(const std::string& column) const {
    const auto& v = series.column(column);
    std::vector<double> out;
    for (std::size_t i = 0; i < v.size(); ++i) {
      if (window.rows[i]) out.push_back(v[i]);
    }
    return out;
  }
};

double value_at(const EvalContext& ctx, const MetricId& id, const char* column, double t) {
  const auto row = ctx.series.row_at(t);
  if (!row) {
    const std::string name = metric_name(id);
    throw PhaseDataUnavailable(name, t,
                               name + ": no data row at SimTime " + format_sim_time(t));
  }
  return ctx.series.column(column)[*row];
}

double run_time(EvalContext& ctx, const RunConditions& rc, const std::string& label) {
  return reconcile_runs(ctx.series, rc.start, rc.stop, ctx.window.t0, ctx.window.t1, label, ctx.sink)
      .total_duration();
}

// ----------------------------- evaluators ------------------------------------

double eval_phase_start(EvalContext& ctx, const MetricId&) { return ctx.window.t0; }

double eval_phase_duration(EvalContext& ctx, const MetricId&) { return ctx.window.t1 - ctx.window.t0; }

double eval_out_of_cone(EvalContext& ctx, const MetricId& id) {
  const auto& off = ctx.series.column(col::kLateralOffset);
  const auto& cone = ctx.series.column(col::kApproachCone);
  const RunConditions rc =
      level_run_conditions(ctx.series, ctx.window, off, cone, shifted(cone), LevelCompare::kAbove);
  return run_time(ctx, rc, metric_name(id));
}

double eval_above_closing_vel(EvalContext& ctx, const MetricId& id) {
  const auto& vx = ctx.series.column(col::kCogVelX);
  const auto& ideal = ctx.series.column(col::kIdealApproachVel);
  const RunConditions rc =
      level_run_conditions(ctx.series, ctx.window, vx, ideal, shifted(ideal), LevelCompare::kBelow);
  return run_time(ctx, rc, metric_name(id));
}

double eval_fuel_burn(EvalContext& ctx, const MetricId& id) {
  return value_at(ctx, id, col::kTankMass, ctx.window.t0) -
         value_at(ctx, id, col::kTankMass, ctx.window.t1);
}

double eval_lat_offset_at_start(EvalContext& ctx, const MetricId& id) {
  return value_at(ctx, id, col::kLateralOffset, ctx.window.t0);
}

double eval_no_visibility(EvalContext& ctx, const MetricId& id) {
  const auto& angle = ctx.series.column(col::kAngleToPort);
  const std::vector<double> limit(angle.size(), ctx.settings.visibility_angle_deg);
  const RunConditions rc =
      level_run_conditions(ctx.series, ctx.window, angle, limit, limit, LevelCompare::kAbove);
  return run_time(ctx, rc, metric_name(id));
}

double eval_controller_inputs(EvalContext& ctx, const MetricId& id) {
  const RunConditions rc = controller_run_conditions(ctx.series, ctx.window, id.controller, id.axis);
  return static_cast<double>(count_true(rc.start));
}

double eval_controller_avg_time(EvalContext& ctx, const MetricId& id) {
  const RunConditions rc = controller_run_conditions(ctx.series, ctx.window, id.controller, id.axis);
  return reconcile_runs(ctx.series, rc.start, rc.stop, ctx.window.t0, ctx.window.t1,
                        controller_column(id.controller, id.axis), ctx.sink)
      .mean_duration();
}

double eval_steering_errors(EvalContext& ctx, const MetricId& id) {
  return static_cast<double>(count_true(ctx.error_rows(id.controller, id.axis)));
}

double eval_independent_errors(EvalContext& ctx, const MetricId& id) {
  return static_cast<double>(
      count_independent_errors(ctx.series, ctx.error_rows(id.controller, id.axis), id.controller, id.axis));
}

double eval_fuel_on_error(EvalContext& ctx, const MetricId& id) {
  double fuel = 0.0;
  for (Axis a : {Axis::kX, Axis::kY, Axis::kZ}) {
    for (Controller c : {Controller::kThc, Controller::kRhc}) {
      if (c == Controller::kThc && a == Axis::kX) continue;
      const RunConditions& rc = ctx.steering_conditions(c, a);
      const RunPairs runs = reconcile_runs(ctx.series, rc.start, rc.stop, ctx.window.t0, ctx.window.t1,
                                           controller_column(c, a), ctx.sink);
      for (std::size_t i = 0; i < runs.size(); ++i) {
        fuel += value_at(ctx, id, col::kTankMass, runs.starts[i]) -
                value_at(ctx, id, col::kTankMass, runs.stops[i]);
      }
    }
  }
  return fuel;
}

double eval_combined_inputs(EvalContext& ctx, const MetricId&) {
  return static_cast<double>(count_true(combined_run_conditions(ctx.series, ctx.window).start));
}

double eval_combined_inputs_time(EvalContext& ctx, const MetricId& id) {
  return run_time(ctx, combined_run_conditions(ctx.series, ctx.window), metric_name(id));
}

double eval_combined_yz(EvalContext& ctx, const MetricId& id) {
  return static_cast<double>(count_true(combined_yz_run_conditions(ctx.series, ctx.window, id.controller).start));
}

double eval_combined_yz_time(EvalContext& ctx, const MetricId& id) {
  return run_time(ctx, combined_yz_run_conditions(ctx.series, ctx.window, id.controller), metric_name(id));
}

double eval_combined_xyz(EvalContext& ctx, const MetricId& id) {
  return static_cast<double>(count_true(combined_xyz_run_conditions(ctx.series, ctx.window, id.controller).start));
}

double eval_combined_xyz_time(EvalContext& ctx, const MetricId& id) {
  return run_time(ctx, combined_xyz_run_conditions(ctx.series, ctx.window, id.controller), metric_name(id));
}

double eval_spectral_power(EvalContext& ctx, const MetricId& id) {
  return mean_power_spectral_density(ctx.window_values(controller_column(id.controller, id.axis)));
}

// Mean and RMS skip missing samples; NaN when nothing is left.
double eval_average(EvalContext& ctx, const MetricId& id) {
  double sum = 0.0;
  std::size_t n = 0;
  for (double v : ctx.window_values(quantity_column(id.quantity))) {
    if (std::isnan(v)) continue;
    sum += v;
    ++n;
  }
  return n ? sum / static_cast<double>(n) : kNaN;
}

double eval_rms(EvalContext& ctx, const MetricId& id) {
  double sum = 0.0;
  std::size_t n = 0;
  for (double v : ctx.window_values(quantity_column(id.quantity))) {
    if (std::isnan(v)) continue;
    sum += v * v;
    ++n;
  }
  return n ? std::sqrt(sum / static_cast<double>(n)) : kNaN;
}

double eval_dock_time(EvalContext& ctx, const MetricId&) { return ctx.window.t1; }

double eval_lat_offset_at_dock(EvalContext& ctx, const MetricId& id) {
  return value_at(ctx, id, col::kLateralOffset, ctx.window.t1);
}

using Evaluator = double (*)(EvalContext&, const MetricId&);

// Indexed by MetricKind.
constexpr std::array<Evaluator, kMetricKindCount> kEvaluators{
    eval_phase_start,         eval_phase_duration,     eval_out_of_cone,
    eval_above_closing_vel,   eval_fuel_burn,          eval_lat_offset_at_start,
    eval_no_visibility,       eval_controller_inputs,  eval_controller_avg_time,
    eval_steering_errors,     eval_independent_errors, eval_fuel_on_error,
    eval_combined_inputs,     eval_combined_inputs_time, eval_combined_yz,
    eval_combined_yz_time,    eval_combined_xyz,       eval_combined_xyz_time,
    eval_spectral_power,      eval_average,            eval_rms,
    eval_dock_time,           eval_lat_offset_at_dock,
};

void run_metric(EvalContext& ctx, const MetricId& id, const MetricRequest& request,
                ResultRecord& record) {
  const std::string name = metric_name(id);
  try {
    const double v = kEvaluators[static_cast<std::size_t>(id.kind)](ctx, id);
    record.set_number(name, v, is_count_kind(id.kind));
  } catch (const PhaseDataUnavailable& e) {
    if (!request.is_optional(id)) throw;
    ctx.sink.emit(DiagnosticKind::kSkippedMetric, "Skipped optional metric " + name + ": " + e.what());
  }
}

ErrorTimestamps collect_error_timestamps(EvalContext& ctx) {
  ErrorTimestamps out;
  const auto& t = ctx.series.sim_time();
  for (Controller c : {Controller::kThc, Controller::kRhc}) {
    for (Axis a : {Axis::kX, Axis::kY, Axis::kZ}) {
      out[controller_column(c, a)] = masked_times(t, ctx.error_rows(c, a));
    }
  }
  return out;
}

} // namespace

ErrorTimestamps evaluate_phase(const FlightSeries& series, Phase phase, std::size_t start_index,
                               std::size_t stop_index, const PhaseBoundaries& boundaries,
                               const MetricRequest& request, ResultRecord& record,
                               DiagnosticSink& sink, const EvaluationSettings& settings) {
  settings.validate_or_throw();
  if (!(start_index < stop_index) || stop_index >= boundaries.size()) {
    throw ValidationError("evaluate_phase: boundary indices must satisfy 0 <= start < stop <= 3");
  }
  if (series.empty()) throw ValidationError("evaluate_phase: flight series is empty");

  EvalContext ctx{series, make_window(series, boundaries[start_index], boundaries[stop_index]),
                  settings, sink, {}, std::nullopt};

  const auto ids = request.for_phase(phase);
  log(LogLevel::DEBUG, "evaluate_phase " + std::string(phase_spec(phase).suffix) + ": " +
                           std::to_string(ids.size()) + " metrics");
  for (const auto& id : ids) run_metric(ctx, id, request, record);

  if (phase != Phase::kTotal) return {};
  return collect_error_timestamps(ctx);
}

ErrorTimestamps evaluate_phase(const FlightSeries& series, Phase phase,
                               const PhaseBoundaries& boundaries, const MetricRequest& request,
                               ResultRecord& record, DiagnosticSink& sink,
                               const EvaluationSettings& settings) {
  const PhaseSpec& ps = phase_spec(phase);
  return evaluate_phase(series, phase, ps.start_index, ps.stop_index, boundaries, request, record,
                        sink, settings);
}

void evaluate_flight_level(const FlightSeries& series, const PhaseBoundaries& boundaries,
                           const MetricRequest& request, ResultRecord& record,
                           DiagnosticSink& sink, const EvaluationSettings& settings) {
  settings.validate_or_throw();
  if (series.empty()) throw ValidationError("evaluate_flight_level: flight series is empty");

  EvalContext ctx{series, make_window(series, boundaries[0], boundaries[3]), settings, sink, {},
                  std::nullopt};
  for (const auto& id : all_metrics()) {
    if (!is_flight_level_kind(id.kind) || !request.contains(id)) continue;
    run_metric(ctx, id, request, record);
  }
}

ErrorTimestamps evaluate_flight(const FlightSeries& series, const PhaseBoundaries& boundaries,
                                const MetricRequest& request, ResultRecord& record,
                                DiagnosticSink& sink, const EvaluationSettings& settings) {
  ErrorTimestamps total;
  for (const auto& ps : kPhaseSpecs) {
    ErrorTimestamps e = evaluate_phase(series, ps.phase, boundaries, request, record, sink, settings);
    if (ps.phase == Phase::kTotal) total = std::move(e);
  }
  evaluate_flight_level(series, boundaries, request, record, sink, settings);
  return total;
}

} // namespace dockeval
