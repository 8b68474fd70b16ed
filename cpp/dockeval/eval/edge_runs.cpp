#include "dockeval/eval/edge_runs.hpp"

#include <limits>
#include <string>

namespace dockeval {

std::vector<double> shifted(const std::vector<double>& v) {
  std::vector<double> out(v.size(), 0.0);
  for (std::size_t i = 1; i < v.size(); ++i) out[i] = v[i - 1];
  return out;
}

RowMask window_mask(const std::vector<double>& sim_time, double t0, double t1) {
  RowMask m(sim_time.size(), false);
  for (std::size_t i = 0; i < sim_time.size(); ++i) m[i] = sim_time[i] >= t0 && sim_time[i] < t1;
  return m;
}

std::size_t count_true(const RowMask& m) {
  std::size_t n = 0;
  for (bool b : m) n += b ? 1 : 0;
  return n;
}

std::vector<double> masked_times(const std::vector<double>& sim_time, const RowMask& m) {
  std::vector<double> out;
  for (std::size_t i = 0; i < m.size() && i < sim_time.size(); ++i) {
    if (m[i]) out.push_back(sim_time[i]);
  }
  return out;
}

double RunPairs::total_duration() const {
  double sum = 0.0;
  for (std::size_t i = 0; i < starts.size(); ++i) sum += stops[i] - starts[i];
  return sum;
}

double RunPairs::mean_duration() const {
  if (starts.empty()) return 0.0;
  return total_duration() / static_cast<double>(starts.size());
}

RunPairs reconcile_runs(const FlightSeries& series, const RowMask& start, const RowMask& stop,
                        double window_start, double window_stop, const std::string& label,
                        DiagnosticSink& sink) {
  const auto& t = series.sim_time();
  RunPairs out;
  out.starts = masked_times(t, start);
  out.stops = masked_times(t, stop);

  if (out.starts.size() < out.stops.size()) out.starts.insert(out.starts.begin(), window_start);
  if (out.starts.size() > out.stops.size()) out.stops.push_back(window_stop);
  if (out.starts.size() == out.stops.size()) return out;

  std::string msg = label.empty() ? std::string() : label + ": ";
  msg += "Different number of start (" + std::to_string(out.starts.size()) + ")/stop (" +
         std::to_string(out.stops.size()) +
         ") timestamps found. Backup stop timestamps (next sample) are used.";
  sink.emit(DiagnosticKind::kEdgeMismatch, msg);

  out.used_fallback = true;
  out.stops.assign(out.starts.size(), std::numeric_limits<double>::quiet_NaN());
  for (std::size_t i = 0; i < out.starts.size(); ++i) {
    const auto row = series.row_at(out.starts[i]);
    if (row && *row + 1 < t.size()) out.stops[i] = t[*row + 1];
  }
  return out;
}

} // namespace dockeval
