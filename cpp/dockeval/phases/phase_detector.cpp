#include "dockeval/phases/phase_detector.hpp"

#include "dockeval/core/errors.hpp"
#include "dockeval/log/structurer.hpp"

#include <charconv>
#include <cmath>
#include <optional>
#include <sstream>

namespace dockeval {

namespace {

std::optional<std::size_t> first_row_with_controller_input(const FlightSeries& s) {
  std::array<const std::vector<double>*, 6> axes{
      &s.column(col::kThcX), &s.column(col::kThcY), &s.column(col::kThcZ),
      &s.column(col::kRhcX), &s.column(col::kRhcY), &s.column(col::kRhcZ)};

  for (std::size_t i = 0; i < s.rows(); ++i) {
    for (const auto* a : axes) {
      // Missing samples (NaN) are not input.
      if ((*a)[i] != 0.0 && !std::isnan((*a)[i])) return i;
    }
  }
  return std::nullopt;
}

std::optional<std::size_t> first_approach_row(const FlightSeries& s, double after_t,
                                              const DetectionSettings& cfg) {
  const auto& t = s.sim_time();
  const auto& vx = s.column(col::kCogVelX);
  // The last row has no successor and never matches.
  for (std::size_t i = 0; i + 1 < s.rows(); ++i) {
    if (vx[i] <= cfg.approach_start_velocity && vx[i] > vx[i + 1] && t[i] > after_t) return i;
  }
  return std::nullopt;
}

std::optional<std::size_t> first_row_below(const std::vector<double>& v, double limit) {
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (v[i] < limit) return i;
  }
  return std::nullopt;
}

std::optional<std::size_t> first_row_equal(const std::vector<double>& v, double value) {
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (v[i] == value) return i;
  }
  return std::nullopt;
}

std::size_t interpolated_row(std::size_t start, std::size_t stop, double fraction) {
  const double span = static_cast<double>(stop) - static_cast<double>(start);
  // Truncation toward zero, like an integer cast of the scaled span.
  const long long step = static_cast<long long>(span * fraction);
  return static_cast<std::size_t>(static_cast<long long>(start) + step);
}

std::string backup_notice(const char* what, double t) {
  return std::string(what) + ", BACKUP value t=" + format_sim_time(t) + " is used.";
}

} // namespace

std::string format_sim_time(double t) {
  if (!std::isfinite(t)) {
    if (std::isnan(t)) return "nan";
    return t > 0 ? "inf" : "-inf";
  }
  char buf[64];
  auto res = std::to_chars(buf, buf + sizeof(buf), t);
  std::string s(buf, res.ptr);
  if (s.find_first_of(".eE") == std::string::npos) s += ".0";
  return s;
}

PhaseDetection detect_phases(const FlightSeries& series, const DetectionSettings& settings,
                             DiagnosticSink& sink) {
  settings.validate_or_throw();
  if (series.empty()) throw ValidationError("detect_phases: flight series is empty");

  const auto& t = series.sim_time();
  PhaseDetection out;
  std::array<std::optional<std::size_t>, 4> rows;

  auto notice = [&](std::size_t slot, const char* what) {
    out.backup[slot] = true;
    out.notices.push_back(backup_notice(what, out.boundaries[slot]));
    sink.emit(DiagnosticKind::kBackupBoundary, out.notices.back());
  };

  // [0] alignment start
  rows[0] = first_row_with_controller_input(series);
  if (!rows[0]) {
    rows[0] = 0;
    out.boundaries[0] = t[0];
    notice(0, "No Controller Input, check Log-File integrity");
  } else {
    out.boundaries[0] = t[*rows[0]];
  }

  // [1] approach start, [2] final approach start
  rows[1] = first_approach_row(series, out.boundaries[0], settings);
  rows[2] = first_row_below(series.column(col::kCogPosX), settings.final_approach_distance_m);
  if (rows[1]) out.boundaries[1] = t[*rows[1]];
  if (rows[2]) out.boundaries[2] = t[*rows[2]];

  // [3] docking
  rows[3] = first_row_equal(series.column(col::kPortPosX), 0.0);
  if (!rows[3]) {
    rows[3] = series.rows() - 1;
    out.boundaries[3] = t.back();
    notice(3, "Vessel not docked");
  } else {
    out.boundaries[3] = t[*rows[3]];
  }

  // Backup pass: at most one gap exists between the always-resolved ends.
  if (!rows[1] && !rows[2]) {
    const std::size_t a = *rows[0];
    const std::size_t b = *rows[3];
    out.boundaries[1] = t[interpolated_row(a, b, 1.0 / 3.0)];
    out.boundaries[2] = t[interpolated_row(a, b, 2.0 / 3.0)];
    notice(1, "End of alignment phase could not be calculated");
    notice(2, "No Final Approach Phase");
  } else if (!rows[1]) {
    out.boundaries[1] = t[interpolated_row(*rows[0], *rows[2], 0.5)];
    notice(1, "End of alignment phase could not be calculated");
  } else if (!rows[2]) {
    out.boundaries[2] = t[interpolated_row(*rows[1], *rows[3], 0.5)];
    notice(2, "No Final Approach Phase");
  }

  return out;
}

double snap_to_sim_time(const FlightSeries& series, double t) {
  return series.nearest_sim_time(t);
}

PhaseBoundaries snap_boundaries(const FlightSeries& series, const PhaseBoundaries& b) {
  PhaseBoundaries out{};
  for (std::size_t i = 0; i < b.size(); ++i) out[i] = snap_to_sim_time(series, b[i]);
  return out;
}

void validate_ascending(const PhaseBoundaries& b) {
  bool ok = true;
  for (std::size_t i = 1; i < b.size(); ++i) {
    if (!(b[i - 1] <= b[i])) ok = false;
  }
  if (ok) return;

  std::ostringstream ss;
  ss << "Phase Timestamp have to be in ascending order (from smallest to largest) but are actually not: [";
  for (std::size_t i = 0; i < b.size(); ++i) {
    if (i) ss << ", ";
    ss << format_sim_time(b[i]);
  }
  ss << "]";
  throw ValidationError(ss.str());
}

} // namespace dockeval
