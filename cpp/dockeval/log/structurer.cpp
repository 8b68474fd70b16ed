#include "dockeval/log/structurer.hpp"

#include "dockeval/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <string>
#include <vector>

namespace dockeval {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double norm3(const std::array<double, 3>& v) {
  return std::sqrt(v[0] * v[0] + v[1] * v[1] + v[2] * v[2]);
}

// Label for a raw header name after the rename + frame swap.
std::string remapped_name(const std::string& raw) {
  if (raw == "Rot. Rate.Z [deg/s]") return col::kRotRateZ;
  if (raw == col::kThcX) return col::kThcZ;
  if (raw == col::kThcZ) return col::kThcX;
  if (raw == col::kRhcX) return col::kRhcZ;
  if (raw == col::kRhcZ) return col::kRhcX;
  return raw;
}

} // namespace

double angle_to_port_deg(const std::array<double, 3>& front, const std::array<double, 3>& back) {
  const std::array<double, 3> dir{front[0] - back[0], front[1] - back[1], front[2] - back[2]};
  const std::array<double, 3> to_origin{-front[0], -front[1], -front[2]};

  const double nd = norm3(dir);
  const double no = norm3(to_origin);
  if (nd == 0.0 || no == 0.0) return kNaN;

  double dot = (dir[0] * to_origin[0] + dir[1] * to_origin[1] + dir[2] * to_origin[2]) / (nd * no);
  dot = std::clamp(dot, -1.0, 1.0);
  return std::acos(dot) * (180.0 / std::numbers::pi);
}

FlightSeries structure_session(const ParsedSession& parsed, const StructureSettings& settings) {
  settings.validate_or_throw();

  std::vector<std::string> names;
  names.reserve(parsed.columns.size());
  for (const auto& c : parsed.columns) names.push_back(remapped_name(c));

  std::vector<std::vector<double>> columns(names.size());
  for (auto& c : columns) c.reserve(parsed.rows.size());
  for (std::size_t r = 0; r < parsed.rows.size(); ++r) {
    if (parsed.rows[r].size() != names.size()) {
      throw ValidationError("structure_session: row " + std::to_string(r) + " width mismatch");
    }
    for (std::size_t c = 0; c < names.size(); ++c) columns[c].push_back(parsed.rows[r][c]);
  }

  // Station frame: the swapped x/z translation axes point the other way.
  for (std::size_t c = 0; c < names.size(); ++c) {
    if (names[c] == col::kThcX || names[c] == col::kThcZ) {
      for (double& v : columns[c]) v = -v;
    }
  }

  FlightSeries s = FlightSeries::from_columns(std::move(names), std::move(columns));
  const std::size_t n = s.rows();

  const auto& pos_x = s.column(col::kCogPosX);
  const auto& pos_y = s.column(col::kCogPosY);
  const auto& pos_z = s.column(col::kCogPosZ);
  const auto& vel_y = s.column(col::kCogVelY);
  const auto& vel_z = s.column(col::kCogVelZ);
  const auto& port_x = s.column(col::kPortPosX);
  const auto& port_y = s.column(col::kPortPosY);
  const auto& port_z = s.column(col::kPortPosZ);

  // Raw THC/RHC columns must exist for the phase detector and evaluation.
  for (const char* a : col::kThcAxes) (void)s.column(a);
  for (const char* a : col::kRhcAxes) (void)s.column(a);

  std::vector<double> lat_off(n), lat_vel(n), ideal(n), angle(n), cone(n), max_ang(n), max_vel(n);
  const double cone_tan = std::tan(settings.approach_cone_half_angle_deg * std::numbers::pi / 180.0);
  const double off = settings.periscope_offset_m;

  for (std::size_t i = 0; i < n; ++i) {
    lat_off[i] = std::sqrt(pos_y[i] * pos_y[i] + pos_z[i] * pos_z[i]);
    lat_vel[i] = std::sqrt(vel_y[i] * vel_y[i] + vel_z[i] * vel_z[i]);

    ideal[i] = (pos_x[i] < settings.final_approach_distance_m)
                   ? settings.final_approach_ideal_velocity
                   : -pos_x[i] / settings.ideal_velocity_divisor;

    angle[i] = angle_to_port_deg({port_x[i] + off, port_y[i], port_z[i]},
                                 {pos_x[i] + off, pos_y[i], pos_z[i]});

    cone[i] = pos_x[i] * cone_tan;

    const bool final_limits = port_x[i] > 0.0 && pos_x[i] < settings.final_approach_distance_m;
    max_ang[i] = final_limits ? settings.max_rot_angle_deg : kNaN;
    max_vel[i] = final_limits ? settings.max_rot_velocity_deg_s : kNaN;
  }

  s.add_column(col::kLateralOffset, std::move(lat_off));
  s.add_column(col::kLateralVelocity, std::move(lat_vel));
  s.add_column(col::kIdealApproachVel, std::move(ideal));
  s.add_column(col::kAngleToPort, std::move(angle));
  s.add_column(col::kApproachCone, std::move(cone));
  s.add_column(col::kMaxRotAngle, std::move(max_ang));
  s.add_column(col::kMaxRotVelocity, std::move(max_vel));
  return s;
}

} // namespace dockeval
