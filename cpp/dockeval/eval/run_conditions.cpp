#include "dockeval/eval/run_conditions.hpp"

#include "dockeval/core/errors.hpp"
#include "dockeval/log/structurer.hpp"

#include <cmath>

namespace dockeval {

namespace {

// any(axis=1) semantics: NaN is not a deflection.
bool active(double v) { return v != 0.0 && !std::isnan(v); }

const char* cog_pos_column(Axis a) {
  switch (a) {
    case Axis::kX: return col::kCogPosX;
    case Axis::kY: return col::kCogPosY;
    case Axis::kZ: return col::kCogPosZ;
  }
  return col::kCogPosX;
}

const char* cog_vel_column(Axis a) {
  switch (a) {
    case Axis::kX: return col::kCogVelX;
    case Axis::kY: return col::kCogVelY;
    case Axis::kZ: return col::kCogVelZ;
  }
  return col::kCogVelX;
}

const char* rot_angle_column(Axis a) {
  switch (a) {
    case Axis::kX: return col::kRotAngleX;
    case Axis::kY: return col::kRotAngleY;
    case Axis::kZ: return col::kRotAngleZ;
  }
  return col::kRotAngleX;
}

struct AxisColumns {
  const std::vector<double>& x;
  const std::vector<double>& y;
  const std::vector<double>& z;
};

AxisColumns controller_columns(const FlightSeries& s, Controller c) {
  return {s.column(controller_column(c, Axis::kX)), s.column(controller_column(c, Axis::kY)),
          s.column(controller_column(c, Axis::kZ))};
}

} // namespace

PhaseWindow make_window(const FlightSeries& series, double t0, double t1) {
  PhaseWindow w;
  w.t0 = t0;
  w.t1 = t1;
  w.rows = window_mask(series.sim_time(), t0, t1);
  return w;
}

RunConditions level_run_conditions(const FlightSeries& series, const PhaseWindow& w,
                                   const std::vector<double>& a, const std::vector<double>& b,
                                   const std::vector<double>& b_prev, LevelCompare cmp) {
  const auto& t = series.sim_time();
  const std::vector<double> a_prev = shifted(a);

  auto inside = [cmp](double x, double y) { return cmp == LevelCompare::kAbove ? x > y : x < y; };
  auto outside = [cmp](double x, double y) { return cmp == LevelCompare::kAbove ? x <= y : x >= y; };

  RunConditions rc{RowMask(t.size(), false), RowMask(t.size(), false)};
  for (std::size_t i = 0; i < t.size(); ++i) {
    if (!w.rows[i]) continue;
    rc.start[i] = inside(a[i], b[i]) && (outside(a_prev[i], b_prev[i]) || t[i] == w.t0);
    rc.stop[i] = outside(a[i], b[i]) && (inside(a_prev[i], b_prev[i]) || t[i] == w.t1);
  }
  return rc;
}

RunConditions controller_run_conditions(const FlightSeries& series, const PhaseWindow& w,
                                        Controller c, Axis a) {
  const auto& v = series.column(controller_column(c, a));
  const std::vector<double> vp = shifted(v);

  RunConditions rc{RowMask(v.size(), false), RowMask(v.size(), false)};
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (!w.rows[i]) continue;
    rc.start[i] = v[i] != 0.0 && vp[i] == 0.0;
    rc.stop[i] = v[i] == 0.0 && vp[i] != 0.0;
  }
  return rc;
}

RunConditions combined_run_conditions(const FlightSeries& series, const PhaseWindow& w) {
  const AxisColumns thc = controller_columns(series, Controller::kThc);
  const AxisColumns rhc = controller_columns(series, Controller::kRhc);
  const std::vector<double> tx = shifted(thc.x), ty = shifted(thc.y), tz = shifted(thc.z);
  const std::vector<double> rx = shifted(rhc.x), ry = shifted(rhc.y), rz = shifted(rhc.z);

  const std::size_t n = series.rows();
  RunConditions rc{RowMask(n, false), RowMask(n, false)};
  for (std::size_t i = 0; i < n; ++i) {
    if (!w.rows[i]) continue;
    const bool thc_on = active(thc.x[i]) || active(thc.y[i]) || active(thc.z[i]);
    const bool rhc_on = active(rhc.x[i]) || active(rhc.y[i]) || active(rhc.z[i]);
    const bool thc_zero = thc.x[i] == 0.0 && thc.y[i] == 0.0 && thc.z[i] == 0.0;
    const bool rhc_zero = rhc.x[i] == 0.0 && rhc.y[i] == 0.0 && rhc.z[i] == 0.0;

    const bool thc_was_on = active(tx[i]) || active(ty[i]) || active(tz[i]);
    const bool rhc_was_on = active(rx[i]) || active(ry[i]) || active(rz[i]);
    const bool thc_was_zero = tx[i] == 0.0 && ty[i] == 0.0 && tz[i] == 0.0;
    const bool rhc_was_zero = rx[i] == 0.0 && ry[i] == 0.0 && rz[i] == 0.0;

    rc.start[i] = thc_on && rhc_on && (thc_was_zero || rhc_was_zero);
    rc.stop[i] = (thc_zero || rhc_zero) && thc_was_on && rhc_was_on;
  }
  return rc;
}

RunConditions combined_yz_run_conditions(const FlightSeries& series, const PhaseWindow& w,
                                         Controller c) {
  const AxisColumns v = controller_columns(series, c);
  const std::vector<double> yp = shifted(v.y), zp = shifted(v.z);

  const std::size_t n = series.rows();
  RunConditions rc{RowMask(n, false), RowMask(n, false)};
  for (std::size_t i = 0; i < n; ++i) {
    if (!w.rows[i]) continue;
    rc.start[i] = (v.y[i] != 0.0 && v.z[i] != 0.0) && (yp[i] == 0.0 || zp[i] == 0.0);
    rc.stop[i] = (v.y[i] == 0.0 || v.z[i] == 0.0) && (yp[i] != 0.0 && zp[i] != 0.0);
  }
  return rc;
}

RunConditions combined_xyz_run_conditions(const FlightSeries& series, const PhaseWindow& w,
                                          Controller c) {
  const AxisColumns v = controller_columns(series, c);
  const std::vector<double> xp = shifted(v.x), yp = shifted(v.y), zp = shifted(v.z);

  const std::size_t n = series.rows();
  RunConditions rc{RowMask(n, false), RowMask(n, false)};
  for (std::size_t i = 0; i < n; ++i) {
    if (!w.rows[i]) continue;
    const bool yz_on = active(v.y[i]) || active(v.z[i]);
    const bool yz_zero = v.y[i] == 0.0 && v.z[i] == 0.0;
    const bool yz_was_on = active(yp[i]) || active(zp[i]);
    const bool yz_was_zero = yp[i] == 0.0 && zp[i] == 0.0;

    rc.start[i] = yz_on && v.x[i] != 0.0 && (xp[i] == 0.0 || yz_was_zero);
    rc.stop[i] = (v.x[i] == 0.0 || yz_zero) && yz_was_on && xp[i] != 0.0;
  }
  return rc;
}

RowMask thc_x_error_rows(const FlightSeries& series, const PhaseWindow& w) {
  const auto& vx = series.column(col::kCogVelX);
  const auto& ideal = series.column(col::kIdealApproachVel);
  const auto& thc = series.column(col::kThcX);
  const std::vector<double> vx_p = shifted(vx), ideal_p = shifted(ideal), thc_p = shifted(thc);

  RowMask flagged(vx.size(), false);
  for (std::size_t i = 0; i < vx.size(); ++i) {
    if (!w.rows[i]) continue;
    const bool faster_than_ideal = vx[i] < ideal[i] && thc[i] < 0.0;
    const bool fresh_push = faster_than_ideal && thc_p[i] == 0.0;
    const bool crossed_ideal = faster_than_ideal && vx_p[i] >= ideal_p[i];
    const bool outward_push = vx[i] > 0.0 && thc[i] > 0.0 && thc_p[i] == 0.0;
    flagged[i] = fresh_push || crossed_ideal || outward_push;
  }
  return flagged;
}

RunConditions steering_error_conditions(const FlightSeries& series, const PhaseWindow& w,
                                        Controller c, Axis a) {
  if (c == Controller::kThc && a == Axis::kX) {
    throw ValidationError("steering_error_conditions: THC.x uses thc_x_error_rows()");
  }

  const auto& in = series.column(controller_column(c, a));
  const auto& dev = series.column(c == Controller::kThc ? cog_pos_column(a) : rot_angle_column(a));
  const std::vector<double> in_p = shifted(in), dev_p = shifted(dev);

  const std::size_t n = series.rows();
  RunConditions rc{RowMask(n, false), RowMask(n, false)};

  if (c == Controller::kRhc) {
    for (std::size_t i = 0; i < n; ++i) {
      if (!w.rows[i]) continue;
      rc.start[i] = (dev[i] == 0.0 && in[i] != 0.0) ||
                    (dev[i] > 0.0 && in[i] > 0.0 && (in_p[i] == 0.0 || dev_p[i] <= 0.0)) ||
                    (dev[i] < 0.0 && in[i] < 0.0 && (in_p[i] == 0.0 || dev_p[i] >= 0.0));
      rc.stop[i] = (in_p[i] != 0.0 && dev_p[i] == 0.0) ||
                   (dev[i] > 0.0 && in[i] <= 0.0 && in_p[i] > 0.0 && dev_p[i] > 0.0) ||
                   (dev[i] < 0.0 && in[i] >= 0.0 && in_p[i] < 0.0 && dev_p[i] < 0.0);
    }
    return rc;
  }

  const auto& vel = series.column(cog_vel_column(a));
  const std::vector<double> vel_p = shifted(vel);
  for (std::size_t i = 0; i < n; ++i) {
    if (!w.rows[i]) continue;
    rc.start[i] =
        (dev[i] == 0.0 && in[i] != 0.0) ||
        (dev[i] > 0.0 && in[i] > 0.0 && vel[i] >= 0.0 &&
         (in_p[i] == 0.0 || dev_p[i] <= 0.0 || vel_p[i] < 0.0)) ||
        (dev[i] < 0.0 && in[i] < 0.0 && vel[i] <= 0.0 &&
         (in_p[i] == 0.0 || dev_p[i] >= 0.0 || vel_p[i] > 0.0));
    rc.stop[i] =
        (dev[i] != 0.0 && in_p[i] != 0.0 && dev_p[i] == 0.0) ||
        (dev[i] > 0.0 && in[i] <= 0.0 && vel[i] >= 0.0 && in_p[i] > 0.0 && dev_p[i] > 0.0 &&
         vel_p[i] >= 0.0) ||
        (dev[i] < 0.0 && in[i] >= 0.0 && vel[i] <= 0.0 && in_p[i] < 0.0 && dev_p[i] < 0.0 &&
         vel_p[i] <= 0.0);
  }
  return rc;
}

std::vector<std::string> independent_axes(Controller c, Axis a) {
  std::vector<std::string> out;
  if (c == Controller::kThc) {
    // THC.x is the closing axis; lateral errors only look at each other.
    for (Axis o : {Axis::kY, Axis::kZ}) {
      if (o != a) out.push_back(controller_column(c, o));
    }
    return out;
  }
  for (Axis o : {Axis::kX, Axis::kY, Axis::kZ}) {
    if (o != a) out.push_back(controller_column(c, o));
  }
  return out;
}

std::size_t count_independent_errors(const FlightSeries& series, const RowMask& flagged,
                                     Controller c, Axis a) {
  std::vector<const std::vector<double>*> others;
  for (const auto& name : independent_axes(c, a)) others.push_back(&series.column(name));

  std::size_t n = 0;
  for (std::size_t i = 0; i < flagged.size(); ++i) {
    if (!flagged[i]) continue;
    for (const auto* o : others) {
      if (active((*o)[i])) {
        ++n;
        break;
      }
    }
  }
  return n;
}

} // namespace dockeval
