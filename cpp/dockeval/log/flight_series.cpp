#include "dockeval/log/flight_series.hpp"

#include "dockeval/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace dockeval {

FlightSeries FlightSeries::from_columns(std::vector<std::string> names,
                                        std::vector<std::vector<double>> columns) {
  if (names.size() != columns.size()) {
    throw ValidationError("FlightSeries: column name count does not match column count");
  }
  FlightSeries s;
  s.names_ = std::move(names);
  s.columns_ = std::move(columns);
  s.index_names_();
  s.check_invariants_();
  return s;
}

void FlightSeries::index_names_() {
  index_.clear();
  sim_time_.reset();
  for (std::size_t i = 0; i < names_.size(); ++i) {
    if (!index_.emplace(names_[i], i).second) {
      throw ValidationError("FlightSeries: duplicate column '" + names_[i] + "'");
    }
    if (names_[i] == kSimTime) sim_time_ = i;
  }
}

void FlightSeries::check_invariants_() const {
  if (!sim_time_) throw ValidationError("FlightSeries: missing 'SimTime' column");

  const std::size_t n = columns_[*sim_time_].size();
  for (std::size_t c = 0; c < columns_.size(); ++c) {
    if (columns_[c].size() != n) {
      throw ValidationError("FlightSeries: column '" + names_[c] + "' has inconsistent length");
    }
  }

  const auto& t = columns_[*sim_time_];
  for (std::size_t i = 1; i < t.size(); ++i) {
    if (!(t[i] > t[i - 1])) {
      std::ostringstream ss;
      ss << "FlightSeries: SimTime must be strictly increasing (row " << i
         << ": " << t[i - 1] << " -> " << t[i] << ")";
      throw ValidationError(ss.str());
    }
  }
}

bool FlightSeries::has(const std::string& name) const {
  return index_.find(name) != index_.end();
}

const std::vector<double>& FlightSeries::column(const std::string& name) const {
  auto it = index_.find(name);
  if (it == index_.end()) {
    throw ValidationError("FlightSeries: missing column '" + name + "'");
  }
  return columns_[it->second];
}

const std::vector<double>& FlightSeries::sim_time() const {
  if (!sim_time_) throw ValidationError("FlightSeries: missing 'SimTime' column");
  return columns_[*sim_time_];
}

void FlightSeries::add_column(std::string name, std::vector<double> values) {
  if (has(name)) throw ValidationError("FlightSeries: column '" + name + "' already exists");
  if (values.size() != rows()) {
    throw ValidationError("FlightSeries: derived column '" + name + "' has wrong length");
  }
  index_.emplace(name, names_.size());
  names_.push_back(std::move(name));
  columns_.push_back(std::move(values));
}

std::optional<std::size_t> FlightSeries::row_at(double t) const {
  const auto& st = sim_time();
  auto it = std::lower_bound(st.begin(), st.end(), t);
  if (it == st.end() || *it != t) return std::nullopt;
  return static_cast<std::size_t>(std::distance(st.begin(), it));
}

std::size_t FlightSeries::nearest_row(double t) const {
  const auto& st = sim_time();
  if (st.empty()) throw ValidationError("FlightSeries: nearest_row on empty series");

  auto it = std::lower_bound(st.begin(), st.end(), t);
  if (it == st.begin()) return 0;
  if (it == st.end()) return st.size() - 1;

  const std::size_t hi = static_cast<std::size_t>(std::distance(st.begin(), it));
  const std::size_t lo = hi - 1;
  return (std::fabs(st[hi] - t) < std::fabs(t - st[lo])) ? hi : lo;
}

} // namespace dockeval
