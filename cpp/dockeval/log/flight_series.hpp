#pragma once
/*
================================================================================
Fragment 2.1 - Log: FlightSeries (Column-Indexed Time Series)
FILE: cpp/dockeval/log/flight_series.hpp

Purpose:
  One row per logged sample, one column per signal name. Column storage is
  contiguous so windowed scans and shifts stay cheap.

Invariants (checked on construction):
  - "SimTime" column present.
  - SimTime strictly increasing (sorted, no duplicates).
  - Every column has exactly rows() values.

Mutation:
  - add_column() appends a derived column. Existing columns are never
    modified after construction.
================================================================================
*/

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dockeval {

inline constexpr const char* kSimTime = "SimTime";

class FlightSeries {
 public:
  FlightSeries() = default;

  // Build from column-major data (CSV import, tests).
  static FlightSeries from_columns(std::vector<std::string> names,
                                   std::vector<std::vector<double>> columns);

  std::size_t rows() const noexcept { return sim_time_ ? columns_[*sim_time_].size() : 0; }
  std::size_t cols() const noexcept { return names_.size(); }
  bool empty() const noexcept { return rows() == 0; }

  const std::vector<std::string>& names() const noexcept { return names_; }
  bool has(const std::string& name) const;

  // Throws ValidationError naming the column if absent.
  const std::vector<double>& column(const std::string& name) const;
  const std::vector<double>& sim_time() const;

  // Appends a derived column. Throws ValidationError if the name exists or
  // the length differs from rows().
  void add_column(std::string name, std::vector<double> values);

  // Row whose SimTime equals t exactly.
  std::optional<std::size_t> row_at(double t) const;

  // Row whose SimTime is closest to t (ties resolve to the earlier row).
  // Throws ValidationError on an empty series.
  std::size_t nearest_row(double t) const;
  double nearest_sim_time(double t) const { return sim_time()[nearest_row(t)]; }

  // Value of column `name` at row i.
  double at(const std::string& name, std::size_t i) const { return column(name)[i]; }

 private:
  void index_names_();
  void check_invariants_() const;

  std::vector<std::string> names_;
  std::vector<std::vector<double>> columns_;
  std::unordered_map<std::string, std::size_t> index_;
  std::optional<std::size_t> sim_time_;
};

} // namespace dockeval
