/*
================================================================================
Fragment 6.2 - DB: Raw Series CSV Implementation
FILE: cpp/dockeval/db/series_csv.cpp
================================================================================
*/

#include "dockeval/db/series_csv.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <utility>
#include <vector>

#include "dockeval/core/errors.hpp"
#include "dockeval/core/text.hpp"

namespace dockeval {

namespace {

std::string csv_escape(const std::string& s) {
  bool needs_quote = false;
  for (char c : s) {
    if (c == ',' || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }
  if (!needs_quote) return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

// Round-trip precision; NaN -> empty.
std::string csv_double(double x) {
  if (std::isnan(x)) return "";
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::setprecision(std::numeric_limits<double>::max_digits10) << x;
  return oss.str();
}

// Splits one CSV record honouring double-quoted fields.
std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string cur;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          cur += '"';
          ++i;
        } else {
          quoted = false;
        }
      } else {
        cur += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      out.push_back(std::move(cur));
      cur.clear();
    } else if (c != '\r') {
      cur += c;
    }
  }
  out.push_back(std::move(cur));
  return out;
}

} // namespace

std::string series_to_csv(const FlightSeries& series) {
  std::ostringstream os;
  const auto& names = series.names();
  for (std::size_t c = 0; c < names.size(); ++c) {
    if (c) os << ',';
    os << csv_escape(names[c]);
  }
  os << '\n';

  std::vector<const std::vector<double>*> cols;
  cols.reserve(names.size());
  for (const auto& n : names) cols.push_back(&series.column(n));

  for (std::size_t r = 0; r < series.rows(); ++r) {
    for (std::size_t c = 0; c < cols.size(); ++c) {
      if (c) os << ',';
      os << csv_double((*cols[c])[r]);
    }
    os << '\n';
  }
  return os.str();
}

FlightSeries series_from_csv(const std::string& text, const std::string& source_name) {
  std::istringstream is(text);
  std::string line;
  if (!std::getline(is, line)) throw ValidationError(source_name + ": empty series file");

  std::vector<std::string> names = split_csv_line(line);
  std::vector<std::vector<double>> columns(names.size());

  std::size_t line_no = 1;
  while (std::getline(is, line)) {
    ++line_no;
    if (trim(line).empty()) continue;
    const auto fields = split_csv_line(line);
    if (fields.size() != names.size()) {
      throw ValidationError(source_name + ":" + std::to_string(line_no) + ": expected " +
                            std::to_string(names.size()) + " fields, got " + std::to_string(fields.size()));
    }
    for (std::size_t c = 0; c < fields.size(); ++c) {
      const std::string tok = trim(fields[c]);
      double v = std::numeric_limits<double>::quiet_NaN();
      if (!tok.empty() && !parse_double(tok, &v)) {
        throw ValidationError(source_name + ":" + std::to_string(line_no) + ": cannot parse '" + tok +
                              "' in column " + names[c]);
      }
      columns[c].push_back(v);
    }
  }
  return FlightSeries::from_columns(std::move(names), std::move(columns));
}

void write_series_csv(const FlightSeries& series, const std::string& file_path) {
  std::error_code ec;
  const std::filesystem::path p(file_path);
  if (p.has_parent_path()) {
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) throw IOError("Cannot create directory " + p.parent_path().string() + ": " + ec.message());
  }

  std::ofstream f(file_path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!f.is_open()) throw IOError("Cannot open series file for writing: " + file_path);
  f << series_to_csv(series);
  f.close();
  if (!f) throw IOError("Failed writing series file: " + file_path);
}

FlightSeries read_series_csv(const std::string& file_path) {
  std::ifstream f(file_path, std::ios::binary);
  if (!f.is_open()) throw IOError("Cannot open series file: " + file_path);
  std::ostringstream ss;
  ss << f.rdbuf();
  return series_from_csv(ss.str(), file_path);
}

} // namespace dockeval
