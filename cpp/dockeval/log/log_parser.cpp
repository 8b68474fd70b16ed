#include "dockeval/log/log_parser.hpp"

#include "dockeval/core/errors.hpp"
#include "dockeval/core/hashing.hpp"
#include "dockeval/core/logging.hpp"
#include "dockeval/core/text.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace dockeval {

namespace {

constexpr const char* kMatrixSuffixes[] = {"m12", "m13", "m21", "m22", "m23", "m31", "m32", "m33"};

// Text between the first and second ':' of a metadata line, trimmed.
std::string metadata_value(const std::string& line) {
  const auto parts = split(line, ':');
  if (parts.size() < 2) return std::string();
  return trim(parts[1]);
}

int parse_day_of_month(const std::string& value, const std::string& file, std::size_t line_no) {
  // "YYYY-MM-DD hh" -> "YYYY-MM-DD" -> "DD"
  const std::string date = split(value, ' ').front();
  const auto ymd = split(date, '-');
  if (ymd.size() < 3) {
    throw LogParseError(file, line_no, "TIME metadata is not a YYYY-MM-DD date: '" + value + "'");
  }
  double day = 0.0;
  const std::string dd = trim(ymd[2]);
  if (!parse_double(dd, &day) || dd.find('.') != std::string::npos || day < 0.0 || day > 31.0) {
    throw LogParseError(file, line_no, "TIME metadata has an invalid day of month: '" + ymd[2] + "'");
  }
  return static_cast<int>(day);
}

void parse_metadata_line(const std::string& raw, SessionMetadata& md,
                         const std::string& file, std::size_t line_no) {
  std::string line = raw;
  const auto first = line.find_first_not_of('#');
  line = trim(first == std::string::npos ? std::string() : line.substr(first));

  if (starts_with(line, "Logger Version:")) md.logger_version = metadata_value(line);
  else if (starts_with(line, "SESSION_ID:")) md.session_id = metadata_value(line);
  else if (starts_with(line, "PILOT:")) md.pilot = metadata_value(line);
  else if (starts_with(line, "TIME:")) md.date_day = parse_day_of_month(metadata_value(line), file, line_no);
  else if (starts_with(line, "SCENARIO:")) md.scenario = metadata_value(line);
}

std::vector<double> parse_data_line(const std::string& line, std::size_t width,
                                    const std::string& file, std::size_t line_no) {
  const auto tokens = split_trim_nonempty(line, ';');
  if (tokens.size() != width) {
    std::ostringstream ss;
    ss << "data row has " << tokens.size() << " fields but the header declares " << width;
    throw LogParseError(file, line_no, ss.str());
  }

  std::vector<double> row;
  row.reserve(tokens.size());
  for (const auto& t : tokens) {
    double v = 0.0;
    if (!parse_double(t, &v)) {
      throw LogParseError(file, line_no, "value '" + t + "' is not a number");
    }
    row.push_back(v);
  }
  return row;
}

bool ends_with_sentinel(const std::string& text) {
  std::istringstream in(text);
  std::string line;
  std::string last;
  while (std::getline(in, line)) {
    std::string t = trim(line);
    if (!t.empty()) last = std::move(t);
  }
  return last == kLogStoppedSentinel;
}

} // namespace

std::vector<std::string> parse_header_line(const std::string& line) {
  std::string h = line;
  replace_all(h, "MFDRightMyROT.m11", "MFDRight; MyROT.m11");
  for (const char* m : kMatrixSuffixes) {
    const std::string unlabeled = std::string("; ") + m;
    replace_first(h, unlabeled, std::string("; MyROT.") + m);
    replace_first(h, unlabeled, std::string("; TgtRot.") + m);
  }
  return split_trim_nonempty(h, ';');
}

ParsedSession parse_session_segments(const std::vector<LogSegment>& segments) {
  if (segments.empty()) throw ValidationError("parse_session_segments: no log segments");

  if (!ends_with_sentinel(segments.back().text)) {
    throw LogParseError(segments.back().name, 0,
                        "Last Log of the session is missing. Please select it and try again.");
  }

  ParsedSession out;
  out.flight_id = sha256_hex(std::filesystem::path(segments.front().name).filename().string());

  bool have_header = false;
  for (const auto& seg : segments) {
    std::istringstream in(seg.text);
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
      ++line_no;
      if (starts_with(line, "#")) {
        parse_metadata_line(line, out.metadata, seg.name, line_no);
        continue;
      }
      if (starts_with(line, "SimTime")) {
        auto cols = parse_header_line(line);
        if (have_header && cols != out.columns) {
          throw LogParseError(seg.name, line_no, "header differs from the session's first header");
        }
        out.columns = std::move(cols);
        have_header = true;
        continue;
      }
      if (trim(line).empty()) continue;

      if (!have_header) {
        throw LogParseError(seg.name, line_no, "data row before the SimTime header");
      }
      out.rows.push_back(parse_data_line(line, out.columns.size(), seg.name, line_no));
    }
  }

  if (!have_header) {
    throw LogParseError(segments.front().name, 0, "no SimTime header found in session");
  }

  log(LogLevel::DEBUG, "parsed session " + out.flight_id + ": " + std::to_string(out.rows.size()) +
                           " rows, " + std::to_string(out.columns.size()) + " columns");
  return out;
}

ParsedSession parse_session_files(const std::vector<std::string>& paths) {
  std::vector<LogSegment> segments;
  segments.reserve(paths.size());

  for (const auto& p : paths) {
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs.is_open()) throw IOError("Cannot open flight log: " + p);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    if (ifs.bad()) throw IOError("Failed reading flight log: " + p);
    segments.push_back(LogSegment{p, ss.str()});
  }
  return parse_session_segments(segments);
}

} // namespace dockeval
