#pragma once
/*
================================================================================
Fragment 2.3 - Log: Session Log Parser
FILE: cpp/dockeval/log/log_parser.hpp

Purpose:
  Turn the raw lines of one logged session into a header + float rows table
  and the identity metadata of the flight.

Log format:
  - "# ..." lines carry metadata. Recognized keys:
      Logger Version:, SESSION_ID:, PILOT:, TIME:, SCENARIO:
    The value is the text between the first and second ':' (trimmed).
    TIME: keeps only the day of month of a "YYYY-MM-DD hh:mm:ss" stamp.
  - "SimTime;..." is the header line. Tokens are split on ';', trimmed and
    empty tokens dropped, after the header fixups below.
  - Every other non-blank line is a data row of ';'-separated floats.
  - The last file must end with "# Log stopped.".

Header fixups:
  - "MFDRightMyROT.m11" -> "MFDRight; MyROT.m11" (logger concatenation bug).
  - For m12..m33: first "; mNN" -> "; MyROT.mNN", next -> "; TgtRot.mNN".

Hardening:
  - Row width must equal header width; otherwise LogParseError(file, line).
  - Tokens that are not floats raise LogParseError(file, line).
  - A later header must match the first one.
================================================================================
*/

#include <optional>
#include <string>
#include <vector>

namespace dockeval {

inline constexpr const char* kLogStoppedSentinel = "# Log stopped.";

struct SessionMetadata {
  std::string logger_version;
  std::string session_id;
  std::string pilot;
  std::string scenario;
  std::optional<int> date_day;  // day of month from TIME:
};

struct ParsedSession {
  std::vector<std::string> columns;
  std::vector<std::vector<double>> rows;
  SessionMetadata metadata;

  // SHA-256 hex of the first file's basename.
  std::string flight_id;
};

// One file of a session held in memory. `name` is used for the Flight ID
// (basename) and in error messages.
struct LogSegment {
  std::string name;
  std::string text;
};

// Applies both header fixups and tokenizes the header line.
std::vector<std::string> parse_header_line(const std::string& line);

// Parses an in-memory session. Segments must already be in session order.
ParsedSession parse_session_segments(const std::vector<LogSegment>& segments);

// Reads the files (already validated and sorted) and parses them.
// Throws IOError when a file cannot be read.
ParsedSession parse_session_files(const std::vector<std::string>& paths);

} // namespace dockeval
