#pragma once
/*
================================================================================
Fragment 6.2 - DB: Raw Series CSV (Per-Flight Export)
FILE: cpp/dockeval/db/series_csv.hpp

Purpose:
  - Dump a structured FlightSeries (raw and derived columns, all rows) when a
    flight is added to the database.
  - Read it back when the database is rebuilt.

Format:
  - Header row with the column names in series order.
  - One row per sample, ',' delimited.
  - Doubles printed with max_digits10 so a read/write cycle is exact.
  - NaN exports as an empty field and reads back as NaN.
  - Names containing ',' or '"' are quoted; quotes double.
================================================================================
*/

#include <string>

#include "dockeval/log/flight_series.hpp"

namespace dockeval {

// Creates parent directories. Throws IOError on failure.
void write_series_csv(const FlightSeries& series, const std::string& file_path);

// Throws IOError (unreadable) or ValidationError (malformed content).
FlightSeries read_series_csv(const std::string& file_path);

// In-memory variants (tests).
std::string series_to_csv(const FlightSeries& series);
FlightSeries series_from_csv(const std::string& text, const std::string& source_name = "<memory>");

} // namespace dockeval
