#pragma once
/*
================================================================================
Fragment 6.1 - DB: Historical Database (Per-Scenario NDJSON Store)
FILE: cpp/dockeval/db/historical_database.hpp

Purpose:
  - One file per scenario, one flat JSON record per line, one record per
    historical flight. Used read-only by grading as the reference population.
  - Append contract (add_flight): newest record per Flight ID wins; columns
    that are null in every record are dropped; the structured series is
    exported next to it for later rebuilds.

Files:
  <database_dir>/<Scenario>_flight_data.json   (written)
  <database_dir>/<Scenario>.json               (accepted on read)
  <series_dir>/<Scenario>/<Flight ID>.csv      (raw series export)

Serialization:
  Every written line carries the full column set in first-seen order, with
  null where a record has no value.
================================================================================
*/

#include <cstddef>
#include <string>
#include <vector>

#include "dockeval/core/settings.hpp"
#include "dockeval/eval/result_record.hpp"
#include "dockeval/eval/schema.hpp"
#include "dockeval/grading/distribution.hpp"
#include "dockeval/log/flight_series.hpp"

namespace dockeval {

class HistoricalDatabase {
 public:
  HistoricalDatabase() = default;

  // Parses NDJSON text. Blank lines are skipped. Throws ValidationError with
  // the source name and line number for malformed lines.
  static HistoricalDatabase parse(const std::string& text, const std::string& source_name = "<memory>");

  // Throws IOError when the file cannot be read.
  static HistoricalDatabase load(const std::string& path);

  std::string serialize() const;

  // Writes via a temporary file renamed over `path`. Throws IOError.
  void save(const std::string& path) const;

  // Replaces a record with the same Flight ID (the new one moves to the end)
  // or appends. Throws ValidationError when the record has no Flight ID.
  void upsert(ResultRecord record);

  // Drops columns whose value is null (or absent) in every record.
  void drop_null_columns();

  // Keeps exactly the schema columns, in schema order; missing ones are null.
  void align_to_schema(const Schema& schema);

  // Union of all record columns in first-seen order.
  std::vector<std::string> columns() const;
  bool has_column(const std::string& name) const;

  // Numeric reference column. Null and non-numeric entries are dropped and
  // reported through has_nulls.
  ReferenceColumn column(const std::string& name) const;

  const ResultRecord* find(const std::string& flight_id) const;

  const std::vector<ResultRecord>& records() const noexcept { return records_; }
  std::vector<ResultRecord>& records() noexcept { return records_; }
  std::size_t size() const noexcept { return records_.size(); }
  bool empty() const noexcept { return records_.empty(); }

 private:
  std::vector<ResultRecord> records_;
};

// <database_dir>/<Scenario>_flight_data.json
std::string database_file_path(const StorageSettings& storage, const std::string& scenario);

// Existing database file for a scenario (the _flight_data name first, then
// <Scenario>.json). Throws ReferenceDatabaseMissing when neither exists.
std::string resolve_database_path(const StorageSettings& storage, const std::string& scenario);

// <series_dir>/<Scenario>/<Flight ID>.csv
std::string series_file_path(const StorageSettings& storage, const std::string& scenario,
                             const std::string& flight_id);

struct AddFlightResult {
  std::string database_path;
  std::string series_path;
  std::size_t record_count = 0;
  bool replaced = false;
};

// Appends an evaluated flight to its scenario database (without Logger
// Version, Session ID and Pilot) and exports its series.
// Throws ValidationError when Scenario or Flight ID is missing.
AddFlightResult add_flight(const ResultRecord& record, const FlightSeries& series,
                           const StorageSettings& storage);

} // namespace dockeval
