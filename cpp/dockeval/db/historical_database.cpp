/*
================================================================================
Fragment 6.1 - DB: Historical Database Implementation
FILE: cpp/dockeval/db/historical_database.cpp
================================================================================
*/

#include "dockeval/db/historical_database.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utility>

#include "dockeval/core/errors.hpp"
#include "dockeval/core/json.hpp"
#include "dockeval/core/logging.hpp"
#include "dockeval/core/text.hpp"
#include "dockeval/db/series_csv.hpp"

namespace dockeval {

namespace fs = std::filesystem;

HistoricalDatabase HistoricalDatabase::parse(const std::string& text, const std::string& source_name) {
  HistoricalDatabase db;
  std::istringstream is(text);
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(is, line)) {
    ++line_no;
    if (trim(line).empty()) continue;
    JsonValue v;
    JsonParseError err;
    if (!parse_json(line, &v, &err)) {
      throw ValidationError(source_name + ":" + std::to_string(line_no) + ": " + err.message +
                            " (col " + std::to_string(err.col) + ")");
    }
    if (!v.is_object()) {
      throw ValidationError(source_name + ":" + std::to_string(line_no) + ": record is not a JSON object");
    }
    // Duplicates inside one file resolve like an upsert: last write wins.
    ResultRecord r = ResultRecord::from_json(v);
    if (r.text(field::kFlightId).empty()) {
      db.records_.push_back(std::move(r));
    } else {
      db.upsert(std::move(r));
    }
  }
  return db;
}

HistoricalDatabase HistoricalDatabase::load(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) throw IOError("Cannot open database file: " + path);
  std::ostringstream ss;
  ss << f.rdbuf();
  return parse(ss.str(), path);
}

std::string HistoricalDatabase::serialize() const {
  const std::vector<std::string> cols = columns();
  std::string out;
  for (const auto& r : records_) {
    JsonValue obj = JsonValue::make_object();
    for (const auto& c : cols) {
      const FieldValue* v = r.get(c);
      if (!v || v->is_null()) {
        obj.set(c, JsonValue::make_null());
      } else if (v->is_number()) {
        obj.set(c, JsonValue::make_number(v->number, v->integral));
      } else {
        obj.set(c, JsonValue::make_string(v->text));
      }
    }
    out += to_json(obj);
    out += '\n';
  }
  return out;
}

void HistoricalDatabase::save(const std::string& path) const {
  const fs::path p(path);
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
    if (ec) throw IOError("Cannot create directory " + p.parent_path().string() + ": " + ec.message());
  }

  const std::string tmp = path + ".tmp";
  {
    std::ofstream f(tmp, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!f.is_open()) throw IOError("Cannot open database file for writing: " + tmp);
    f << serialize();
    f.close();
    if (!f) throw IOError("Failed writing database file: " + tmp);
  }
  fs::rename(tmp, p, ec);
  if (ec) throw IOError("Cannot replace database file " + path + ": " + ec.message());
}

void HistoricalDatabase::upsert(ResultRecord record) {
  const std::string id = record.text(field::kFlightId);
  if (id.empty()) throw ValidationError("HistoricalDatabase: record has no Flight ID");
  for (auto it = records_.begin(); it != records_.end(); ++it) {
    if (it->text(field::kFlightId) == id) {
      records_.erase(it);
      break;
    }
  }
  records_.push_back(std::move(record));
}

void HistoricalDatabase::drop_null_columns() {
  for (const auto& c : columns()) {
    bool any = false;
    for (const auto& r : records_) {
      const FieldValue* v = r.get(c);
      if (v && !v->is_null()) {
        any = true;
        break;
      }
    }
    if (any) continue;
    for (auto& r : records_) r.erase(c);
  }
}

void HistoricalDatabase::align_to_schema(const Schema& schema) {
  for (auto& r : records_) {
    ResultRecord aligned = ResultRecord::from_schema(schema);
    for (const auto& [name, v] : r.fields()) {
      if (schema.has(name)) aligned.set(name, v);
    }
    r = std::move(aligned);
  }
}

std::vector<std::string> HistoricalDatabase::columns() const {
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (const auto& r : records_) {
    for (const auto& [name, v] : r.fields()) {
      if (seen.insert(name).second) out.push_back(name);
    }
  }
  return out;
}

bool HistoricalDatabase::has_column(const std::string& name) const {
  for (const auto& r : records_) {
    if (r.has(name)) return true;
  }
  return false;
}

ReferenceColumn HistoricalDatabase::column(const std::string& name) const {
  ReferenceColumn col;
  col.name = name;
  col.values.reserve(records_.size());
  for (const auto& r : records_) {
    const FieldValue* v = r.get(name);
    if (!v || !v->is_number() || std::isnan(v->number)) {
      col.has_nulls = true;
      continue;
    }
    if (!v->integral) col.integral = false;
    col.values.push_back(v->number);
  }
  return col;
}

const ResultRecord* HistoricalDatabase::find(const std::string& flight_id) const {
  for (const auto& r : records_) {
    if (r.text(field::kFlightId) == flight_id) return &r;
  }
  return nullptr;
}

// ----------------------------- Paths -----------------------------------------
std::string database_file_path(const StorageSettings& storage, const std::string& scenario) {
  return (fs::path(storage.database_dir) / (scenario + "_flight_data.json")).string();
}

std::string resolve_database_path(const StorageSettings& storage, const std::string& scenario) {
  const std::string primary = database_file_path(storage, scenario);
  std::error_code ec;
  if (fs::is_regular_file(primary, ec)) return primary;
  const std::string fallback = (fs::path(storage.database_dir) / (scenario + ".json")).string();
  if (fs::is_regular_file(fallback, ec)) return fallback;
  throw ReferenceDatabaseMissing(scenario, "Database file not found: " + primary);
}

std::string series_file_path(const StorageSettings& storage, const std::string& scenario,
                             const std::string& flight_id) {
  return (fs::path(storage.series_dir) / scenario / (flight_id + ".csv")).string();
}

// ----------------------------- Append ----------------------------------------
AddFlightResult add_flight(const ResultRecord& record, const FlightSeries& series,
                           const StorageSettings& storage) {
  const std::string scenario = record.text(field::kScenario);
  const std::string flight_id = record.text(field::kFlightId);
  if (scenario.empty()) throw ValidationError("add_flight: record has no Scenario");
  if (flight_id.empty()) throw ValidationError("add_flight: record has no Flight ID");

  AddFlightResult out;
  out.database_path = database_file_path(storage, scenario);

  HistoricalDatabase db;
  std::error_code ec;
  if (fs::is_regular_file(out.database_path, ec)) db = HistoricalDatabase::load(out.database_path);
  out.replaced = db.find(flight_id) != nullptr;

  ResultRecord stored = record;
  stored.erase(field::kLoggerVersion);
  stored.erase(field::kSessionId);
  stored.erase(field::kPilot);
  db.upsert(std::move(stored));
  db.drop_null_columns();

  out.series_path = series_file_path(storage, scenario, flight_id);
  write_series_csv(series, out.series_path);
  db.save(out.database_path);
  out.record_count = db.size();

  log(LogLevel::INFO, std::string(out.replaced ? "Replaced" : "Added") + " flight " + flight_id + " in " +
                          out.database_path + " (" + std::to_string(out.record_count) + " records)");
  return out;
}

} // namespace dockeval
