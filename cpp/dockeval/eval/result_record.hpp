#pragma once
/*
================================================================================
Fragment 4.3 - Eval: Result Record
FILE: cpp/dockeval/eval/result_record.hpp

Purpose:
  One evaluated flight as an ordered, wide row of named fields:
    - identity fields (Flight ID, Scenario, Pilot, Session ID, Date,
      Logger Version, Manually modified Phases)
    - one numeric field per computed metric

  Field order follows the schema; fields set outside the schema are appended.
  A field that was never computed stays null.

Serialization:
  to_json()/from_json() produce one flat JSON object (one database line).
  Count metrics keep their integral flag so they are written as integers.
================================================================================
*/

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "dockeval/core/json.hpp"
#include "dockeval/eval/schema.hpp"
#include "dockeval/log/log_parser.hpp"

namespace dockeval {

namespace field {
inline constexpr const char* kFlightId = "Flight ID";
inline constexpr const char* kScenario = "Scenario";
inline constexpr const char* kPilot = "Pilot";
inline constexpr const char* kSessionId = "Session ID";
inline constexpr const char* kDate = "Date";
inline constexpr const char* kLoggerVersion = "Logger Version";
inline constexpr const char* kManuallyModified = "Manually modified Phases";
} // namespace field

// True for the identity fields above.
bool is_identity_field(const std::string& name);

struct FieldValue {
  enum class Kind : int { kNull = 0, kNumber = 1, kString = 2 };

  Kind kind = Kind::kNull;
  double number = 0.0;
  bool integral = false;
  std::string text;

  static FieldValue make_null() { return FieldValue{}; }
  static FieldValue make_number(double v, bool integral = false);
  static FieldValue make_string(std::string s);

  bool is_null() const noexcept { return kind == Kind::kNull; }
  bool is_number() const noexcept { return kind == Kind::kNumber; }
  bool is_string() const noexcept { return kind == Kind::kString; }

  bool operator==(const FieldValue& o) const;
};

class ResultRecord {
 public:
  ResultRecord() = default;

  // Every schema column, in order, set to null.
  static ResultRecord from_schema(const Schema& schema);

  // Reads one flat JSON object. Throws ValidationError for nested values.
  static ResultRecord from_json(const JsonValue& obj);

  bool has(const std::string& name) const { return index_.count(name) != 0; }

  // Setters insert the field at the end when it is not declared yet.
  void set(const std::string& name, FieldValue v);
  void set_number(const std::string& name, double v, bool integral = false);
  void set_string(const std::string& name, std::string s);
  void set_null(const std::string& name);

  // Removes a field; no-op when absent.
  void erase(const std::string& name);

  const FieldValue* get(const std::string& name) const;

  // Numeric value; nullopt when absent, null or a string.
  std::optional<double> number(const std::string& name) const;

  // String value; empty when absent or not a string. Numbers are formatted.
  std::string text(const std::string& name) const;

  const std::vector<std::pair<std::string, FieldValue>>& fields() const noexcept { return fields_; }
  std::size_t size() const noexcept { return fields_.size(); }

  JsonValue to_json() const;

 private:
  void reindex_();

  std::vector<std::pair<std::string, FieldValue>> fields_;
  std::unordered_map<std::string, std::size_t> index_;
};

// Copies the session identity into the record; Manually modified Phases = "No".
void apply_session_metadata(const ParsedSession& parsed, ResultRecord& record);

// Flags the record after the user moved a phase boundary by hand.
void mark_manually_modified(ResultRecord& record);

} // namespace dockeval
