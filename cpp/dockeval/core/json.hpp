#pragma once
/*
================================================================================
Fragment 1.7 - Core: JSON Value, Parser and Writer
FILE: cpp/dockeval/core/json.hpp

Purpose:
  - Read the schema resource and newline-delimited flight databases.
  - Write database records back deterministically.

Contract:
  - Object members keep their input order (databases are column-ordered).
    A repeated key replaces the earlier value in place.
  - Numbers remember whether the literal was integral ("3" vs "3.0"), so
    count columns survive a read/write cycle as JSON integers.
  - NaN/Inf literals are rejected on input; the writer emits null for them.
  - Parse errors report byte offset and 1-based line/col.
================================================================================
*/

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dockeval {

enum class JsonType { kNull, kBool, kNumber, kString, kObject, kArray };

struct JsonValue {
  JsonType type = JsonType::kNull;
  bool boolean = false;
  double number = 0.0;
  bool integral = false;
  std::string str;
  std::vector<std::pair<std::string, JsonValue>> object;
  std::vector<JsonValue> array;

  static JsonValue make_null() { return JsonValue{}; }
  static JsonValue make_bool(bool b);
  static JsonValue make_number(double v, bool integral = false);
  static JsonValue make_string(std::string s);
  static JsonValue make_object();
  static JsonValue make_array();

  bool is_null() const noexcept { return type == JsonType::kNull; }
  bool is_object() const noexcept { return type == JsonType::kObject; }

  // Object member lookup; nullptr when absent or not an object.
  const JsonValue* find(std::string_view key) const;

  // Inserts or replaces an object member (value must be an object).
  void set(std::string key, JsonValue v);
};

struct JsonParseError {
  std::string message;
  std::size_t offset = 0;  // byte offset in input
  int line = 1;            // 1-based
  int col = 1;             // 1-based
};

// Parses exactly one JSON value (surrounding whitespace allowed).
bool parse_json(std::string_view text, JsonValue* out, JsonParseError* err = nullptr);

// Compact single-line serialization (NDJSON friendly).
std::string to_json(const JsonValue& v);

} // namespace dockeval
