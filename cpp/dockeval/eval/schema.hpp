#pragma once
/*
================================================================================
Fragment 4.1 - Eval: Result Schema
FILE: cpp/dockeval/eval/schema.hpp

Purpose:
  The schema resource declares every column a ResultRecord may carry, in
  output order, with optional metadata:

    {"columns": {
       "Flight ID": null,
       "Start_Align": {"unit": "s", "description": "...", "optional": true},
       "OutOfCone_Appr": {"unit": "s", "alt_name": "Out of cone time"},
       ...}}

  A column that is absent is not computed. Columns flagged optional are not
  graded (Not Tierable) and lookup misses on them are downgraded to
  diagnostics.
================================================================================
*/

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "dockeval/core/json.hpp"

namespace dockeval {

struct SchemaColumn {
  std::string name;
  std::string unit;
  std::string description;
  std::string alt_name;
  bool optional = false;
};

class Schema {
 public:
  Schema() = default;

  // Throws ValidationError when the document does not follow the layout above.
  static Schema from_json(const JsonValue& root);

  // Throws IOError (unreadable file) or ValidationError (bad JSON / layout).
  static Schema load(const std::string& path);

  // Builds a schema from plain names (all required); handy for tests.
  static Schema from_names(const std::vector<std::string>& names);

  void add(SchemaColumn c);

  bool has(const std::string& name) const { return index_.count(name) != 0; }
  const SchemaColumn* find(const std::string& name) const;
  bool is_optional(const std::string& name) const;

  const std::vector<SchemaColumn>& columns() const noexcept { return columns_; }
  std::vector<std::string> names() const;
  std::size_t size() const noexcept { return columns_.size(); }

 private:
  std::vector<SchemaColumn> columns_;
  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace dockeval
