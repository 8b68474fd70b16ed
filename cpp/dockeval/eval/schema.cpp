#include "dockeval/eval/schema.hpp"

#include "dockeval/core/errors.hpp"

#include <fstream>
#include <sstream>

namespace dockeval {

namespace {

std::string read_string_member(const JsonValue& obj, const char* key, const std::string& column) {
  const JsonValue* v = obj.find(key);
  if (!v || v->is_null()) return std::string();
  if (v->type != JsonType::kString) {
    throw ValidationError("Schema: '" + column + "." + key + "' must be a string");
  }
  return v->str;
}

} // namespace

Schema Schema::from_json(const JsonValue& root) {
  if (!root.is_object()) throw ValidationError("Schema: root must be an object");
  const JsonValue* cols = root.find("columns");
  if (!cols || !cols->is_object()) throw ValidationError("Schema: 'columns' must be an object");

  Schema s;
  for (const auto& [name, meta] : cols->object) {
    SchemaColumn c;
    c.name = name;
    if (meta.is_object()) {
      c.unit = read_string_member(meta, "unit", name);
      c.description = read_string_member(meta, "description", name);
      c.alt_name = read_string_member(meta, "alt_name", name);
      if (const JsonValue* opt = meta.find("optional")) {
        if (opt->type != JsonType::kBool && !opt->is_null()) {
          throw ValidationError("Schema: '" + name + ".optional' must be a boolean");
        }
        c.optional = opt->type == JsonType::kBool && opt->boolean;
      }
    } else if (!meta.is_null()) {
      throw ValidationError("Schema: column '" + name + "' must map to an object or null");
    }
    s.add(std::move(c));
  }
  return s;
}

Schema Schema::load(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) throw IOError("Cannot open schema resource: " + path);
  std::ostringstream ss;
  ss << ifs.rdbuf();

  JsonValue root;
  JsonParseError err;
  if (!parse_json(ss.str(), &root, &err)) {
    std::ostringstream msg;
    msg << "Schema " << path << ":" << err.line << ":" << err.col << ": " << err.message;
    throw ValidationError(msg.str());
  }
  return from_json(root);
}

Schema Schema::from_names(const std::vector<std::string>& names) {
  Schema s;
  for (const auto& n : names) {
    SchemaColumn c;
    c.name = n;
    s.add(std::move(c));
  }
  return s;
}

void Schema::add(SchemaColumn c) {
  auto it = index_.find(c.name);
  if (it != index_.end()) {
    columns_[it->second] = std::move(c);
    return;
  }
  index_.emplace(c.name, columns_.size());
  columns_.push_back(std::move(c));
}

const SchemaColumn* Schema::find(const std::string& name) const {
  auto it = index_.find(name);
  return it == index_.end() ? nullptr : &columns_[it->second];
}

bool Schema::is_optional(const std::string& name) const {
  const SchemaColumn* c = find(name);
  return c != nullptr && c->optional;
}

std::vector<std::string> Schema::names() const {
  std::vector<std::string> out;
  out.reserve(columns_.size());
  for (const auto& c : columns_) out.push_back(c.name);
  return out;
}

} // namespace dockeval
