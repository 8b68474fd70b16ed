#include "dockeval/eval/result_record.hpp"

#include "dockeval/core/errors.hpp"

#include <charconv>
#include <cmath>

namespace dockeval {

namespace {

std::string format_number(double v, bool integral) {
  if (std::isnan(v)) return "nan";
  if (integral && std::fabs(v) < 9007199254740992.0) {
    return std::to_string(static_cast<long long>(v));
  }
  char buf[64];
  auto res = std::to_chars(buf, buf + sizeof(buf), v);
  return std::string(buf, res.ptr);
}

} // namespace

bool is_identity_field(const std::string& name) {
  return name == field::kFlightId || name == field::kScenario || name == field::kPilot ||
         name == field::kSessionId || name == field::kDate || name == field::kLoggerVersion ||
         name == field::kManuallyModified;
}

FieldValue FieldValue::make_number(double v, bool integral) {
  FieldValue f;
  f.kind = Kind::kNumber;
  f.number = v;
  f.integral = integral;
  return f;
}

FieldValue FieldValue::make_string(std::string s) {
  FieldValue f;
  f.kind = Kind::kString;
  f.text = std::move(s);
  return f;
}

bool FieldValue::operator==(const FieldValue& o) const {
  if (kind != o.kind) return false;
  switch (kind) {
    case Kind::kNull: return true;
    case Kind::kString: return text == o.text;
    case Kind::kNumber:
      if (std::isnan(number) && std::isnan(o.number)) return true;
      return number == o.number;
  }
  return false;
}

ResultRecord ResultRecord::from_schema(const Schema& schema) {
  ResultRecord r;
  for (const auto& c : schema.columns()) r.set(c.name, FieldValue::make_null());
  return r;
}

ResultRecord ResultRecord::from_json(const JsonValue& obj) {
  if (!obj.is_object()) throw ValidationError("ResultRecord: JSON record must be an object");
  ResultRecord r;
  for (const auto& [name, v] : obj.object) {
    switch (v.type) {
      case JsonType::kNull: r.set(name, FieldValue::make_null()); break;
      case JsonType::kNumber: r.set(name, FieldValue::make_number(v.number, v.integral)); break;
      case JsonType::kString: r.set(name, FieldValue::make_string(v.str)); break;
      case JsonType::kBool: r.set(name, FieldValue::make_string(v.boolean ? "true" : "false")); break;
      default: throw ValidationError("ResultRecord: field '" + name + "' must be a scalar");
    }
  }
  return r;
}

void ResultRecord::set(const std::string& name, FieldValue v) {
  auto it = index_.find(name);
  if (it != index_.end()) {
    fields_[it->second].second = std::move(v);
    return;
  }
  index_.emplace(name, fields_.size());
  fields_.emplace_back(name, std::move(v));
}

void ResultRecord::set_number(const std::string& name, double v, bool integral) {
  set(name, FieldValue::make_number(v, integral));
}

void ResultRecord::set_string(const std::string& name, std::string s) {
  set(name, FieldValue::make_string(std::move(s)));
}

void ResultRecord::set_null(const std::string& name) { set(name, FieldValue::make_null()); }

void ResultRecord::erase(const std::string& name) {
  auto it = index_.find(name);
  if (it == index_.end()) return;
  fields_.erase(fields_.begin() + static_cast<std::ptrdiff_t>(it->second));
  reindex_();
}

const FieldValue* ResultRecord::get(const std::string& name) const {
  auto it = index_.find(name);
  return it == index_.end() ? nullptr : &fields_[it->second].second;
}

std::optional<double> ResultRecord::number(const std::string& name) const {
  const FieldValue* f = get(name);
  if (!f || !f->is_number()) return std::nullopt;
  return f->number;
}

std::string ResultRecord::text(const std::string& name) const {
  const FieldValue* f = get(name);
  if (!f) return std::string();
  if (f->is_string()) return f->text;
  if (f->is_number()) return format_number(f->number, f->integral);
  return std::string();
}

JsonValue ResultRecord::to_json() const {
  JsonValue obj = JsonValue::make_object();
  for (const auto& [name, v] : fields_) {
    switch (v.kind) {
      case FieldValue::Kind::kNull: obj.set(name, JsonValue::make_null()); break;
      case FieldValue::Kind::kNumber: obj.set(name, JsonValue::make_number(v.number, v.integral)); break;
      case FieldValue::Kind::kString: obj.set(name, JsonValue::make_string(v.text)); break;
    }
  }
  return obj;
}

void ResultRecord::reindex_() {
  index_.clear();
  for (std::size_t i = 0; i < fields_.size(); ++i) index_.emplace(fields_[i].first, i);
}

void apply_session_metadata(const ParsedSession& parsed, ResultRecord& record) {
  const SessionMetadata& m = parsed.metadata;
  record.set_string(field::kFlightId, parsed.flight_id);
  record.set_string(field::kScenario, m.scenario);
  record.set_string(field::kPilot, m.pilot);
  record.set_string(field::kSessionId, m.session_id);
  if (m.date_day) {
    record.set_number(field::kDate, static_cast<double>(*m.date_day), true);
  } else {
    record.set_null(field::kDate);
  }
  record.set_string(field::kLoggerVersion, m.logger_version);
  record.set_string(field::kManuallyModified, "No");
}

void mark_manually_modified(ResultRecord& record) {
  record.set_string(field::kManuallyModified, "Yes");
}

} // namespace dockeval
