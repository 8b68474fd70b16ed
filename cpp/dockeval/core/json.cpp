/*
================================================================================
Fragment 1.7 - Core: JSON Value, Parser and Writer (Implementation)
FILE: cpp/dockeval/core/json.cpp
================================================================================
*/

#include "dockeval/core/json.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace dockeval {

JsonValue JsonValue::make_bool(bool b) {
  JsonValue v;
  v.type = JsonType::kBool;
  v.boolean = b;
  return v;
}

JsonValue JsonValue::make_number(double x, bool integral) {
  JsonValue v;
  v.type = JsonType::kNumber;
  v.number = x;
  v.integral = integral;
  return v;
}

JsonValue JsonValue::make_string(std::string s) {
  JsonValue v;
  v.type = JsonType::kString;
  v.str = std::move(s);
  return v;
}

JsonValue JsonValue::make_object() {
  JsonValue v;
  v.type = JsonType::kObject;
  return v;
}

JsonValue JsonValue::make_array() {
  JsonValue v;
  v.type = JsonType::kArray;
  return v;
}

const JsonValue* JsonValue::find(std::string_view key) const {
  if (type != JsonType::kObject) return nullptr;
  for (const auto& kv : object) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

void JsonValue::set(std::string key, JsonValue v) {
  for (auto& kv : object) {
    if (kv.first == key) {
      kv.second = std::move(v);
      return;
    }
  }
  object.emplace_back(std::move(key), std::move(v));
}

// ============================================================================
// Parser
// ============================================================================
namespace {

struct Cursor {
  const char* p = nullptr;
  const char* b = nullptr;
  const char* e = nullptr;
  int line = 1;
  int col = 1;

  bool eof() const { return p >= e; }
  char peek() const { return *p; }

  void bump() {
    if (*p == '\n') { ++line; col = 1; }
    else { ++col; }
    ++p;
  }
};

bool fail(Cursor& c, JsonParseError* err, std::string msg) {
  if (err) {
    err->message = std::move(msg);
    err->offset = static_cast<std::size_t>(c.p - c.b);
    err->line = c.line;
    err->col = c.col;
  }
  return false;
}

void skip_ws(Cursor& c) {
  while (!c.eof()) {
    const char ch = c.peek();
    if (ch != ' ' && ch != '\t' && ch != '\r' && ch != '\n') break;
    c.bump();
  }
}

bool match_literal(Cursor& c, const char* lit) {
  const char* q = c.p;
  for (const char* s = lit; *s; ++s, ++q) {
    if (q >= c.e || *q != *s) return false;
  }
  while (c.p < q) c.bump();
  return true;
}

bool parse_hex4(Cursor& c, JsonParseError* err, unsigned& out) {
  out = 0;
  for (int i = 0; i < 4; ++i) {
    if (c.eof()) return fail(c, err, "Unexpected EOF in \\uXXXX escape");
    const char ch = c.peek();
    unsigned v = 0;
    if (ch >= '0' && ch <= '9') v = static_cast<unsigned>(ch - '0');
    else if (ch >= 'a' && ch <= 'f') v = 10u + static_cast<unsigned>(ch - 'a');
    else if (ch >= 'A' && ch <= 'F') v = 10u + static_cast<unsigned>(ch - 'A');
    else return fail(c, err, "Invalid hex digit in \\uXXXX escape");
    out = (out << 4) | v;
    c.bump();
  }
  return true;
}

void append_utf8(std::string& s, unsigned cp) {
  if (cp <= 0x7F) {
    s.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    s.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    s.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    s.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool parse_string(Cursor& c, JsonParseError* err, std::string& out) {
  skip_ws(c);
  if (c.eof() || c.peek() != '"') return fail(c, err, "Expected string");
  c.bump();
  out.clear();

  while (!c.eof()) {
    const char ch = c.peek();
    if (ch == '"') {
      c.bump();
      return true;
    }
    if (static_cast<unsigned char>(ch) < 0x20) return fail(c, err, "Unescaped control character in string");
    if (ch != '\\') {
      out.push_back(ch);
      c.bump();
      continue;
    }

    c.bump();
    if (c.eof()) return fail(c, err, "Unexpected EOF in string escape");
    const char esc = c.peek();
    c.bump();
    switch (esc) {
      case '"': out.push_back('"'); break;
      case '\\': out.push_back('\\'); break;
      case '/': out.push_back('/'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'u': {
        unsigned u = 0;
        if (!parse_hex4(c, err, u)) return false;
        if (u >= 0xD800 && u <= 0xDBFF) {
          if (c.eof() || c.peek() != '\\') return fail(c, err, "High surrogate not followed by low surrogate");
          c.bump();
          if (c.eof() || c.peek() != 'u') return fail(c, err, "High surrogate not followed by \\u");
          c.bump();
          unsigned u2 = 0;
          if (!parse_hex4(c, err, u2)) return false;
          if (u2 < 0xDC00 || u2 > 0xDFFF) return fail(c, err, "Invalid low surrogate");
          append_utf8(out, 0x10000u + (((u - 0xD800u) << 10) | (u2 - 0xDC00u)));
        } else if (u >= 0xDC00 && u <= 0xDFFF) {
          return fail(c, err, "Unexpected low surrogate");
        } else {
          append_utf8(out, u);
        }
      } break;
      default:
        return fail(c, err, "Invalid escape sequence");
    }
  }
  return fail(c, err, "Unterminated string");
}

bool consume_digits(Cursor& c) {
  bool any = false;
  while (!c.eof() && std::isdigit(static_cast<unsigned char>(c.peek()))) {
    c.bump();
    any = true;
  }
  return any;
}

bool parse_number(Cursor& c, JsonParseError* err, JsonValue& out) {
  const char* start = c.p;
  bool integral = true;

  if (!c.eof() && c.peek() == '-') c.bump();
  if (c.eof()) return fail(c, err, "Expected digits after '-'");

  if (c.peek() == '0') {
    c.bump();
  } else if (!consume_digits(c)) {
    return fail(c, err, "Invalid number");
  }

  if (!c.eof() && c.peek() == '.') {
    integral = false;
    c.bump();
    if (!consume_digits(c)) return fail(c, err, "Expected digits after '.'");
  }

  if (!c.eof() && (c.peek() == 'e' || c.peek() == 'E')) {
    integral = false;
    c.bump();
    if (!c.eof() && (c.peek() == '+' || c.peek() == '-')) c.bump();
    if (!consume_digits(c)) return fail(c, err, "Expected digits in exponent");
  }

  const std::string tmp(start, c.p);
  errno = 0;
  char* endptr = nullptr;
  const double v = std::strtod(tmp.c_str(), &endptr);
  if (endptr == tmp.c_str() || *endptr != '\0') return fail(c, err, "Failed to parse number");
  if (errno == ERANGE && !std::isfinite(v)) return fail(c, err, "Number out of range");

  out = JsonValue::make_number(v, integral);
  return true;
}

bool parse_value(Cursor& c, JsonParseError* err, JsonValue& out, int depth);

bool parse_array(Cursor& c, JsonParseError* err, JsonValue& out, int depth) {
  c.bump();  // '['
  out = JsonValue::make_array();

  skip_ws(c);
  if (!c.eof() && c.peek() == ']') {
    c.bump();
    return true;
  }

  while (true) {
    JsonValue v;
    if (!parse_value(c, err, v, depth + 1)) return false;
    out.array.push_back(std::move(v));

    skip_ws(c);
    if (c.eof()) return fail(c, err, "Unexpected EOF in array");
    if (c.peek() == ',') { c.bump(); continue; }
    if (c.peek() == ']') { c.bump(); return true; }
    return fail(c, err, "Expected ',' or ']'");
  }
}

bool parse_object(Cursor& c, JsonParseError* err, JsonValue& out, int depth) {
  c.bump();  // '{'
  out = JsonValue::make_object();

  skip_ws(c);
  if (!c.eof() && c.peek() == '}') {
    c.bump();
    return true;
  }

  while (true) {
    std::string key;
    if (!parse_string(c, err, key)) return false;

    skip_ws(c);
    if (c.eof() || c.peek() != ':') return fail(c, err, "Expected ':'");
    c.bump();

    JsonValue val;
    if (!parse_value(c, err, val, depth + 1)) return false;
    out.set(std::move(key), std::move(val));

    skip_ws(c);
    if (c.eof()) return fail(c, err, "Unexpected EOF in object");
    if (c.peek() == ',') { c.bump(); continue; }
    if (c.peek() == '}') { c.bump(); return true; }
    return fail(c, err, "Expected ',' or '}'");
  }
}

constexpr int kMaxDepth = 256;

bool parse_value(Cursor& c, JsonParseError* err, JsonValue& out, int depth) {
  if (depth > kMaxDepth) return fail(c, err, "Nesting too deep");
  skip_ws(c);
  if (c.eof()) return fail(c, err, "Unexpected EOF");

  const char ch = c.peek();
  if (ch == '{') return parse_object(c, err, out, depth);
  if (ch == '[') return parse_array(c, err, out, depth);
  if (ch == '"') {
    out = JsonValue::make_string({});
    return parse_string(c, err, out.str);
  }
  if (ch == 't') {
    if (!match_literal(c, "true")) return fail(c, err, "Invalid literal");
    out = JsonValue::make_bool(true);
    return true;
  }
  if (ch == 'f') {
    if (!match_literal(c, "false")) return fail(c, err, "Invalid literal");
    out = JsonValue::make_bool(false);
    return true;
  }
  if (ch == 'n') {
    if (!match_literal(c, "null")) return fail(c, err, "Invalid literal");
    out = JsonValue::make_null();
    return true;
  }
  if (ch == '-' || (ch >= '0' && ch <= '9')) return parse_number(c, err, out);

  return fail(c, err, "Unexpected token");
}

// ============================================================================
// Writer
// ============================================================================
void write_escaped(std::string& o, const std::string& s) {
  o.push_back('"');
  for (char ch : s) {
    switch (ch) {
      case '\\': o += "\\\\"; break;
      case '"':  o += "\\\""; break;
      case '\b': o += "\\b"; break;
      case '\f': o += "\\f"; break;
      case '\n': o += "\\n"; break;
      case '\r': o += "\\r"; break;
      case '\t': o += "\\t"; break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned>(static_cast<unsigned char>(ch)));
          o += buf;
        } else {
          o.push_back(ch);
        }
    }
  }
  o.push_back('"');
}

void write_number(std::string& o, const JsonValue& v) {
  if (!std::isfinite(v.number)) {
    o += "null";
    return;
  }
  char buf[64];
  if (v.integral && std::fabs(v.number) < 9007199254740992.0 && std::trunc(v.number) == v.number) {
    auto r = std::to_chars(buf, buf + sizeof(buf), static_cast<long long>(v.number));
    o.append(buf, r.ptr);
    return;
  }
  auto r = std::to_chars(buf, buf + sizeof(buf), v.number);
  std::string s(buf, r.ptr);
  // Keep floats recognizable as floats on the next read.
  if (s.find_first_of(".eE") == std::string::npos) s += ".0";
  o += s;
}

void write_value(std::string& o, const JsonValue& v) {
  switch (v.type) {
    case JsonType::kNull: o += "null"; break;
    case JsonType::kBool: o += (v.boolean ? "true" : "false"); break;
    case JsonType::kNumber: write_number(o, v); break;
    case JsonType::kString: write_escaped(o, v.str); break;
    case JsonType::kArray:
      o.push_back('[');
      for (std::size_t i = 0; i < v.array.size(); ++i) {
        if (i) o.push_back(',');
        write_value(o, v.array[i]);
      }
      o.push_back(']');
      break;
    case JsonType::kObject:
      o.push_back('{');
      for (std::size_t i = 0; i < v.object.size(); ++i) {
        if (i) o.push_back(',');
        write_escaped(o, v.object[i].first);
        o.push_back(':');
        write_value(o, v.object[i].second);
      }
      o.push_back('}');
      break;
  }
}

} // namespace

bool parse_json(std::string_view text, JsonValue* out, JsonParseError* err) {
  if (!out) return false;

  Cursor c;
  c.b = text.data();
  c.p = text.data();
  c.e = text.data() + text.size();

  JsonValue root;
  if (!parse_value(c, err, root, 0)) return false;

  skip_ws(c);
  if (!c.eof()) return fail(c, err, "Trailing characters after JSON");

  *out = std::move(root);
  return true;
}

std::string to_json(const JsonValue& v) {
  std::string o;
  write_value(o, v);
  return o;
}

} // namespace dockeval
