#pragma once
/*
================================================================================
Fragment 1.6 - Core: Text Helpers
FILE: cpp/dockeval/core/text.hpp

Small string helpers shared by the log parser, CSV reader and schema loader.
================================================================================
*/

#include <cerrno>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

namespace dockeval {

inline bool is_space(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

inline std::string trim(std::string_view s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && is_space(s[b])) ++b;
  while (e > b && is_space(s[e - 1])) --e;
  return std::string(s.substr(b, e - b));
}

inline bool starts_with(std::string_view s, std::string_view prefix) noexcept {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Splits on `delim`, keeping empty fields.
inline std::vector<std::string> split(std::string_view s, char delim) {
  std::vector<std::string> out;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= s.size(); ++i) {
    if (i == s.size() || s[i] == delim) {
      out.emplace_back(s.substr(start, i - start));
      start = i + 1;
    }
  }
  return out;
}

// Splits on `delim`, trims every field and drops the empty ones.
inline std::vector<std::string> split_trim_nonempty(std::string_view s, char delim) {
  std::vector<std::string> out;
  for (auto& f : split(s, delim)) {
    std::string t = trim(f);
    if (!t.empty()) out.push_back(std::move(t));
  }
  return out;
}

// Replaces the first occurrence of `from` at or after position 0.
inline bool replace_first(std::string& s, std::string_view from, std::string_view to) {
  const auto pos = s.find(from);
  if (pos == std::string::npos) return false;
  s.replace(pos, from.size(), to);
  return true;
}

inline void replace_all(std::string& s, std::string_view from, std::string_view to) {
  if (from.empty()) return;
  std::size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

// Full-token float parse ("1.5", "-2e3", "nan", "inf"). Returns false when any
// character is left over or nothing was consumed.
inline bool parse_double(const std::string& token, double* out) noexcept {
  if (token.empty() || out == nullptr) return false;
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(token.c_str(), &end);
  if (end == token.c_str() || *end != '\0') return false;
  *out = v;
  return true;
}

} // namespace dockeval
