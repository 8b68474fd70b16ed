/*
===========================================================
Fragment 1.1 - Core: Logging (Implementation)
FILE: cpp/dockeval/core/logging.cpp
===========================================================
*/

#include "dockeval/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string_view>
#include <utility>

namespace dockeval {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
std::mutex g_log_mu;
thread_local std::string t_context;

const char* level_tag(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
  }
  return "INFO";
}

std::string utc_timestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

} // namespace

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool parse_log_level(std::string_view name, LogLevel* out) noexcept {
  if (!out || name.size() > 16) return false;
  char lower[17] = {};
  for (std::size_t i = 0; i < name.size(); ++i) {
    lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(name[i])));
  }
  const std::string_view s(lower, name.size());

  if (s == "debug") *out = LogLevel::DEBUG;
  else if (s == "info") *out = LogLevel::INFO;
  else if (s == "warn" || s == "warning") *out = LogLevel::WARN;
  else if (s == "error") *out = LogLevel::ERROR;
  else return false;
  return true;
}

bool apply_log_level_from_env() noexcept {
  const char* env = std::getenv("DOCKEVAL_LOG_LEVEL");
  if (env == nullptr) return false;
  LogLevel lvl{};
  if (!parse_log_level(env, &lvl)) return false;
  set_log_level(lvl);
  return true;
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;
  try {
    std::ostringstream line;
    line << "[" << utc_timestamp() << "][" << level_tag(lvl) << "] ";
    if (!t_context.empty()) line << "[" << t_context << "] ";
    line << msg << "\n";

    std::lock_guard<std::mutex> lk(g_log_mu);
    std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
    out << line.str();
    out.flush();
  } catch (...) {
    // Must never throw.
  }
}

ScopedLogContext::ScopedLogContext(std::string context) : previous_(std::move(t_context)) {
  t_context = std::move(context);
}

ScopedLogContext::~ScopedLogContext() { t_context = std::move(previous_); }

const std::string& current_log_context() noexcept { return t_context; }

} // namespace dockeval
