#pragma once
/*
===========================================================
Fragment 1.1 - Core: Logging
FILE: cpp/dockeval/core/logging.hpp
===========================================================
Purpose:
  - One logger for parsing, detection, evaluation, grading and the
    database tools. WARN/ERROR go to stderr, the rest to stdout.
  - Lines read "[<utc>][<LEVEL>] [<context>] message"; the context is the
    scenario or flight currently processed (empty -> omitted).

Hardening:
  - log() never throws.
  - Output lines are serialized by one mutex; the context is per thread.
  - DOCKEVAL_LOG_LEVEL overrides the verbosity when the CLI starts.
===========================================================
*/

#include <string>
#include <string_view>

namespace dockeval {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Process-wide verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;
LogLevel get_log_level() noexcept;

// "debug" / "info" / "warn" / "warning" / "error", any case.
// Returns false and leaves *out untouched otherwise.
bool parse_log_level(std::string_view name, LogLevel* out) noexcept;

// Applies DOCKEVAL_LOG_LEVEL when it is set and valid. Returns true if the
// level changed.
bool apply_log_level_from_env() noexcept;

void log(LogLevel lvl, const std::string& msg) noexcept;

// Tags every line logged on this thread while alive; restores the previous
// tag on destruction, so contexts nest (scenario -> flight).
class ScopedLogContext {
 public:
  explicit ScopedLogContext(std::string context);
  ~ScopedLogContext();

  ScopedLogContext(const ScopedLogContext&) = delete;
  ScopedLogContext& operator=(const ScopedLogContext&) = delete;

 private:
  std::string previous_;
};

const std::string& current_log_context() noexcept;

} // namespace dockeval
