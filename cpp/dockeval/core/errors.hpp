#pragma once
/*
================================================================================
Fragment 1.9 - Core: Error Types
FILE: cpp/dockeval/core/errors.hpp

Purpose:
  - Provide uniform exception types so validation and runtime failures are:
      * searchable
      * catchable by category
      * reportable to UI cleanly (what() is the human-readable reason)

Categories:
  - ValidationError          : caller input rejected (file naming, phase order, settings)
  - LogParseError            : malformed log content; names file + line
  - PhaseDataUnavailable     : windowed lookup found no SimTime row
  - ReferenceDatabaseMissing : no historical file for a scenario
  - NumericalError           : a numerical fit became invalid
  - IOError                  : file system failures
================================================================================
*/

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace dockeval {

// Base error for the engine.
class DockevalError : public std::runtime_error {
 public:
  explicit DockevalError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Thrown when user/config input fails validation.
class ValidationError : public DockevalError {
 public:
  explicit ValidationError(std::string msg) : DockevalError(std::move(msg)) {}
};

// Thrown when a log file cannot be trusted. line == 0 means "whole file".
class LogParseError : public DockevalError {
 public:
  LogParseError(std::string file, std::size_t line, std::string msg)
      : DockevalError(build_what(file, line, msg)),
        file_(std::move(file)),
        line_(line),
        reason_(std::move(msg)) {}

  const std::string& file() const noexcept { return file_; }
  std::size_t line() const noexcept { return line_; }
  const std::string& reason() const noexcept { return reason_; }

 private:
  static std::string build_what(const std::string& file, std::size_t line, const std::string& msg) {
    std::string w = file;
    if (line > 0) w += ":" + std::to_string(line);
    w += ": " + msg;
    return w;
  }

  std::string file_;
  std::size_t line_ = 0;
  std::string reason_;
};

// Thrown when a metric needs a row at an exact SimTime and none exists.
class PhaseDataUnavailable : public DockevalError {
 public:
  PhaseDataUnavailable(std::string metric, double sim_time, std::string msg)
      : DockevalError(std::move(msg)), metric_(std::move(metric)), sim_time_(sim_time) {}

  const std::string& metric() const noexcept { return metric_; }
  double sim_time() const noexcept { return sim_time_; }

 private:
  std::string metric_;
  double sim_time_ = 0.0;
};

// Thrown before grading when a scenario has no reference population.
class ReferenceDatabaseMissing : public DockevalError {
 public:
  ReferenceDatabaseMissing(std::string scenario, std::string msg)
      : DockevalError(std::move(msg)), scenario_(std::move(scenario)) {}

  const std::string& scenario() const noexcept { return scenario_; }

 private:
  std::string scenario_;
};

// Thrown when a computation fails to converge or becomes numerically invalid.
class NumericalError : public DockevalError {
 public:
  explicit NumericalError(std::string msg) : DockevalError(std::move(msg)) {}
};

// Thrown for I/O or filesystem related issues.
class IOError : public DockevalError {
 public:
  explicit IOError(std::string msg) : DockevalError(std::move(msg)) {}
};

} // namespace dockeval
