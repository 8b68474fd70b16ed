#pragma once
/*
================================================================================
Fragment 1.2 - Core: Diagnostic Sink
FILE: cpp/dockeval/core/diagnostics.hpp

Purpose:
  - Phase detection and evaluation emit human-readable notices (backup
    boundaries, edge-run mismatches, skipped optional metrics). They are
    reported through this interface; the caller decides how to display them.
================================================================================
*/

#include <string>
#include <utility>
#include <vector>

#include "dockeval/core/logging.hpp"

namespace dockeval {

enum class DiagnosticKind : int {
  kBackupBoundary = 0,   // a phase boundary was estimated
  kEdgeMismatch   = 1,   // start/stop lists could not be reconciled
  kSkippedMetric  = 2,   // optional metric skipped after a lookup miss
  kNotice         = 3,
};

struct Diagnostic {
  DiagnosticKind kind = DiagnosticKind::kNotice;
  std::string message;
};

class DiagnosticSink {
 public:
  virtual ~DiagnosticSink() = default;
  virtual void on_diagnostic(const Diagnostic& d) = 0;

  void emit(DiagnosticKind kind, std::string message) {
    on_diagnostic(Diagnostic{kind, std::move(message)});
  }
};

// Forwards every diagnostic to the engine logger at WARN (backup/mismatch) or INFO.
class LoggingDiagnosticSink final : public DiagnosticSink {
 public:
  void on_diagnostic(const Diagnostic& d) override {
    const LogLevel lvl = (d.kind == DiagnosticKind::kNotice) ? LogLevel::INFO : LogLevel::WARN;
    log(lvl, d.message);
  }
};

// Keeps diagnostics for later inspection (UI label, tests).
class CollectingDiagnosticSink final : public DiagnosticSink {
 public:
  void on_diagnostic(const Diagnostic& d) override { items_.push_back(d); }

  const std::vector<Diagnostic>& items() const noexcept { return items_; }

  bool contains(DiagnosticKind kind) const noexcept {
    for (const auto& d : items_) {
      if (d.kind == kind) return true;
    }
    return false;
  }

  void clear() noexcept { items_.clear(); }

 private:
  std::vector<Diagnostic> items_;
};

} // namespace dockeval
