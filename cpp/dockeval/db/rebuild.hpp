#pragma once
/*
================================================================================
Fragment 6.3 - DB: Database Rebuild
FILE: cpp/dockeval/db/rebuild.hpp

Purpose:
  Re-evaluate every stored flight after a metric-calculation change:
    - records are aligned to the schema (extra columns dropped, missing ones
      added as null)
    - boundaries come from Start_Align, Start_Appr, Start_FA, Time_Dock
    - the raw series is read from <series_dir>/<Scenario>/<Flight ID>.csv
    - the scenario file is rewritten
  A flight that fails is logged at ERROR and kept unchanged.
================================================================================
*/

#include <cstddef>
#include <string>
#include <vector>

#include "dockeval/core/diagnostics.hpp"
#include "dockeval/core/settings.hpp"
#include "dockeval/eval/schema.hpp"
#include "dockeval/phases/phase_detector.hpp"

namespace dockeval {

class ResultRecord;

struct RebuildReport {
  std::size_t processed = 0;
  std::size_t rebuilt = 0;
  std::vector<std::string> failures;  // "<Flight ID>: <reason>"

  std::size_t failed() const noexcept { return failures.size(); }
};

// Stored boundaries of a record. Throws ValidationError when one is missing.
PhaseBoundaries stored_boundaries(const ResultRecord& record);

// Rebuilds <database_dir>/<scenario>_flight_data.json (or <scenario>.json).
RebuildReport rebuild_scenario(const std::string& scenario, const Schema& schema, const Settings& settings,
                               DiagnosticSink& sink);

// Rebuilds every *.json file of the database directory. The scenario is the
// file name up to the first '_' (or the stem).
RebuildReport rebuild_database(const Schema& schema, const Settings& settings, DiagnosticSink& sink);

} // namespace dockeval
