#pragma once
/*
================================================================================
Fragment 2.2 - Log: Session File Validation
FILE: cpp/dockeval/log/session_files.hpp

Purpose:
  A docking session is logged across sequentially numbered files:
      FDL_<session>_0000.log, FDL_<session>_0001.log, ...
  Before parsing, the selected file list must:
    - use the ".log" extension,
    - start with "FDL",
    - end in a numeric suffix after the last '_',
    - share one session prefix (everything before the last '_'),
    - contain every suffix 0..n-1 exactly once.

Failure:
  ValidationError with the user-facing reason string.
================================================================================
*/

#include <string>
#include <vector>

namespace dockeval {

struct SessionFiles {
  // Paths sorted by basename.
  std::vector<std::string> paths;

  // Basename prefix shared by all files (before the last '_').
  std::string session_prefix;
};

// Validates and sorts a user selection of log files. Does not touch the
// file system.
SessionFiles validate_session_files(const std::vector<std::string>& paths);

} // namespace dockeval
