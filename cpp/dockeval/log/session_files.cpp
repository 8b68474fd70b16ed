#include "dockeval/log/session_files.hpp"

#include "dockeval/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace dockeval {

namespace {

bool all_digits(const std::string& s) {
  if (s.empty()) return false;
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

struct Entry {
  std::string path;
  std::string stem;
  std::string prefix;
  std::string suffix;
};

} // namespace

SessionFiles validate_session_files(const std::vector<std::string>& paths) {
  if (paths.empty()) throw ValidationError("No Flight Log selected.");

  std::vector<Entry> entries;
  entries.reserve(paths.size());

  for (const auto& p : paths) {
    const std::filesystem::path fp(p);
    const std::string name = fp.filename().string();
    const std::string ext = fp.extension().string();

    if (ext != ".log") {
      throw ValidationError("The Format of the Flight Log '" + name + "' is '" + ext +
                            "' but '.log' is required");
    }
    if (name.rfind("FDL", 0) != 0) {
      throw ValidationError("The Name of the Flight Log '" + name + "' don't starts with FDL.");
    }

    Entry e;
    e.path = p;
    e.stem = fp.stem().string();
    const auto us = e.stem.rfind('_');
    e.prefix = (us == std::string::npos) ? e.stem : e.stem.substr(0, us);
    e.suffix = (us == std::string::npos) ? e.stem : e.stem.substr(us + 1);

    if (!all_digits(e.suffix)) {
      throw ValidationError(
          "The last part of the Log filename should be a numerical identifier like 0000, 0001 "
          "etc. but is actually '" + e.suffix + "'");
    }
    entries.push_back(std::move(e));
  }

  std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
    return std::filesystem::path(a.path).filename().string() <
           std::filesystem::path(b.path).filename().string();
  });

  for (const auto& e : entries) {
    if (e.prefix != entries.front().prefix) {
      throw ValidationError("Not all selected Logs are from the same Session.");
    }
  }

  for (std::size_t i = 0; i < entries.size(); ++i) {
    // Suffixes are checked as numbers, so "0000" and "0" are both index 0.
    const std::string& sfx = entries[i].suffix;
    const bool matches = sfx.size() <= 12 && std::stoull(sfx) == i;
    if (!matches) {
      std::ostringstream ss;
      ss << "Not all Logs of the Session are provided. Only the Logs [";
      for (std::size_t k = 0; k < entries.size(); ++k) {
        if (k) ss << ", ";
        ss << "'" << std::filesystem::path(entries[k].path).filename().string() << "'";
      }
      ss << "] are selected.";
      throw ValidationError(ss.str());
    }
  }

  SessionFiles out;
  out.session_prefix = entries.front().prefix;
  out.paths.reserve(entries.size());
  for (auto& e : entries) out.paths.push_back(std::move(e.path));
  return out;
}

} // namespace dockeval
