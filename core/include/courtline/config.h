#pragma once

#include "courtline/quarter_analysis.h"

#include <filesystem>
#include <string>
#include <vector>

namespace courtline {

struct TrackerConfig {
  int backfill_min_seconds = 300;
  bool suppress_resolution_warnings = true;
  bool log_diagnostics = true;
  bool strict = false;
  bool verbose = false;
  std::vector<std::string> on_court_action_types = default_on_court_action_types();
};

// Reads `.json` or `.yaml`/`.yml`, with or without a top-level `tracker` key.
// A missing or unreadable file logs a warning and yields the defaults.
TrackerConfig load_tracker_config(const std::filesystem::path& path);

} // namespace courtline
