#pragma once

#include "courtline/roster.h"
#include "courtline/timeline.h"
#include "courtline/tracker.h"

#include <array>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace courtline {

// One persisted row per team per lineup state. Player slots are sorted so that
// the same five players always produce the same row.
struct LineupRow {
  std::string game_id;
  int period = 0;
  std::string clock;
  int elapsed_seconds = 0;
  TeamId team_id = 0;
  std::array<PlayerId, kLineupSize> players{};
  std::string lineup_hash;
};

std::vector<LineupRow> lineup_rows(const std::vector<LineupState>& timeline);

nlohmann::json to_json(const LineupState& state);
nlohmann::json to_json(const SubstitutionEvent& event);
nlohmann::json to_json(const QuarterBoundary& boundary);
nlohmann::json to_json(const PlayerQuarterStatus& status);
nlohmann::json to_json(const Diagnostic& diagnostic);
nlohmann::json to_json(const LineupRow& row);
nlohmann::json to_json(const OnCourtResult& result);

// Full document for one processed game; arrays keep pipeline order.
nlohmann::json tracking_result_json(const TrackingResult& result);

} // namespace courtline
