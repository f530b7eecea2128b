#pragma once

#include "courtline/config.h"
#include "courtline/diagnostics.h"
#include "courtline/game_record.h"
#include "courtline/name_resolver.h"
#include "courtline/quarter_analysis.h"
#include "courtline/roster.h"
#include "courtline/substitutions.h"
#include "courtline/timeline.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace courtline {

struct TrackingResult {
  std::string game_id;
  TeamId home_team_id = 0;
  TeamId away_team_id = 0;
  std::vector<LineupState> timeline;
  std::vector<SubstitutionEvent> substitutions;
  std::vector<QuarterBoundary> boundaries;
  std::vector<PlayerQuarterStatus> quarter_patterns;
  std::vector<Diagnostic> diagnostics;
  size_t dropped_substitutions = 0;

  size_t lossy_count() const;
};

struct OnCourtPlayer {
  PlayerId id = 0;
  std::string name;
};

struct OnCourtResult {
  std::string game_id;
  int period = 0;
  std::string clock;
  int elapsed_seconds = 0;
  // The snapshot that answered the query.
  int state_period = 0;
  std::string state_clock;
  int state_elapsed_seconds = 0;
  TeamId home_team_id = 0;
  TeamId away_team_id = 0;
  std::vector<OnCourtPlayer> home;
  std::vector<OnCourtPlayer> away;
};

// Runs the whole pipeline for one game. One tracker per game; it owns the
// roster and the name resolver built from it.
class LineupTracker {
 public:
  explicit LineupTracker(TrackerConfig config = TrackerConfig{});

  LineupTracker(const LineupTracker&) = delete;
  LineupTracker& operator=(const LineupTracker&) = delete;

  bool process(const GameRecord& game, std::string& error);
  bool processed() const { return processed_; }

  const TrackingResult& result() const { return result_; }
  const Roster& roster() const { return roster_; }
  const TrackerConfig& config() const { return config_; }

  bool players_on_court(int period, std::string_view clock, OnCourtResult& out, std::string& error) const;

 private:
  void report(const TrackingResult& result) const;

  TrackerConfig config_;
  Roster roster_;
  std::unique_ptr<PlayerNameResolver> resolver_;
  TrackingResult result_;
  bool processed_ = false;
  bool attempted_ = false;
};

} // namespace courtline
