#include "courtline/tracker.h"

#include "courtline/clock.h"
#include "courtline/lineup_inference.h"
#include "courtline/log.h"

#include <algorithm>

namespace courtline {

size_t TrackingResult::lossy_count() const {
  return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
                                           [](const Diagnostic& d) { return is_lossy(d.kind); }));
}

LineupTracker::LineupTracker(TrackerConfig config) : config_(std::move(config)) {}

bool LineupTracker::process(const GameRecord& game, std::string& error) {
  if (attempted_) {
    error = "tracker already used for game " + result_.game_id;
    return false;
  }
  attempted_ = true;

  TrackingResult result;
  result.game_id = game.game_id;
  result.home_team_id = game.home_team.id;
  result.away_team_id = game.away_team.id;

  if (!roster_.build(game, result.diagnostics, error)) {
    log::error("roster: " + error);
    return false;
  }
  resolver_ = std::make_unique<PlayerNameResolver>(roster_);

  result.substitutions = parse_substitutions(game, *resolver_, result.diagnostics,
                                             config_.suppress_resolution_warnings);
  result.dropped_substitutions = count_diagnostics(result.diagnostics, DiagnosticKind::ResolutionMiss) +
                                 count_diagnostics(result.diagnostics, DiagnosticKind::UnparsedSubstitution);
  result.boundaries = analyze_quarter_boundaries(game.actions);

  QuarterPatternAnalyzer analyzer(game, roster_, result.substitutions, result.boundaries,
                                  config_.on_court_action_types);
  result.quarter_patterns = analyzer.analyze();

  LineupInferencer inferencer(roster_, config_.backfill_min_seconds);
  TimelineBuilder builder(game, roster_, inferencer, result.quarter_patterns, result.boundaries,
                          result.substitutions);
  if (!builder.build(result.timeline, result.diagnostics, error)) {
    log::error("timeline: " + error);
    return false;
  }

  report(result);
  result_ = std::move(result);
  processed_ = true;
  return true;
}

void LineupTracker::report(const TrackingResult& result) const {
  if (config_.log_diagnostics) {
    for (const auto& d : result.diagnostics) {
      if (d.kind == DiagnosticKind::ResolutionMiss && config_.suppress_resolution_warnings) continue;
      log::warn(std::string(diagnostic_kind_name(d.kind)) + " (action " + std::to_string(d.action_number) +
                ", period " + std::to_string(d.period) + "): " + d.message);
    }
  }
  log::info("game " + result.game_id + ": " + std::to_string(result.timeline.size()) + " lineup states, " +
            std::to_string(result.substitutions.size()) + " substitutions, " +
            std::to_string(result.dropped_substitutions) + " dropped, " + std::to_string(result.diagnostics.size()) +
            " diagnostics");
}

bool LineupTracker::players_on_court(int period, std::string_view clock, OnCourtResult& out,
                                     std::string& error) const {
  if (!processed_) {
    error = "no processed game";
    return false;
  }
  int target = 0;
  if (!clock::to_elapsed(period, clock, target)) {
    error = "invalid query time: period " + std::to_string(period) + " clock '" + std::string(clock) + "'";
    return false;
  }
  const LineupState* state = find_state_at(result_.timeline, target);
  if (!state) {
    error = "empty timeline";
    return false;
  }

  out = OnCourtResult{};
  out.game_id = result_.game_id;
  out.period = period;
  out.clock = std::string(clock);
  out.elapsed_seconds = target;
  out.state_period = state->period;
  out.state_clock = state->clock;
  out.state_elapsed_seconds = state->elapsed_seconds;
  out.home_team_id = state->home_team_id;
  out.away_team_id = state->away_team_id;
  for (PlayerId id : state->home_players) {
    out.home.push_back({id, roster_.display_name(id)});
  }
  for (PlayerId id : state->away_players) {
    out.away.push_back({id, roster_.display_name(id)});
  }
  return true;
}

} // namespace courtline
