#include "courtline/timeline.h"

#include "courtline/clock.h"
#include "courtline/log.h"

#include <algorithm>
#include <set>

namespace courtline {

namespace {
bool has_duplicates(const Lineup& lineup) {
  for (size_t i = 0; i < lineup.size(); ++i) {
    for (size_t j = i + 1; j < lineup.size(); ++j) {
      if (lineup[i] == lineup[j]) return true;
    }
  }
  return false;
}

bool to_lineup(const std::vector<PlayerId>& players, Lineup& out) {
  if (players.size() != kLineupSize) return false;
  std::copy(players.begin(), players.end(), out.begin());
  return true;
}

std::string side_name(TeamId team, const Roster& roster) {
  return team == roster.home_team_id() ? "home" : "away";
}
} // namespace

bool lineup_contains(const Lineup& lineup, PlayerId player) {
  return std::find(lineup.begin(), lineup.end(), player) != lineup.end();
}

bool validate_lineup_state(const LineupState& state, const Roster& roster, std::string& error) {
  const struct {
    const char* side;
    const Lineup& players;
    TeamId team;
  } sides[] = {{"home", state.home_players, state.home_team_id}, {"away", state.away_players, state.away_team_id}};

  for (const auto& side : sides) {
    if (has_duplicates(side.players)) {
      error = std::string(side.side) + " lineup repeats a player";
      return false;
    }
    for (PlayerId id : side.players) {
      if (!roster.belongs_to(id, side.team)) {
        error = std::string(side.side) + " lineup holds player " + std::to_string(id) + " not on team " +
                std::to_string(side.team);
        return false;
      }
    }
  }
  for (PlayerId id : state.home_players) {
    if (lineup_contains(state.away_players, id)) {
      error = "player " + std::to_string(id) + " is on both lineups";
      return false;
    }
  }
  return true;
}

TimelineBuilder::TimelineBuilder(const GameRecord& game,
                                 const Roster& roster,
                                 const LineupInferencer& inferencer,
                                 const std::vector<PlayerQuarterStatus>& patterns,
                                 const std::vector<QuarterBoundary>& boundaries,
                                 const std::vector<SubstitutionEvent>& substitutions)
    : game_(game),
      roster_(roster),
      inferencer_(inferencer),
      patterns_(patterns),
      boundaries_(boundaries),
      substitutions_(substitutions) {}

bool TimelineBuilder::build(std::vector<LineupState>& out, std::vector<Diagnostic>& diagnostics,
                            std::string& error) const {
  out.clear();
  std::vector<LineupState> timeline;

  Court court;
  if (!open_game(court, diagnostics, error)) return false;
  if (!emit(1, clock::period_start_clock(1), 0, court, timeline, error)) return false;

  std::set<int> periods;
  for (const auto& boundary : boundaries_) {
    if (boundary.period >= 1) periods.insert(boundary.period);
  }
  for (const auto& sub : substitutions_) {
    if (sub.period >= 1) periods.insert(sub.period);
  }

  size_t next = 0;
  for (int period : periods) {
    if (period > 1) {
      open_period(period, court, diagnostics);
      if (!emit(period, clock::period_start_clock(period), clock::period_start_elapsed(period), court, timeline,
                error)) {
        return false;
      }
    }

    // Substitutions are ordered by (period, elapsed); skip any stragglers from
    // a period < 1.
    while (next < substitutions_.size() && substitutions_[next].period < period) {
      const auto& sub = substitutions_[next++];
      diagnostics.push_back({DiagnosticKind::DataError, sub.action_number, sub.period,
                             "substitution outside any playable period ignored"});
    }

    // Events sharing an instant are applied together and produce one snapshot.
    while (next < substitutions_.size() && substitutions_[next].period == period) {
      std::vector<const SubstitutionEvent*> group;
      const int instant = substitutions_[next].elapsed_seconds;
      while (next < substitutions_.size() && substitutions_[next].period == period &&
             substitutions_[next].elapsed_seconds == instant) {
        group.push_back(&substitutions_[next++]);
      }
      apply_group(group, court, diagnostics);
      if (!emit(period, group.back()->clock, instant, court, timeline, error)) return false;
    }
  }

  out = std::move(timeline);
  return true;
}

bool TimelineBuilder::open_game(Court& court, std::vector<Diagnostic>& diagnostics, std::string& error) const {
  const PeriodLineupInference opening = inferencer_.infer(1, patterns_);
  const struct {
    const TeamLineupInference& inferred;
    Lineup& lineup;
  } teams[] = {{opening.home, court.home}, {opening.away, court.away}};

  for (const auto& team : teams) {
    const TeamId team_id = team.inferred.team_id;
    if (to_lineup(team.inferred.players, team.lineup)) {
      continue;
    }
    const auto starters = roster_.nominal_starters(team_id);
    if (!to_lineup(starters, team.lineup)) {
      error = side_name(team_id, roster_) + " team " + std::to_string(team_id) + " has " +
              std::to_string(starters.size()) + " starters, expected 5";
      return false;
    }
    diagnostics.push_back({DiagnosticKind::LineupFallback, 0, 1,
                           side_name(team_id, roster_) + " opening lineup taken from box-score starters"});
  }
  return true;
}

void TimelineBuilder::open_period(int period, Court& court, std::vector<Diagnostic>& diagnostics) const {
  const PeriodLineupInference inferred = inferencer_.infer(period, patterns_);
  const struct {
    const TeamLineupInference& inferred;
    Lineup& lineup;
  } teams[] = {{inferred.home, court.home}, {inferred.away, court.away}};

  for (const auto& team : teams) {
    if (to_lineup(team.inferred.players, team.lineup)) {
      continue;
    }
    diagnostics.push_back({DiagnosticKind::LineupFallback, 0, period,
                           side_name(team.inferred.team_id, roster_) + " lineup carried over into period " +
                               std::to_string(period)});
  }

  if (log::verbose()) {
    std::string line = "period " + std::to_string(period) + " opens with home [";
    for (size_t i = 0; i < court.home.size(); ++i) {
      line += (i ? ", " : "") + roster_.display_name(court.home[i]);
    }
    line += "] away [";
    for (size_t i = 0; i < court.away.size(); ++i) {
      line += (i ? ", " : "") + roster_.display_name(court.away[i]);
    }
    log::debug(line + "]");
  }
}

Lineup* TimelineBuilder::lineup_for(TeamId team, Court& court) const {
  if (team == roster_.home_team_id()) return &court.home;
  if (team == roster_.away_team_id()) return &court.away;
  return nullptr;
}

void TimelineBuilder::apply_group(const std::vector<const SubstitutionEvent*>& group, Court& court,
                                  std::vector<Diagnostic>& diagnostics) const {
  std::vector<const SubstitutionEvent*> pending;
  for (const auto* sub : group) {
    if (!lineup_for(sub->team_id, court)) {
      diagnostics.push_back({DiagnosticKind::UnknownTeam, sub->action_number, sub->period,
                             "substitution for unknown team " + std::to_string(sub->team_id)});
      continue;
    }
    pending.push_back(sub);
  }

  // An event can depend on another one at the same instant (B in for A, then
  // C in for B), so blocked events are retried until nothing moves.
  bool progress = true;
  while (!pending.empty() && progress) {
    progress = false;
    for (auto it = pending.begin(); it != pending.end();) {
      const SubstitutionEvent& sub = **it;
      Lineup& lineup = *lineup_for(sub.team_id, court);
      auto slot = std::find(lineup.begin(), lineup.end(), sub.player_out_id);
      if (slot != lineup.end() && !lineup_contains(lineup, sub.player_in_id)) {
        *slot = sub.player_in_id;
        it = pending.erase(it);
        progress = true;
      } else {
        ++it;
      }
    }
  }

  for (const auto* sub : pending) {
    const Lineup& lineup = *lineup_for(sub->team_id, court);
    if (lineup_contains(lineup, sub->player_in_id)) {
      diagnostics.push_back({DiagnosticKind::IncomingAlreadyOnCourt, sub->action_number, sub->period,
                             sub->player_in_name + " already in " + side_name(sub->team_id, roster_) +
                                 " lineup: " + sub->description});
    } else {
      diagnostics.push_back({DiagnosticKind::OutgoingNotOnCourt, sub->action_number, sub->period,
                             roster_.display_name(sub->player_out_id) + " (" + std::to_string(sub->player_out_id) +
                                 ") not in current " + side_name(sub->team_id, roster_) + " lineup: " +
                                 sub->description});
    }
  }
}

bool TimelineBuilder::emit(int period, const std::string& clock, int elapsed, const Court& court,
                           std::vector<LineupState>& out, std::string& error) const {
  LineupState state;
  state.game_id = game_.game_id;
  state.period = period;
  state.clock = clock;
  state.elapsed_seconds = elapsed;
  state.home_team_id = roster_.home_team_id();
  state.away_team_id = roster_.away_team_id();
  state.home_players = court.home;
  state.away_players = court.away;

  std::string why;
  if (!validate_lineup_state(state, roster_, why)) {
    error = "invariant violation at period " + std::to_string(period) + " elapsed " + std::to_string(elapsed) +
            ": " + why;
    return false;
  }
  if (!out.empty() && out.back().elapsed_seconds > elapsed) {
    error = "invariant violation: elapsed seconds go back from " + std::to_string(out.back().elapsed_seconds) +
            " to " + std::to_string(elapsed);
    return false;
  }
  out.push_back(std::move(state));
  return true;
}

const LineupState* find_state_at(const std::vector<LineupState>& timeline, int target_elapsed) {
  if (timeline.empty()) return nullptr;
  const LineupState* current = &timeline.front();
  for (const auto& state : timeline) {
    if (state.elapsed_seconds <= target_elapsed) {
      current = &state;
    } else {
      break;
    }
  }
  return current;
}

} // namespace courtline
