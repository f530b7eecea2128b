#include "courtline/lineup_inference.h"

#include <algorithm>

namespace courtline {

LineupInferencer::LineupInferencer(const Roster& roster, int backfill_min_seconds)
    : roster_(roster), backfill_min_seconds_(backfill_min_seconds) {}

PeriodLineupInference LineupInferencer::infer(int period, const std::vector<PlayerQuarterStatus>& patterns) const {
  PeriodLineupInference out;
  out.period = period;
  out.home = infer_team(roster_.home_team_id(), period, patterns);
  out.away = infer_team(roster_.away_team_id(), period, patterns);
  return out;
}

TeamLineupInference LineupInferencer::infer_team(TeamId team, int period,
                                                 const std::vector<PlayerQuarterStatus>& patterns) const {
  TeamLineupInference lineup;
  lineup.team_id = team;

  std::vector<const PlayerQuarterStatus*> candidates;
  for (const auto& status : patterns) {
    if (status.period != period) continue;
    if (status.inferred_status != QuarterStatus::Started && status.inferred_status != QuarterStatus::PlayedFull) {
      continue;
    }
    if (!roster_.belongs_to(status.player_id, team)) continue;
    candidates.push_back(&status);
  }
  // More recorded actions means more confidence the player opened the period.
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const PlayerQuarterStatus* a, const PlayerQuarterStatus* b) {
                     return a->on_court_action_count > b->on_court_action_count;
                   });
  for (const auto* status : candidates) {
    if (lineup.players.size() == kLineupSize) break;
    lineup.players.push_back(status->player_id);
  }
  lineup.from_patterns = lineup.players.size();

  if (lineup.players.size() < kLineupSize) {
    backfill(lineup);
  }
  if (lineup.players.size() > kLineupSize) {
    lineup.players.resize(kLineupSize);
  }
  return lineup;
}

void LineupInferencer::backfill(TeamLineupInference& lineup) const {
  std::vector<const Player*> pool;
  for (const Player* player : roster_.team_players(lineup.team_id)) {
    if (std::find(lineup.players.begin(), lineup.players.end(), player->id) == lineup.players.end()) {
      pool.push_back(player);
    }
  }
  const int threshold = backfill_min_seconds_;
  std::stable_sort(pool.begin(), pool.end(), [threshold](const Player* a, const Player* b) {
    const bool a_regular = a->minutes_played > threshold;
    const bool b_regular = b->minutes_played > threshold;
    if (a_regular != b_regular) return a_regular;
    return a->minutes_played > b->minutes_played;
  });
  for (const Player* player : pool) {
    if (lineup.players.size() == kLineupSize) break;
    lineup.players.push_back(player->id);
    ++lineup.from_backfill;
  }
}

} // namespace courtline
