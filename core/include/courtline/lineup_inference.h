#pragma once

#include "courtline/quarter_analysis.h"
#include "courtline/roster.h"

#include <vector>

namespace courtline {

struct TeamLineupInference {
  TeamId team_id = 0;
  std::vector<PlayerId> players; // at most 5; fewer only when the roster is short
  size_t from_patterns = 0;
  size_t from_backfill = 0;

  bool complete() const { return players.size() == kLineupSize; }
};

struct PeriodLineupInference {
  int period = 0;
  TeamLineupInference home;
  TeamLineupInference away;
};

class LineupInferencer {
 public:
  LineupInferencer(const Roster& roster, int backfill_min_seconds = 300);
  virtual ~LineupInferencer() = default;

  // Both teams for one period. A period without patterns (overtime) is filled
  // by backfill alone.
  virtual PeriodLineupInference infer(int period, const std::vector<PlayerQuarterStatus>& patterns) const;
  TeamLineupInference infer_team(TeamId team, int period, const std::vector<PlayerQuarterStatus>& patterns) const;

 private:
  void backfill(TeamLineupInference& lineup) const;

  const Roster& roster_;
  int backfill_min_seconds_ = 300;
};

} // namespace courtline
