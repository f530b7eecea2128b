#pragma once

#include "courtline/diagnostics.h"
#include "courtline/game_record.h"
#include "courtline/lineup_inference.h"
#include "courtline/quarter_analysis.h"
#include "courtline/roster.h"
#include "courtline/substitutions.h"

#include <array>
#include <string>
#include <vector>

namespace courtline {

using Lineup = std::array<PlayerId, kLineupSize>;

struct LineupState {
  std::string game_id;
  int period = 0;
  std::string clock;
  int elapsed_seconds = 0;
  TeamId home_team_id = 0;
  TeamId away_team_id = 0;
  Lineup home_players{};
  Lineup away_players{};
};

bool lineup_contains(const Lineup& lineup, PlayerId player);

// Five distinct players per side, sides disjoint, every id on the stated team.
bool validate_lineup_state(const LineupState& state, const Roster& roster, std::string& error);

class TimelineBuilder {
 public:
  TimelineBuilder(const GameRecord& game,
                  const Roster& roster,
                  const LineupInferencer& inferencer,
                  const std::vector<PlayerQuarterStatus>& patterns,
                  const std::vector<QuarterBoundary>& boundaries,
                  const std::vector<SubstitutionEvent>& substitutions);

  // Fails when no opening lineup can be formed or a state would break the
  // lineup invariants; `out` is left empty in that case.
  bool build(std::vector<LineupState>& out, std::vector<Diagnostic>& diagnostics, std::string& error) const;

 private:
  struct Court {
    Lineup home{};
    Lineup away{};
  };

  bool open_game(Court& court, std::vector<Diagnostic>& diagnostics, std::string& error) const;
  void open_period(int period, Court& court, std::vector<Diagnostic>& diagnostics) const;
  void apply_group(const std::vector<const SubstitutionEvent*>& group, Court& court,
                   std::vector<Diagnostic>& diagnostics) const;
  bool emit(int period, const std::string& clock, int elapsed, const Court& court,
            std::vector<LineupState>& out, std::string& error) const;
  Lineup* lineup_for(TeamId team, Court& court) const;

  const GameRecord& game_;
  const Roster& roster_;
  const LineupInferencer& inferencer_;
  const std::vector<PlayerQuarterStatus>& patterns_;
  const std::vector<QuarterBoundary>& boundaries_;
  const std::vector<SubstitutionEvent>& substitutions_;
};

// Latest state at or before `target_elapsed`; the first state when the target
// precedes every state. nullptr only for an empty timeline.
const LineupState* find_state_at(const std::vector<LineupState>& timeline, int target_elapsed);

} // namespace courtline
