#pragma once

#include "courtline/game_record.h"
#include "courtline/roster.h"
#include "courtline/substitutions.h"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace courtline {

struct QuarterBoundary {
  int period = 0;
  int64_t first_action_number = 0;
  int64_t last_action_number = 0;
};

// One pass over the log; one entry per distinct period, ascending.
std::vector<QuarterBoundary> analyze_quarter_boundaries(const std::vector<ActionRecord>& actions);

enum class SubDirection { None, In, Out };
enum class QuarterStatus { Started, Benched, PlayedFull };

const char* sub_direction_name(SubDirection direction);
const char* quarter_status_name(QuarterStatus status);

struct PlayerQuarterStatus {
  PlayerId player_id = 0;
  int period = 0;
  SubDirection first_sub_type = SubDirection::None;
  std::optional<int64_t> first_sub_action;
  int on_court_action_count = 0;
  QuarterStatus inferred_status = QuarterStatus::Benched;
};

std::vector<std::string> default_on_court_action_types();

// Infers who began each regulation period on the floor. A player whose first
// substitution in the period is an exit started it on court; one whose first
// substitution is an entry started it on the bench.
class QuarterPatternAnalyzer {
 public:
  QuarterPatternAnalyzer(const GameRecord& game,
                         const Roster& roster,
                         const std::vector<SubstitutionEvent>& substitutions,
                         const std::vector<QuarterBoundary>& boundaries,
                         std::vector<std::string> on_court_action_types = default_on_court_action_types());

  // Every roster player for every regulation period with a boundary, ordered
  // by period then roster order.
  std::vector<PlayerQuarterStatus> analyze() const;
  PlayerQuarterStatus classify(PlayerId player, int period) const;

 private:
  int on_court_action_count(PlayerId player, int period) const;

  const GameRecord& game_;
  const Roster& roster_;
  const std::vector<SubstitutionEvent>& substitutions_;
  const std::vector<QuarterBoundary>& boundaries_;
  std::set<std::string> on_court_types_;
};

} // namespace courtline
