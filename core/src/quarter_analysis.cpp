#include "courtline/quarter_analysis.h"

#include "courtline/clock.h"

#include <map>

namespace courtline {

std::vector<QuarterBoundary> analyze_quarter_boundaries(const std::vector<ActionRecord>& actions) {
  std::map<int, QuarterBoundary> by_period;
  for (const auto& action : actions) {
    auto it = by_period.find(action.period);
    if (it == by_period.end()) {
      by_period[action.period] = {action.period, action.action_number, action.action_number};
      continue;
    }
    it->second.last_action_number = action.action_number;
  }
  std::vector<QuarterBoundary> out;
  out.reserve(by_period.size());
  for (const auto& kv : by_period) {
    out.push_back(kv.second);
  }
  return out;
}

const char* sub_direction_name(SubDirection direction) {
  switch (direction) {
    case SubDirection::In: return "IN";
    case SubDirection::Out: return "OUT";
    case SubDirection::None: break;
  }
  return "NONE";
}

const char* quarter_status_name(QuarterStatus status) {
  switch (status) {
    case QuarterStatus::Started: return "STARTED";
    case QuarterStatus::Benched: return "BENCHED";
    case QuarterStatus::PlayedFull: return "PLAYED_FULL";
  }
  return "BENCHED";
}

std::vector<std::string> default_on_court_action_types() {
  return {"Made Shot", "Missed Shot", "Rebound", "Foul", "Free Throw",
          "Turnover", "Jump Ball", "Assist", "Block", "Steal"};
}

QuarterPatternAnalyzer::QuarterPatternAnalyzer(const GameRecord& game,
                                               const Roster& roster,
                                               const std::vector<SubstitutionEvent>& substitutions,
                                               const std::vector<QuarterBoundary>& boundaries,
                                               std::vector<std::string> on_court_action_types)
    : game_(game),
      roster_(roster),
      substitutions_(substitutions),
      boundaries_(boundaries),
      on_court_types_(on_court_action_types.begin(), on_court_action_types.end()) {}

std::vector<PlayerQuarterStatus> QuarterPatternAnalyzer::analyze() const {
  std::vector<PlayerQuarterStatus> out;
  for (const auto& boundary : boundaries_) {
    if (boundary.period < 1 || boundary.period > clock::kRegulationPeriods) continue;
    for (const auto& player : roster_.players()) {
      out.push_back(classify(player.id, boundary.period));
    }
  }
  return out;
}

PlayerQuarterStatus QuarterPatternAnalyzer::classify(PlayerId player, int period) const {
  PlayerQuarterStatus status;
  status.player_id = player;
  status.period = period;
  status.on_court_action_count = on_court_action_count(player, period);

  const SubstitutionEvent* first_in = nullptr;
  const SubstitutionEvent* first_out = nullptr;
  for (const auto& sub : substitutions_) {
    if (sub.period != period) continue;
    if (!first_in && sub.player_in_id == player) first_in = &sub;
    if (!first_out && sub.player_out_id == player) first_out = &sub;
    if (first_in && first_out) break;
  }

  const SubstitutionEvent* first = nullptr;
  if (first_in && first_out) {
    first = first_out->action_number < first_in->action_number ? first_out : first_in;
  } else if (first_in) {
    first = first_in;
  } else if (first_out) {
    first = first_out;
  }

  if (first) {
    status.first_sub_type = first == first_out ? SubDirection::Out : SubDirection::In;
    status.first_sub_action = first->action_number;
    status.inferred_status =
        status.first_sub_type == SubDirection::Out ? QuarterStatus::Started : QuarterStatus::Benched;
    return status;
  }

  status.inferred_status = status.on_court_action_count > 0 ? QuarterStatus::PlayedFull : QuarterStatus::Benched;
  return status;
}

int QuarterPatternAnalyzer::on_court_action_count(PlayerId player, int period) const {
  int count = 0;
  for (const auto& action : game_.actions) {
    if (action.period != period || action.person_id != player) continue;
    if (on_court_types_.count(action.action_type) != 0) {
      ++count;
    }
  }
  return count;
}

} // namespace courtline
