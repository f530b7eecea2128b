#pragma once

#include "courtline/diagnostics.h"
#include "courtline/game_record.h"
#include "courtline/name_resolver.h"

#include <string>
#include <string_view>
#include <vector>

namespace courtline {

struct SubstitutionEvent {
  std::string game_id;
  int64_t action_number = 0;
  int period = 0;
  std::string clock;
  int elapsed_seconds = 0;
  TeamId team_id = 0;
  PlayerId player_out_id = 0;
  std::string player_out_name;
  PlayerId player_in_id = 0;
  std::string player_in_name;
  std::string description;
};

// "SUB: Brooks FOR Ward" -> incoming "Brooks", outgoing "Ward".
bool parse_substitution_description(std::string_view description, std::string& incoming, std::string& outgoing);

// Every resolvable "Substitution" action, ordered by (period, elapsed_seconds)
// with input order kept for ties. Actions whose incoming player cannot be
// resolved are dropped and reported as ResolutionMiss.
std::vector<SubstitutionEvent> parse_substitutions(const GameRecord& game,
                                                   const PlayerNameResolver& resolver,
                                                   std::vector<Diagnostic>& diagnostics,
                                                   bool suppress_resolution_warnings = true);

} // namespace courtline
