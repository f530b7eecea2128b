#include "courtline/substitutions.h"

#include "courtline/clock.h"

#include <algorithm>
#include <regex>

namespace courtline {

namespace {
constexpr const char* kSubstitutionType = "Substitution";

std::string trim(const std::string& text) {
  const size_t begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const size_t end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}
} // namespace

bool parse_substitution_description(std::string_view description, std::string& incoming, std::string& outgoing) {
  static const std::regex kPattern(R"(SUB:\s*(.+?)\s+FOR\s+(.+))");
  const std::string text(description);
  std::smatch match;
  if (!std::regex_search(text, match, kPattern, std::regex_constants::match_continuous)) {
    return false;
  }
  incoming = trim(match[1].str());
  outgoing = trim(match[2].str());
  return !incoming.empty();
}

std::vector<SubstitutionEvent> parse_substitutions(const GameRecord& game,
                                                   const PlayerNameResolver& resolver,
                                                   std::vector<Diagnostic>& diagnostics,
                                                   bool suppress_resolution_warnings) {
  std::vector<SubstitutionEvent> events;

  for (const auto& action : game.actions) {
    if (action.action_type != kSubstitutionType) continue;

    if (!action.team_id.has_value() || !action.person_id.has_value()) {
      diagnostics.push_back({DiagnosticKind::DataError, action.action_number, action.period,
                             "substitution without team or outgoing player: " + action.description});
      continue;
    }

    std::string incoming_name;
    std::string outgoing_name;
    if (!parse_substitution_description(action.description, incoming_name, outgoing_name)) {
      diagnostics.push_back({DiagnosticKind::UnparsedSubstitution, action.action_number, action.period,
                             "could not parse substitution description: " + action.description});
      continue;
    }

    const TeamId team = action.team_id.value();
    const auto incoming_id = resolver.resolve(incoming_name, team, suppress_resolution_warnings);
    if (!incoming_id.has_value()) {
      diagnostics.push_back({DiagnosticKind::ResolutionMiss, action.action_number, action.period,
                             "could not find player '" + incoming_name + "' on team " + std::to_string(team)});
      continue;
    }

    int elapsed = 0;
    if (!clock::to_elapsed(action.period, action.clock, elapsed)) {
      diagnostics.push_back({DiagnosticKind::FormatError, action.action_number, action.period,
                             "invalid clock '" + action.clock + "', treating as end of period"});
      elapsed = clock::period_end_elapsed(std::max(action.period, 1));
    }

    SubstitutionEvent event;
    event.game_id = game.game_id;
    event.action_number = action.action_number;
    event.period = action.period;
    event.clock = action.clock;
    event.elapsed_seconds = elapsed;
    event.team_id = team;
    event.player_out_id = action.person_id.value();
    event.player_out_name = action.player_name.empty() ? outgoing_name : action.player_name;
    event.player_in_id = incoming_id.value();
    event.player_in_name = incoming_name;
    event.description = action.description;
    events.push_back(std::move(event));
  }

  std::stable_sort(events.begin(), events.end(), [](const SubstitutionEvent& a, const SubstitutionEvent& b) {
    if (a.period != b.period) return a.period < b.period;
    return a.elapsed_seconds < b.elapsed_seconds;
  });
  return events;
}

} // namespace courtline
