#include "courtline/result_json.h"

#include <algorithm>

namespace courtline {

namespace {
nlohmann::json lineup_json(const Lineup& lineup) {
  nlohmann::json out = nlohmann::json::array();
  for (PlayerId id : lineup) {
    out.push_back(id);
  }
  return out;
}

LineupRow make_row(const LineupState& state, TeamId team, const Lineup& players, const char* side) {
  LineupRow row;
  row.game_id = state.game_id;
  row.period = state.period;
  row.clock = state.clock;
  row.elapsed_seconds = state.elapsed_seconds;
  row.team_id = team;
  row.players = players;
  std::sort(row.players.begin(), row.players.end());
  row.lineup_hash = state.game_id + "_" + std::to_string(state.period) + "_" +
                    std::to_string(state.elapsed_seconds) + "_" + side;
  return row;
}

nlohmann::json players_json(const std::vector<OnCourtPlayer>& players) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& p : players) {
    out.push_back({{"id", p.id}, {"name", p.name}});
  }
  return out;
}
} // namespace

std::vector<LineupRow> lineup_rows(const std::vector<LineupState>& timeline) {
  std::vector<LineupRow> rows;
  rows.reserve(timeline.size() * 2);
  for (const auto& state : timeline) {
    rows.push_back(make_row(state, state.home_team_id, state.home_players, "home"));
    rows.push_back(make_row(state, state.away_team_id, state.away_players, "away"));
  }
  return rows;
}

nlohmann::json to_json(const LineupState& state) {
  return {{"game_id", state.game_id},
          {"period", state.period},
          {"clock", state.clock},
          {"elapsed_seconds", state.elapsed_seconds},
          {"home_team_id", state.home_team_id},
          {"away_team_id", state.away_team_id},
          {"home_players", lineup_json(state.home_players)},
          {"away_players", lineup_json(state.away_players)}};
}

nlohmann::json to_json(const SubstitutionEvent& event) {
  return {{"game_id", event.game_id},
          {"action_number", event.action_number},
          {"period", event.period},
          {"clock", event.clock},
          {"elapsed_seconds", event.elapsed_seconds},
          {"team_id", event.team_id},
          {"player_out_id", event.player_out_id},
          {"player_out_name", event.player_out_name},
          {"player_in_id", event.player_in_id},
          {"player_in_name", event.player_in_name},
          {"description", event.description}};
}

nlohmann::json to_json(const QuarterBoundary& boundary) {
  return {{"period", boundary.period},
          {"first_action_number", boundary.first_action_number},
          {"last_action_number", boundary.last_action_number}};
}

nlohmann::json to_json(const PlayerQuarterStatus& status) {
  nlohmann::json out = {{"player_id", status.player_id},
                        {"period", status.period},
                        {"first_sub_type", sub_direction_name(status.first_sub_type)},
                        {"first_sub_action", nullptr},
                        {"on_court_action_count", status.on_court_action_count},
                        {"inferred_status", quarter_status_name(status.inferred_status)}};
  if (status.first_sub_action.has_value()) {
    out["first_sub_action"] = *status.first_sub_action;
  }
  return out;
}

nlohmann::json to_json(const Diagnostic& diagnostic) {
  return {{"kind", diagnostic_kind_name(diagnostic.kind)},
          {"action_number", diagnostic.action_number},
          {"period", diagnostic.period},
          {"message", diagnostic.message}};
}

nlohmann::json to_json(const LineupRow& row) {
  nlohmann::json out = {{"game_id", row.game_id},
                        {"period", row.period},
                        {"clock", row.clock},
                        {"elapsed_seconds", row.elapsed_seconds},
                        {"team_id", row.team_id}};
  for (size_t i = 0; i < row.players.size(); ++i) {
    out["player_" + std::to_string(i + 1) + "_id"] = row.players[i];
  }
  out["lineup_hash"] = row.lineup_hash;
  return out;
}

nlohmann::json to_json(const OnCourtResult& result) {
  return {{"game_id", result.game_id},
          {"period", result.period},
          {"clock", result.clock},
          {"elapsed_seconds", result.elapsed_seconds},
          {"state", {{"period", result.state_period},
                     {"clock", result.state_clock},
                     {"elapsed_seconds", result.state_elapsed_seconds}}},
          {"home_team_id", result.home_team_id},
          {"away_team_id", result.away_team_id},
          {"home_players", players_json(result.home)},
          {"away_players", players_json(result.away)}};
}

nlohmann::json tracking_result_json(const TrackingResult& result) {
  nlohmann::json doc;
  doc["game_id"] = result.game_id;
  doc["home_team_id"] = result.home_team_id;
  doc["away_team_id"] = result.away_team_id;

  auto& timeline = doc["timeline"] = nlohmann::json::array();
  for (const auto& state : result.timeline) timeline.push_back(to_json(state));

  auto& rows = doc["lineup_rows"] = nlohmann::json::array();
  for (const auto& row : lineup_rows(result.timeline)) rows.push_back(to_json(row));

  auto& subs = doc["substitutions"] = nlohmann::json::array();
  for (const auto& event : result.substitutions) subs.push_back(to_json(event));

  auto& boundaries = doc["quarter_boundaries"] = nlohmann::json::array();
  for (const auto& boundary : result.boundaries) boundaries.push_back(to_json(boundary));

  auto& patterns = doc["quarter_patterns"] = nlohmann::json::array();
  for (const auto& status : result.quarter_patterns) patterns.push_back(to_json(status));

  auto& diagnostics = doc["diagnostics"] = nlohmann::json::array();
  for (const auto& d : result.diagnostics) diagnostics.push_back(to_json(d));

  // Kinds listed in declaration order so the summary is stable.
  const DiagnosticKind kinds[] = {DiagnosticKind::FormatError,         DiagnosticKind::DataError,
                                  DiagnosticKind::ResolutionMiss,      DiagnosticKind::UnparsedSubstitution,
                                  DiagnosticKind::OutgoingNotOnCourt,  DiagnosticKind::IncomingAlreadyOnCourt,
                                  DiagnosticKind::UnknownTeam,         DiagnosticKind::LineupFallback};
  auto& counts = doc["diagnostic_counts"] = nlohmann::json::object();
  for (DiagnosticKind kind : kinds) {
    counts[diagnostic_kind_name(kind)] = count_diagnostics(result.diagnostics, kind);
  }
  doc["dropped_substitutions"] = result.dropped_substitutions;
  doc["lossy_diagnostics"] = result.lossy_count();
  return doc;
}

} // namespace courtline
