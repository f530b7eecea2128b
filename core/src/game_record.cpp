#include "courtline/game_record.h"

#include "courtline/clock.h"
#include "courtline/log.h"

#include <charconv>
#include <fstream>
#include <initializer_list>

namespace courtline {

namespace {
using json = nlohmann::json;

const json* find_field(const json& obj, std::initializer_list<const char*> keys) {
  if (!obj.is_object()) return nullptr;
  for (const char* key : keys) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null()) {
      return &*it;
    }
  }
  return nullptr;
}

std::string string_field(const json& obj, std::initializer_list<const char*> keys) {
  const json* v = find_field(obj, keys);
  if (!v) return {};
  if (v->is_string()) return v->get<std::string>();
  if (v->is_number()) return v->dump();
  return {};
}

std::optional<int64_t> int_field(const json& obj, std::initializer_list<const char*> keys) {
  const json* v = find_field(obj, keys);
  if (!v) return std::nullopt;
  if (v->is_number_integer()) {
    return v->get<int64_t>();
  }
  if (v->is_string()) {
    const auto& text = v->get_ref<const std::string&>();
    int64_t value = 0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, value);
    if (result.ec == std::errc() && result.ptr == end && !text.empty()) {
      return value;
    }
  }
  return std::nullopt;
}

// Provider records use 0 for "no team" / "no person".
std::optional<int64_t> optional_id(const json& obj, std::initializer_list<const char*> keys) {
  auto id = int_field(obj, keys);
  if (id.has_value() && id.value() == 0) return std::nullopt;
  return id;
}

bool parse_team(const json& team_json, const char* label, TeamRecord& out, std::string& error) {
  if (!team_json.is_object()) {
    error = std::string("structural: ") + label + " missing";
    return false;
  }
  const auto team_id = int_field(team_json, {"id", "team_id", "teamId"});
  if (!team_id.has_value()) {
    error = std::string("structural: ") + label + ".id missing";
    return false;
  }
  out.id = team_id.value();

  const json* players = find_field(team_json, {"players"});
  if (!players || !players->is_array()) {
    error = std::string("structural: ") + label + ".players missing";
    return false;
  }
  out.players.clear();
  size_t index = 0;
  for (const auto& p : *players) {
    const auto person_id = int_field(p, {"person_id", "personId", "id"});
    if (!person_id.has_value()) {
      error = std::string("structural: ") + label + ".players[" + std::to_string(index) + "].person_id missing";
      return false;
    }
    PlayerRecord player;
    player.person_id = person_id.value();
    player.first_name = string_field(p, {"first_name", "firstName"});
    player.family_name = string_field(p, {"family_name", "familyName"});
    player.display_name = string_field(p, {"display_name", "nameI", "playerName"});
    player.jersey = string_field(p, {"jersey", "jersey_num", "jerseyNum"});
    player.position = string_field(p, {"position"});
    if (const json* stats = find_field(p, {"statistics"})) {
      player.minutes = string_field(*stats, {"minutes"});
    }
    out.players.push_back(std::move(player));
    ++index;
  }
  return true;
}

const json* find_actions(const json& page, const json& game) {
  if (const json* actions = find_field(game, {"actions"})) return actions;
  if (const json* actions = find_field(page, {"actions"})) return actions;
  for (const char* key : {"playByPlay", "play_by_play"}) {
    if (const json* pbp = find_field(page, {key})) {
      if (const json* actions = find_field(*pbp, {"actions"})) return actions;
    }
    if (const json* pbp = find_field(game, {key})) {
      if (const json* actions = find_field(*pbp, {"actions"})) return actions;
    }
  }
  return nullptr;
}
} // namespace

bool parse_game_record(const json& doc, GameRecord& out, std::string& error) {
  if (!doc.is_object()) {
    error = "structural: game record is not an object";
    return false;
  }

  const json* page = &doc;
  if (const json* props = find_field(doc, {"props"})) {
    if (const json* page_props = find_field(*props, {"pageProps"})) {
      page = page_props;
    }
  }
  const json* game = page;
  if (const json* nested = find_field(*page, {"game"}); nested && nested->is_object()) {
    game = nested;
  }

  GameRecord record;
  record.game_id = string_field(*game, {"game_id", "gameId"});

  const json* home = find_field(*game, {"home_team", "homeTeam"});
  const json* away = find_field(*game, {"away_team", "awayTeam"});
  if (!home) {
    error = "structural: home_team missing";
    return false;
  }
  if (!away) {
    error = "structural: away_team missing";
    return false;
  }
  if (!parse_team(*home, "home_team", record.home_team, error)) return false;
  if (!parse_team(*away, "away_team", record.away_team, error)) return false;
  if (record.home_team.id == record.away_team.id) {
    error = "structural: home and away team ids are equal (" + std::to_string(record.home_team.id) + ")";
    return false;
  }

  const json* actions = find_actions(*page, *game);
  if (!actions || !actions->is_array()) {
    error = "structural: actions missing";
    return false;
  }
  record.actions.reserve(actions->size());
  size_t index = 0;
  for (const auto& a : *actions) {
    const auto action_number = int_field(a, {"action_number", "actionNumber"});
    const auto period = int_field(a, {"period"});
    if (!action_number.has_value() || !period.has_value()) {
      error = "structural: actions[" + std::to_string(index) + "] lacks action_number or period";
      return false;
    }
    if (period.value() < 0 || period.value() > clock::kMaxPeriod) {
      error = "structural: actions[" + std::to_string(index) + "] period " + std::to_string(period.value()) +
              " out of range";
      return false;
    }
    ActionRecord action;
    action.action_number = action_number.value();
    action.period = static_cast<int>(period.value());
    action.clock = string_field(a, {"clock"});
    action.team_id = optional_id(a, {"team_id", "teamId"});
    action.person_id = optional_id(a, {"person_id", "personId"});
    action.player_name = string_field(a, {"player_name", "playerName"});
    action.action_type = string_field(a, {"action_type", "actionType"});
    action.description = string_field(a, {"description"});
    record.actions.push_back(std::move(action));
    ++index;
  }

  out = std::move(record);
  return true;
}

bool load_game_record(const std::filesystem::path& path, GameRecord& out, std::string& error) {
  std::ifstream in(path);
  if (!in) {
    error = "game file not found: " + path.string();
    return false;
  }
  json doc;
  try {
    in >> doc;
  } catch (const std::exception& e) {
    error = std::string("game file parse failed: ") + e.what();
    return false;
  }
  if (!parse_game_record(doc, out, error)) {
    log::warn("game record rejected: " + error);
    return false;
  }
  return true;
}

} // namespace courtline
