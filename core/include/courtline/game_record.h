#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace courtline {

using PlayerId = int64_t;
using TeamId = int64_t;

struct PlayerRecord {
  PlayerId person_id = 0;
  std::string first_name;
  std::string family_name;
  std::string display_name;
  std::string jersey;
  std::string position;
  std::string minutes; // "MM:SS" from the box score, may be empty
};

struct TeamRecord {
  TeamId id = 0;
  std::vector<PlayerRecord> players;
};

struct ActionRecord {
  int64_t action_number = 0;
  int period = 0;
  std::string clock;
  std::optional<TeamId> team_id;
  std::optional<PlayerId> person_id;
  std::string player_name;
  std::string action_type;
  std::string description;
};

struct GameRecord {
  std::string game_id;
  TeamRecord home_team;
  TeamRecord away_team;
  std::vector<ActionRecord> actions;
};

// Decodes either the provider page document (props.pageProps.game +
// playByPlay.actions) or an unwrapped record. Field names are accepted in
// snake_case or the provider's camelCase. Returns false with a structural
// error when a required field is absent or has the wrong type.
bool parse_game_record(const nlohmann::json& doc, GameRecord& out, std::string& error);
bool load_game_record(const std::filesystem::path& path, GameRecord& out, std::string& error);

} // namespace courtline
