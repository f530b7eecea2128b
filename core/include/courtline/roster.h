#pragma once

#include "courtline/diagnostics.h"
#include "courtline/game_record.h"

#include <map>
#include <string>
#include <vector>

namespace courtline {

constexpr size_t kLineupSize = 5;

struct Player {
  PlayerId id = 0;
  std::string first_name;
  std::string family_name;
  std::string display_name;
  std::string jersey;
  std::string position;
  TeamId team_id = 0;
  bool is_starter = false;
  int minutes_played = 0; // seconds
};

class Roster {
 public:
  // Fails on a duplicate player id. Unparseable minutes count as 0 and are
  // reported through `diagnostics`.
  bool build(const GameRecord& game, std::vector<Diagnostic>& diagnostics, std::string& error);

  const Player* find(PlayerId id) const;
  bool belongs_to(PlayerId id, TeamId team) const;
  std::string display_name(PlayerId id) const;

  // Team players in input order.
  std::vector<const Player*> team_players(TeamId team) const;
  std::vector<PlayerId> nominal_starters(TeamId team) const;

  const std::vector<Player>& players() const { return players_; }
  TeamId home_team_id() const { return home_team_id_; }
  TeamId away_team_id() const { return away_team_id_; }

 private:
  bool add_team(const TeamRecord& team, std::vector<Diagnostic>& diagnostics, std::string& error);

  std::vector<Player> players_;
  std::map<PlayerId, size_t> index_by_id_;
  TeamId home_team_id_ = 0;
  TeamId away_team_id_ = 0;
};

} // namespace courtline
