#include "courtline/roster.h"

#include "courtline/clock.h"

#include <algorithm>

namespace courtline {

bool Roster::build(const GameRecord& game, std::vector<Diagnostic>& diagnostics, std::string& error) {
  players_.clear();
  index_by_id_.clear();
  home_team_id_ = game.home_team.id;
  away_team_id_ = game.away_team.id;
  if (!add_team(game.home_team, diagnostics, error)) return false;
  if (!add_team(game.away_team, diagnostics, error)) return false;
  return true;
}

bool Roster::add_team(const TeamRecord& team, std::vector<Diagnostic>& diagnostics, std::string& error) {
  std::vector<size_t> starter_pool;

  for (const auto& record : team.players) {
    if (index_by_id_.count(record.person_id) != 0) {
      const Player& existing = players_[index_by_id_[record.person_id]];
      error = "data: player id " + std::to_string(record.person_id) + " appears on team " +
              std::to_string(existing.team_id) + " and team " + std::to_string(team.id);
      return false;
    }

    Player player;
    player.id = record.person_id;
    player.first_name = record.first_name;
    player.family_name = record.family_name;
    player.display_name = record.display_name;
    if (player.display_name.empty()) {
      player.display_name = player.first_name;
      if (!player.family_name.empty()) {
        if (!player.display_name.empty()) player.display_name += " ";
        player.display_name += player.family_name;
      }
    }
    player.jersey = record.jersey;
    player.position = record.position;
    player.team_id = team.id;

    const auto minutes = clock::parse_minutes(record.minutes);
    if (minutes.has_value()) {
      player.minutes_played = minutes.value();
    } else if (!record.minutes.empty()) {
      diagnostics.push_back({DiagnosticKind::FormatError, 0, 0,
                             "minutes '" + record.minutes + "' for player " + std::to_string(player.id) +
                                 " unparseable, using 0"});
    }

    index_by_id_[player.id] = players_.size();
    if (!player.position.empty() && minutes.has_value()) {
      starter_pool.push_back(players_.size());
    }
    players_.push_back(std::move(player));
  }

  std::stable_sort(starter_pool.begin(), starter_pool.end(), [this](size_t a, size_t b) {
    return players_[a].minutes_played > players_[b].minutes_played;
  });
  for (size_t i = 0; i < starter_pool.size() && i < kLineupSize; ++i) {
    players_[starter_pool[i]].is_starter = true;
  }
  return true;
}

const Player* Roster::find(PlayerId id) const {
  auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) return nullptr;
  return &players_[it->second];
}

bool Roster::belongs_to(PlayerId id, TeamId team) const {
  const Player* player = find(id);
  return player && player->team_id == team;
}

std::string Roster::display_name(PlayerId id) const {
  const Player* player = find(id);
  if (!player) return "ID:" + std::to_string(id);
  return player->display_name;
}

std::vector<const Player*> Roster::team_players(TeamId team) const {
  std::vector<const Player*> out;
  for (const auto& player : players_) {
    if (player.team_id == team) {
      out.push_back(&player);
    }
  }
  return out;
}

std::vector<PlayerId> Roster::nominal_starters(TeamId team) const {
  std::vector<const Player*> starters;
  for (const auto& player : players_) {
    if (player.team_id == team && player.is_starter) {
      starters.push_back(&player);
    }
  }
  std::stable_sort(starters.begin(), starters.end(), [](const Player* a, const Player* b) {
    return a->minutes_played > b->minutes_played;
  });
  std::vector<PlayerId> out;
  for (const Player* p : starters) {
    out.push_back(p->id);
  }
  return out;
}

} // namespace courtline
