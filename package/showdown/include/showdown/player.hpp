#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace showdown {

enum class Position { QB, RB, WR, TE, K, DST };

// Accepts the usual site spellings ("D", "DEF", "DST" for defenses).
// Throws ValidationError on anything else.
Position parse_position(const std::string &text);
std::string to_string(Position pos);

struct Player {
  // Data members
  std::string id;
  std::string name;
  std::string team;
  std::string opponent;
  Position position{Position::QB};
  std::int64_t salary{0};
  double mean_score{0.0};
  double ceiling_score{0.0};
  // Projected field ownership in percent (0-100)
  double ownership_flex{0.0};
  double ownership_captain{0.0};
  // Tournament leverage, 1-100: upside relative to projected ownership.
  double leverage{0.0};
  std::unordered_map<std::string, double> correlations;

  // Default constructor
  Player() = default;
  // Constructor with parameters
  Player(std::string id_, std::string name_, std::string team_,
         std::string opponent_, Position position_, std::int64_t salary_,
         double mean_score_, double ceiling_score_)
      : id(std::move(id_)), name(std::move(name_)), team(std::move(team_)),
        opponent(std::move(opponent_)), position(position_), salary(salary_),
        mean_score(mean_score_), ceiling_score(ceiling_score_) {}

  // Correlation with another player, 0 when unknown.
  double correlation_with(const std::string &other_id) const {
    auto it = correlations.find(other_id);
    return it == correlations.end() ? 0.0 : it->second;
  }
};

class PlayerTable {
public:
  PlayerTable() = default;
  explicit PlayerTable(const std::vector<Player> &players) {
    for (const auto &p : players)
      add_player(p);
  }

  // Throws ValidationError on a duplicate or empty id, or a negative salary.
  void add_player(const Player &p);

  std::size_t size() const { return players_.size(); }

  bool has_id(const std::string &id) const {
    return id_index_.find(id) != id_index_.end();
  }

  const Player &get_by_id(const std::string &id) const {
    auto it = id_index_.find(id);
    if (it == id_index_.end()) {
      throw std::out_of_range("Player id not found: " + id);
    }
    return players_.at(it->second);
  }

  const std::vector<Player> &players() const { return players_; }

private:
  std::vector<Player> players_;
  std::unordered_map<std::string, std::size_t> id_index_;
};

} // namespace showdown
