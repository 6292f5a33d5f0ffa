#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "showdown/player.hpp"
#include "showdown/stats.hpp"

namespace showdown {

struct HistoricalPlayerRecord {
  std::string name;
  std::string team;
  Position position{Position::QB};
  std::string archetype;
  // Final raw box score plus any advanced per-player metrics.
  StatLine stats;
  double actual_fantasy_points{0.0};
  std::optional<std::int64_t> salary;
  // Externally supplied matchup multiplier, 1.0 when neutral/unknown.
  double matchup_advantage{1.0};
};

struct PregameContext {
  std::vector<std::string> injuries;
  std::string vegas_line;
  // Team abbreviation -> team-level metrics (Team stat group).
  std::map<std::string, StatLine> team_metrics;
  // Game-level factors (Situational stat group).
  StatLine situational;
};

// Ground truth for one past game. Never mutated once cached.
struct HistoricalGame {
  std::string game_id;
  std::string description;
  PregameContext context;
  std::vector<HistoricalPlayerRecord> players;

  // Distinct teams in order of first appearance.
  std::vector<std::string> teams() const;
  // The other team in the game, or "OPP" when it cannot be determined.
  std::string opponent_of(const std::string &team) const;
};

// Fills actual_fantasy_points from the raw box score with standard scoring.
void score_with_standard_rules(HistoricalPlayerRecord &record);

// Feature vector of every player in the game, aligned with game.players:
// the player's own stats, own-team metrics, game situational factors and,
// for non-quarterbacks, teammate-correlation features (same-team QB pass and
// rush yards; the highest-salaried non-QB teammate's receiving yards, rushing
// yards and receptions).
std::vector<StatLine> game_features(const HistoricalGame &game);

// Point prediction for one player-game.
double predict_points(const StatWeights &weights, const StatLine &features,
                      double matchup_advantage = 1.0);

} // namespace showdown
