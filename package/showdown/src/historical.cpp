#include "showdown/historical.hpp"

#include <algorithm>

namespace showdown {

std::vector<std::string> HistoricalGame::teams() const {
  std::vector<std::string> out;
  for (const auto &p : players) {
    if (std::find(out.begin(), out.end(), p.team) == out.end())
      out.push_back(p.team);
  }
  return out;
}

std::string HistoricalGame::opponent_of(const std::string &team) const {
  for (const auto &t : teams()) {
    if (t != team)
      return t;
  }
  return "OPP";
}

void score_with_standard_rules(HistoricalPlayerRecord &record) {
  record.actual_fantasy_points = standard_fantasy_points(record.stats);
}

namespace {

// Index of the team's quarterback with the most passing yards, or -1.
int team_quarterback(const HistoricalGame &game, const std::string &team) {
  int best = -1;
  for (std::size_t i = 0; i < game.players.size(); ++i) {
    const auto &p = game.players[i];
    if (p.team != team || p.position != Position::QB)
      continue;
    if (best < 0 || p.stats[Stat::PassYds] >
                        game.players[best].stats[Stat::PassYds])
      best = static_cast<int>(i);
  }
  return best;
}

// Highest-salaried non-QB teammate of player `self`, or -1.
int top_teammate(const HistoricalGame &game, std::size_t self) {
  const auto &me = game.players[self];
  int best = -1;
  for (std::size_t i = 0; i < game.players.size(); ++i) {
    const auto &p = game.players[i];
    if (i == self || p.team != me.team || p.position == Position::QB)
      continue;
    if (best < 0 || p.salary.value_or(0) >
                        game.players[best].salary.value_or(0))
      best = static_cast<int>(i);
  }
  return best;
}

} // namespace

std::vector<StatLine> game_features(const HistoricalGame &game) {
  const std::vector<Stat> player_stats = [] {
    auto raw = stats_in(StatGroup::Raw);
    auto adv = stats_in(StatGroup::Advanced);
    raw.insert(raw.end(), adv.begin(), adv.end());
    return raw;
  }();
  const std::vector<Stat> team_stats = stats_in(StatGroup::Team);
  const std::vector<Stat> game_stats = stats_in(StatGroup::Situational);

  std::vector<StatLine> out(game.players.size());
  for (std::size_t i = 0; i < game.players.size(); ++i) {
    const auto &p = game.players[i];
    StatLine &f = out[i];
    for (const Stat s : player_stats)
      f[s] = p.stats[s];

    auto team_it = game.context.team_metrics.find(p.team);
    if (team_it != game.context.team_metrics.end()) {
      for (const Stat s : team_stats)
        f[s] = team_it->second[s];
    }
    for (const Stat s : game_stats)
      f[s] = game.context.situational[s];

    if (p.position == Position::QB)
      continue;
    const int qb = team_quarterback(game, p.team);
    if (qb >= 0) {
      f[Stat::QbPassYds] = game.players[qb].stats[Stat::PassYds];
      f[Stat::QbRushYds] = game.players[qb].stats[Stat::RushYds];
    }
    const int mate = top_teammate(game, i);
    if (mate >= 0) {
      const auto &t = game.players[mate].stats;
      f[Stat::TopTeammateRecYds] = t[Stat::RecYds];
      f[Stat::TopTeammateRushYds] = t[Stat::RushYds];
      f[Stat::TopTeammateReceptions] = t[Stat::Receptions];
    }
  }
  return out;
}

double predict_points(const StatWeights &weights, const StatLine &features,
                      double matchup_advantage) {
  return dot(weights, features) * matchup_advantage;
}

} // namespace showdown
