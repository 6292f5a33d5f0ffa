#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "showdown/constraints.hpp"
#include "showdown/generator.hpp"
#include "showdown/historical.hpp"
#include "showdown/lineup.hpp"
#include "showdown/progress.hpp"
#include "showdown/solver.hpp"

namespace showdown {

// Player ids are re-synthesised per game, so locks and exclusions are by name.
struct BacktestSettings {
  std::int64_t salary_cap{60000};
  int roster_size{5};
  std::map<Position, int> max_per_position;
  std::set<std::string> locked_names;
  std::set<std::string> excluded_names;
  bool require_captain_stack{false};
  bool require_opponent_bring_back{false};
  std::set<Position> stack_partner_positions;
  int num_lineups{1};
  // Games whose pool (players with salary) is smaller than this are skipped.
  int min_pool_size{10};
  // Ceiling projection assigned to each synthetic player, as a multiple of
  // its actual points.
  double ceiling_factor{1.5};
  int worker_threads{1};
};

struct ScoredLineup {
  Lineup lineup;
  double actual_score{0.0};
};

struct BacktestGameResult {
  std::string game_id;
  std::string description;
  std::vector<ScoredLineup> lineups;
  double top_score{0.0};
};

struct SkippedGame {
  std::string game_id;
  std::string reason;
};

struct PlayerExposure {
  int count{0};
  double percentage{0.0};
};

struct BacktestSummary {
  double average_top_score{0.0};
  std::size_t games_used{0};
  std::size_t games_skipped{0};
  std::size_t total_lineups{0};
};

struct BacktestReport {
  BacktestSettings settings;
  std::vector<BacktestGameResult> game_results;
  std::vector<SkippedGame> skipped;
  BacktestSummary summary;
  std::map<std::string, PlayerExposure> player_exposures; // by name
  std::vector<std::string> warnings;
};

// Synthetic pool for one game: players with a positive salary, scored by
// their actual points (ceiling = ceiling_factor x actual), zero ownership.
PlayerTable build_backtest_pool(const HistoricalGame &game,
                                double ceiling_factor = 1.5);

// Resolves name-based settings against a synthetic pool.
RosterConstraintSet backtest_constraints(const BacktestSettings &settings,
                                         const PlayerTable &pool);

// Actual points of a lineup, captain at the multiplier. Unknown names score 0.
double score_with_actuals(const Lineup &lineup, const HistoricalGame &game,
                          double captain_multiplier = kDefaultCaptainMultiplier);

class BacktestRunner {
public:
  BacktestRunner() = default;
  explicit BacktestRunner(SolverConfig cfg) : solver_cfg_(cfg) {}

  // Replays the generator over every game. A game that lacks data or fails is
  // recorded in `skipped` and never aborts the run. Progress is reported per
  // finished game; cancellation is checked before each game.
  BacktestReport run(const std::vector<HistoricalGame> &games,
                     const BacktestSettings &settings,
                     const RunContext &ctx = {}) const;

private:
  SolverConfig solver_cfg_{};
};

} // namespace showdown
