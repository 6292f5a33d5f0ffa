#include "showdown/backtest.hpp"
#include "showdown/errors.hpp"
#include "showdown/pipeline.hpp"
#include "showdown/progress.hpp"
#include "showdown/store.hpp"

#include "test_games.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace showdown;
using showdown::testing::synthetic_game;
using showdown::testing::synthetic_games;

namespace {

std::vector<ProgressEvent> drain(ProgressChannel &channel) {
  std::vector<ProgressEvent> out;
  while (auto ev = channel.try_pop())
    out.push_back(*ev);
  return out;
}

class CountingSource : public GameSource {
public:
  explicit CountingSource(const std::vector<HistoricalGame> &games) {
    for (const auto &g : games)
      inner_.add(g);
  }
  HistoricalGame fetch(const std::string &game_id) override {
    ++fetches;
    return inner_.fetch(game_id);
  }
  int fetches{0};

private:
  StaticGameSource inner_;
};

std::vector<std::string> ids_of(const std::vector<HistoricalGame> &games) {
  std::vector<std::string> ids;
  for (const auto &g : games)
    ids.push_back(g.game_id);
  return ids;
}

} // namespace

TEST(BacktestPool, SyntheticPlayersFromSalariedRecords) {
  HistoricalGame game = synthetic_game("W1", 3);
  game.players[2].salary.reset();
  const PlayerTable pool = build_backtest_pool(game, 1.5);
  EXPECT_EQ(pool.size(), game.players.size() - 1);

  const Player &qb = pool.get_by_id("W1_AAAQB1");
  EXPECT_EQ(qb.name, "AAA QB 1");
  EXPECT_EQ(qb.opponent, "BBB");
  EXPECT_DOUBLE_EQ(qb.mean_score, game.players[0].actual_fantasy_points);
  EXPECT_DOUBLE_EQ(qb.ceiling_score, 1.5 * game.players[0].actual_fantasy_points);
  EXPECT_DOUBLE_EQ(qb.ownership_flex, 0.0);
  EXPECT_FALSE(pool.has_id("W1_AAARB3"));
}

TEST(BacktestPool, ActualScoringUsesCaptainMultiplier) {
  const HistoricalGame game = synthetic_game("W1", 3);
  const PlayerTable pool = build_backtest_pool(game);
  const auto &ps = pool.players();
  const Lineup l{ps[0], {ps[1], ps[2], ps[3], ps[4]}};
  double expected = 1.5 * game.players[0].actual_fantasy_points;
  for (int i = 1; i <= 4; ++i)
    expected += game.players[i].actual_fantasy_points;
  EXPECT_NEAR(score_with_actuals(l, game), expected, 1e-9);

  Lineup stranger = l;
  stranger.captain.name = "Nobody";
  EXPECT_NEAR(score_with_actuals(stranger, game),
              expected - 1.5 * game.players[0].actual_fantasy_points, 1e-9);
}

TEST(BacktestPool, NameSettingsResolveToSyntheticIds) {
  const HistoricalGame game = synthetic_game("W1", 3);
  const PlayerTable pool = build_backtest_pool(game);
  BacktestSettings settings;
  settings.locked_names = {"AAA WR 4", "Not Playing"};
  settings.excluded_names = {"BBB QB 1"};
  const auto cons = backtest_constraints(settings, pool);
  EXPECT_EQ(cons.locked_ids, (std::set<std::string>{"W1_AAAWR4"}));
  EXPECT_EQ(cons.excluded_ids, (std::set<std::string>{"W1_BBBQB1"}));
  EXPECT_EQ(cons.salary_cap, settings.salary_cap);
}

TEST(BacktestRunner, AverageIsMeanOfTopScoresOverUsedGames) {
  auto games = synthetic_games(3, 40);
  games.push_back(synthetic_game("NOSAL", 99, false));

  BacktestSettings settings;
  settings.num_lineups = 3;
  ProgressChannel channel;
  RunContext ctx;
  ctx.progress = &channel;
  const BacktestReport report = BacktestRunner().run(games, settings, ctx);

  ASSERT_EQ(report.game_results.size(), 3u);
  ASSERT_EQ(report.skipped.size(), 1u);
  EXPECT_EQ(report.skipped[0].game_id, "NOSAL");
  EXPECT_FALSE(report.warnings.empty());
  EXPECT_EQ(report.summary.games_used, 3u);
  EXPECT_EQ(report.summary.games_skipped, 1u);

  double total = 0.0;
  std::size_t lineups = 0;
  for (const auto &g : report.game_results) {
    ASSERT_FALSE(g.lineups.empty());
    double top = 0.0;
    for (const auto &s : g.lineups) {
      EXPECT_LE(s.lineup.total_salary(), settings.salary_cap);
      top = std::max(top, s.actual_score);
    }
    EXPECT_DOUBLE_EQ(g.top_score, top);
    total += g.top_score;
    lineups += g.lineups.size();
  }
  EXPECT_NEAR(report.summary.average_top_score, total / 3.0, 1e-9);
  EXPECT_EQ(report.summary.total_lineups, lineups);

  int appearances = 0;
  for (const auto &kv : report.player_exposures) {
    appearances += kv.second.count;
    EXPECT_NEAR(kv.second.percentage,
                100.0 * kv.second.count / static_cast<double>(lineups), 1e-9);
  }
  EXPECT_EQ(appearances, static_cast<int>(lineups) * settings.roster_size);

  const auto events = drain(channel);
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().percent, 100);
  EXPECT_EQ(events.back().message, "Backtest complete.");
}

TEST(BacktestRunner, MeanModeTopLineupScoresItsProjection) {
  const auto games = synthetic_games(2, 70);
  const BacktestReport report = BacktestRunner().run(games, BacktestSettings{});
  for (const auto &g : report.game_results) {
    ASSERT_EQ(g.lineups.size(), 1u);
    const auto &best = g.lineups.front();
    EXPECT_NEAR(best.actual_score, best.lineup.total_score(ScoringMode::Mean),
                1e-9);
  }
}

TEST(BacktestRunner, LocksAndExclusionsByName) {
  const auto games = synthetic_games(3, 10);
  BacktestSettings settings;
  settings.num_lineups = 2;
  settings.locked_names = {"BBB TE 7"};
  settings.excluded_names = {"AAA QB 1"};
  const BacktestReport report = BacktestRunner().run(games, settings);
  ASSERT_EQ(report.game_results.size(), 3u);
  for (const auto &g : report.game_results) {
    for (const auto &s : g.lineups) {
      bool locked = false;
      for (const auto &id : s.lineup.ids()) {
        EXPECT_NE(id, g.game_id + "_AAAQB1");
        locked = locked || id == g.game_id + "_BBBTE7";
      }
      EXPECT_TRUE(locked);
    }
  }
}

TEST(BacktestRunner, WorkerThreadsKeepInputOrder) {
  const auto games = synthetic_games(5, 500);
  BacktestSettings serial;
  serial.num_lineups = 2;
  BacktestSettings parallel = serial;
  parallel.worker_threads = 3;

  const auto a = BacktestRunner().run(games, serial);
  const auto b = BacktestRunner().run(games, parallel);
  ASSERT_EQ(a.game_results.size(), b.game_results.size());
  for (std::size_t i = 0; i < a.game_results.size(); ++i) {
    EXPECT_EQ(a.game_results[i].game_id, games[i].game_id);
    EXPECT_EQ(b.game_results[i].game_id, games[i].game_id);
    EXPECT_DOUBLE_EQ(a.game_results[i].top_score, b.game_results[i].top_score);
  }
  EXPECT_DOUBLE_EQ(a.summary.average_top_score, b.summary.average_top_score);
}

TEST(BacktestRunner, MalformedSettingsAndCancellation) {
  const auto games = synthetic_games(2, 1);
  BacktestSettings settings;
  settings.locked_names = {"AAA QB 1"};
  settings.excluded_names = {"AAA QB 1"};
  EXPECT_THROW(BacktestRunner().run(games, settings), ValidationError);

  settings = BacktestSettings{};
  settings.salary_cap = -5;
  EXPECT_THROW(BacktestRunner().run(games, settings), ValidationError);

  CancellationToken token;
  token.cancel();
  RunContext ctx;
  ctx.cancel = &token;
  EXPECT_THROW(BacktestRunner().run(games, BacktestSettings{}, ctx), Cancelled);
}

TEST(BacktestRunner, EmptyInputGivesEmptyReport) {
  const BacktestReport report = BacktestRunner().run({}, BacktestSettings{});
  EXPECT_TRUE(report.game_results.empty());
  EXPECT_DOUBLE_EQ(report.summary.average_top_score, 0.0);
  EXPECT_EQ(report.summary.total_lineups, 0u);
}

TEST(Simulation, SplitIsDeterministic) {
  std::vector<std::string> ids;
  for (int i = 0; i < 8; ++i)
    ids.push_back("G" + std::to_string(i));
  SimulationParams params;
  const auto first = split_games(ids, params);
  const auto second = split_games(ids, params);
  EXPECT_EQ(first, second);
  EXPECT_EQ(first.first.size(), 6u);
  EXPECT_EQ(first.second.size(), 2u);

  std::vector<std::string> all = first.first;
  all.insert(all.end(), first.second.begin(), first.second.end());
  std::sort(all.begin(), all.end());
  EXPECT_EQ(all, ids);

  params.train_validate_split = 80.0; // floor(8 * 0.8) = 6 -> 2 validation
  EXPECT_NO_THROW(split_games(ids, params));
  params.train_validate_split = 90.0; // 7 training -> 1 validation
  EXPECT_THROW(split_games(ids, params), ValidationError);

  params = SimulationParams{};
  EXPECT_THROW(split_games({"a", "b", "c"}, params), ValidationError);
}

TEST(Simulation, FullRunCachesGamesAndRanksModels) {
  const auto corpus = synthetic_games(8, 2024);
  CountingSource source(corpus);
  InMemoryGameStore games;
  InMemoryModelStore models;
  SimulationParams params;
  params.promote_best = true;
  ProgressChannel channel;
  RunContext ctx;
  ctx.progress = &channel;

  const ValidationReport report = run_full_simulation(
      params, ids_of(corpus), source, games, models, nullptr, ctx);
  EXPECT_EQ(report.training_set_size, 6u);
  EXPECT_EQ(report.validation_set_size, 2u);
  EXPECT_EQ(games.count(), 8u);
  EXPECT_EQ(source.fetches, 8);
  ASSERT_FALSE(report.models.empty());
  for (std::size_t i = 1; i < report.models.size(); ++i) {
    EXPECT_LE(*report.models[i - 1].performance.validation_mae,
              *report.models[i].performance.validation_mae);
  }
  const auto saved = models.list();
  ASSERT_EQ(saved.size(), 1u);
  EXPECT_EQ(saved[0].id, report.models.front().id);

  const auto events = drain(channel);
  ASSERT_GE(events.size(), 4u);
  EXPECT_EQ(events.front().percent, 5);
  EXPECT_EQ(events.back().percent, 100);
  for (std::size_t i = 1; i < events.size(); ++i)
    EXPECT_GE(events[i].percent, events[i - 1].percent);

  // A second run is served from the cache.
  run_full_simulation(params, ids_of(corpus), source, games, models);
  EXPECT_EQ(source.fetches, 8);
}

TEST(Simulation, UnavailableGameIsAWarning) {
  const auto corpus = synthetic_games(8, 77);
  CountingSource source(corpus);
  InMemoryGameStore games;
  InMemoryModelStore models;
  auto ids = ids_of(corpus);
  ids.push_back("MISSING");

  const ValidationReport report =
      run_full_simulation(SimulationParams{}, ids, source, games, models);
  EXPECT_EQ(report.training_set_size + report.validation_set_size, 8u);
  EXPECT_TRUE(std::any_of(report.warnings.begin(), report.warnings.end(),
                          [](const std::string &w) {
                            return w.find("MISSING") != std::string::npos;
                          }));
  EXPECT_TRUE(models.list().empty());
}

TEST(Simulation, UnloadableValidationSetPromotesNothing) {
  const auto corpus = synthetic_games(8, 31);
  SimulationParams params;
  params.promote_best = true;
  const auto split = split_games(ids_of(corpus), params);

  // The source only knows the training games.
  StaticGameSource source;
  for (const auto &g : corpus) {
    if (std::find(split.first.begin(), split.first.end(), g.game_id) !=
        split.first.end())
      source.add(g);
  }
  InMemoryGameStore games;
  InMemoryModelStore models;

  const ValidationReport report =
      run_full_simulation(params, ids_of(corpus), source, games, models);
  EXPECT_EQ(report.training_set_size, split.first.size());
  EXPECT_EQ(report.validation_set_size, 0u);
  ASSERT_FALSE(report.models.empty());
  for (const auto &m : report.models)
    EXPECT_FALSE(m.performance.validation_mae.has_value()) << m.name;
  EXPECT_TRUE(models.list().empty());
  EXPECT_TRUE(std::any_of(report.warnings.begin(), report.warnings.end(),
                          [](const std::string &w) {
                            return w.find("not validated") != std::string::npos;
                          }));
}

TEST(Simulation, CancelledRunStops) {
  const auto corpus = synthetic_games(8, 5);
  CountingSource source(corpus);
  InMemoryGameStore games;
  InMemoryModelStore models;
  CancellationToken token;
  token.cancel();
  RunContext ctx;
  ctx.cancel = &token;
  EXPECT_THROW(run_full_simulation(SimulationParams{}, ids_of(corpus), source,
                                   games, models, nullptr, ctx),
               Cancelled);
  EXPECT_EQ(source.fetches, 0);
}
