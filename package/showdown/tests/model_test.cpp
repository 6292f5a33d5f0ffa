#include "showdown/calibration.hpp"
#include "showdown/discovery.hpp"
#include "showdown/errors.hpp"
#include "showdown/historical.hpp"
#include "showdown/logging.hpp"
#include "showdown/model.hpp"
#include "showdown/progress.hpp"
#include "showdown/projection.hpp"
#include "showdown/stats.hpp"
#include "showdown/store.hpp"
#include "showdown/validator.hpp"

#include "test_games.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

using namespace showdown;
using showdown::testing::synthetic_game;
using showdown::testing::synthetic_games;

namespace {

const TunedModel *find_model(const std::vector<TunedModel> &models,
                             const std::string &name) {
  for (const auto &m : models) {
    if (m.name == name)
      return &m;
  }
  return nullptr;
}

class ThrowingHindsight : public HindsightSource {
public:
  std::optional<StatWeights> hindsight_weights(const HistoricalGame &) override {
    throw std::runtime_error("service unavailable");
  }
};

} // namespace

TEST(Stats, NamesAndGroups) {
  EXPECT_EQ(stats_in(StatGroup::Raw).size(), 9u);
  EXPECT_EQ(stats_in(StatGroup::Advanced).size(), 16u);
  EXPECT_EQ(stats_in(StatGroup::Team).size(), 10u);
  EXPECT_EQ(stats_in(StatGroup::Situational).size(), 3u);
  EXPECT_EQ(stats_in(StatGroup::Correlation).size(), 5u);
  for (const Stat s : all_stats())
    EXPECT_EQ(stat_from_name(stat_name(s)), s);
  EXPECT_EQ(stat_name(Stat::QbPassYds), "qb_passYds");
  EXPECT_THROW(stat_from_name("tackles"), std::out_of_range);
}

TEST(Stats, StandardScoring) {
  StatLine s;
  s[Stat::PassYds] = 300;
  s[Stat::PassTds] = 2;
  s[Stat::Interceptions] = 1;
  s[Stat::RushYds] = 20;
  s[Stat::FumblesLost] = 1;
  s[Stat::AirYards] = 500; // not scored
  EXPECT_NEAR(standard_fantasy_points(s), 12 + 8 - 1 + 2 - 2, 1e-12);

  StatWeights a, b;
  a[Stat::RecYds] = 1.0;
  b[Stat::RecYds] = 3.0;
  b[Stat::RecTds] = 2.0;
  const StatWeights avg = average_weights({a, b});
  EXPECT_DOUBLE_EQ(avg[Stat::RecYds], 2.0);
  EXPECT_DOUBLE_EQ(avg[Stat::RecTds], 1.0);
}

TEST(Projection, ScoringModelAppliesUsageBoost) {
  StatProjection proj;
  proj.mean[Stat::RecYds] = 80;
  proj.mean[Stat::Receptions] = 6;
  proj.ceiling[Stat::RecYds] = 140;
  proj.ceiling[Stat::RecTds] = 1;
  proj.usage_boost = 1.5;
  Player p;
  ScoringModel().apply(p, proj);
  EXPECT_NEAR(p.mean_score, 8 + 3 + 1.5, 1e-12);
  EXPECT_NEAR(p.ceiling_score, 14 + 6 + 1.5, 1e-12);
  EXPECT_EQ(parse_scoring_mode("Ceiling"), ScoringMode::Ceiling);
  EXPECT_THROW(parse_scoring_mode("floor"), ValidationError);
}

TEST(Triangular, SymmetricDistribution) {
  const Triangular t = Triangular::symmetric(10.0, 2.0);
  EXPECT_NEAR(t.mean(), 10.0, 1e-12);
  EXPECT_NEAR(t.variance(), 4.0, 1e-9);
  EXPECT_NEAR(t.cdf(10.0), 0.5, 1e-12);
  EXPECT_DOUBLE_EQ(t.cdf(t.low - 1), 0.0);
  EXPECT_DOUBLE_EQ(t.cdf(t.high + 1), 1.0);
  for (double p : {0.05, 0.25, 0.5, 0.75, 0.95})
    EXPECT_NEAR(t.cdf(t.quantile(p)), p, 1e-9);
  EXPECT_THROW(Triangular(3.0, 1.0, 2.0), std::invalid_argument);

  // CRPS is smallest at the centre and grows with distance.
  EXPECT_LT(t.crps(10.0), t.crps(12.0));
  EXPECT_LT(t.crps(12.0), t.crps(20.0));
  // Beyond the support CRPS grows one for one with the observation.
  EXPECT_NEAR(t.crps(100.0, 4000) - t.crps(50.0, 4000), 50.0, 0.01);

  const Eigen::VectorXd draws = t.sample(20000, 7);
  EXPECT_NEAR(draws.mean(), 10.0, 0.1);
  EXPECT_GE(draws.minCoeff(), t.low);
  EXPECT_LE(draws.maxCoeff(), t.high);
}

TEST(Calibration, KolmogorovSmirnov) {
  std::vector<double> even;
  for (int i = 0; i < 200; ++i)
    even.push_back((i + 0.5) / 200.0);
  EXPECT_GT(ks_uniform_p_value(even), 0.99);

  std::vector<double> lopsided(200, 0.1);
  EXPECT_LT(ks_uniform_p_value(lopsided), 1e-6);
  EXPECT_DOUBLE_EQ(ks_uniform_p_value({}), 1.0);
}

TEST(Calibration, MatchedSpreadIsCalibrated) {
  const double sigma = 3.0;
  std::vector<PredictionPoint> points;
  for (int i = 0; i < 2000; ++i) {
    const double pred = 5.0 + (i % 20);
    const Triangular truth = Triangular::symmetric(pred, sigma);
    points.push_back({pred, truth.sample(1, 1000 + i)(0)});
  }
  const CalibrationReport good = calibration_report(points, sigma);
  EXPECT_EQ(good.samples, 2000u);
  EXPECT_NEAR(good.p50_coverage, 50.0, 5.0);
  EXPECT_GT(good.pit_ks_p_value, 0.001);
  EXPECT_GT(good.crps, 0.0);
  EXPECT_LT(good.crps, good.mae);

  // Claiming the minimum spread is overconfident.
  const CalibrationReport narrow = calibration_report(points, 0.0);
  EXPECT_LT(narrow.p50_coverage, good.p50_coverage);
  EXPECT_LT(narrow.pit_ks_p_value, good.pit_ks_p_value);
  EXPECT_DOUBLE_EQ(narrow.mae, good.mae);
}

TEST(Calibration, EmptyInput) {
  const CalibrationReport rep = calibration_report({}, 2.0);
  EXPECT_EQ(rep.samples, 0u);
  EXPECT_DOUBLE_EQ(rep.mae, 0.0);
  EXPECT_DOUBLE_EQ(mean_absolute_error({}), 0.0);
  EXPECT_DOUBLE_EQ(residual_std({{1.0, 4.0}, {2.0, -2.0}}),
                   std::sqrt((9.0 + 16.0) / 2.0));
}

TEST(Historical, GameFeatures) {
  const HistoricalGame game = synthetic_game("G1", 11);
  EXPECT_EQ(game.teams(), (std::vector<std::string>{"AAA", "BBB"}));
  EXPECT_EQ(game.opponent_of("AAA"), "BBB");
  EXPECT_EQ(game.opponent_of("CCC"), "AAA");

  const auto features = game_features(game);
  ASSERT_EQ(features.size(), game.players.size());
  const auto &qb = game.players[0];
  ASSERT_EQ(qb.position, Position::QB);
  EXPECT_DOUBLE_EQ(features[0][Stat::QbPassYds], 0.0);
  EXPECT_DOUBLE_EQ(features[0][Stat::PassYds], qb.stats[Stat::PassYds]);
  EXPECT_DOUBLE_EQ(features[0][Stat::PlaysPerGame],
                   game.context.team_metrics.at("AAA")[Stat::PlaysPerGame]);
  EXPECT_DOUBLE_EQ(features[0][Stat::WeatherFactor],
                   game.context.situational[Stat::WeatherFactor]);

  // Non-QB teammates see their quarterback's yardage.
  EXPECT_DOUBLE_EQ(features[1][Stat::QbPassYds], qb.stats[Stat::PassYds]);
  EXPECT_DOUBLE_EQ(features[1][Stat::QbRushYds], qb.stats[Stat::RushYds]);

  // The top-salaried non-QB is never its own top teammate.
  auto best_excluding = [&](std::size_t skip) {
    std::size_t best = 0;
    for (std::size_t i = 1; i < 9; ++i) {
      if (i == skip)
        continue;
      if (best == 0 || *game.players[i].salary > *game.players[best].salary)
        best = i;
    }
    return best;
  };
  const std::size_t top = best_excluding(0);
  const std::size_t runner_up = best_excluding(top);
  const std::size_t other = top == 1 ? 2 : 1;
  EXPECT_DOUBLE_EQ(features[other][Stat::TopTeammateRecYds],
                   game.players[top].stats[Stat::RecYds]);
  EXPECT_DOUBLE_EQ(features[top][Stat::TopTeammateRecYds],
                   game.players[runner_up].stats[Stat::RecYds]);
  EXPECT_DOUBLE_EQ(features[top][Stat::TopTeammateReceptions],
                   game.players[runner_up].stats[Stat::Receptions]);

  HistoricalPlayerRecord rec = game.players[0];
  rec.matchup_advantage = 1.2;
  EXPECT_NEAR(predict_points(default_weights(), features[0],
                             rec.matchup_advantage),
              1.2 * rec.actual_fantasy_points, 1e-9);
}

TEST(Models, RankingPrefersLowerValidationErrorThenNewer) {
  TunedModel a = make_model("Alpha Model", default_weights(), "a");
  TunedModel b = make_model("Beta", default_weights(), "b");
  TunedModel c = make_model("Gamma", default_weights(), "c");
  EXPECT_LT(a.created_at, b.created_at);
  EXPECT_EQ(a.id.rfind("Alpha_Model_", 0), 0u);
  EXPECT_NE(a.id, b.id);

  a.performance.validation_mae = 2.0;
  b.performance.validation_mae = 2.0;
  std::vector<TunedModel> models{c, a, b};
  rank_models(models);
  EXPECT_EQ(models[0].name, "Beta"); // tie, newer first
  EXPECT_EQ(models[1].name, "Alpha Model");
  EXPECT_EQ(models[2].name, "Gamma"); // never validated
}

TEST(Stores, UpsertGetRemoveList) {
  InMemoryGameStore games;
  HistoricalGame g = synthetic_game("G1", 1);
  games.put(g);
  g.description = "Updated";
  games.put(g);
  EXPECT_EQ(games.count(), 1u);
  ASSERT_TRUE(games.get("G1").has_value());
  EXPECT_EQ(games.get("G1")->description, "Updated");
  EXPECT_FALSE(games.get("G2").has_value());

  InMemoryModelStore models;
  TunedModel slow = make_model("Slow", default_weights(), "");
  slow.performance.validation_mae = 5.0;
  TunedModel fast = make_model("Fast", default_weights(), "");
  fast.performance.validation_mae = 1.0;
  models.put(slow);
  models.put(fast);
  const auto listed = models.list();
  ASSERT_EQ(listed.size(), 2u);
  EXPECT_EQ(listed[0].name, "Fast");
  EXPECT_TRUE(models.remove(fast.id));
  EXPECT_FALSE(models.remove(fast.id));
  EXPECT_FALSE(models.get(fast.id).has_value());
  EXPECT_EQ(models.list().size(), 1u);
}

TEST(Progress, ChannelDeliversInOrderAcrossThreads) {
  ProgressChannel channel;
  std::vector<std::thread> producers;
  for (int t = 0; t < 4; ++t) {
    producers.emplace_back([&channel, t] {
      for (int i = 0; i < 50; ++i)
        channel.push({"step", t * 100 + i});
    });
  }
  for (auto &p : producers)
    p.join();
  EXPECT_EQ(channel.size(), 200u);

  std::vector<int> last(4, -1);
  while (auto ev = channel.try_pop()) {
    const int t = ev->percent / 100;
    EXPECT_GT(ev->percent, last[t]);
    last[t] = ev->percent;
  }
  EXPECT_FALSE(channel.pop(std::chrono::milliseconds(1)).has_value());

  channel.close();
  channel.push({"late", 1});
  EXPECT_TRUE(channel.closed());
  EXPECT_EQ(channel.size(), 0u);
}

TEST(Progress, CancellationTokenStopsAtStepBoundary) {
  CancellationToken token;
  RunContext ctx;
  ctx.cancel = &token;
  EXPECT_NO_THROW(ctx.check_cancelled("anything"));
  token.cancel();
  EXPECT_THROW(ctx.check_cancelled("fitting"), Cancelled);
  EXPECT_NO_THROW(RunContext{}.check_cancelled("no token"));
}

TEST(Logging, LevelNames) {
  EXPECT_NO_THROW(set_log_level("debug"));
  EXPECT_EQ(logger()->level(), spdlog::level::debug);
  EXPECT_THROW(set_log_level("chatty"), std::invalid_argument);
  set_log_level("info");
}

TEST(Discovery, RawRegressionRecoversStandardScoring) {
  const auto training = synthetic_games(4, 100);
  const DiscoveryResult found = ModelDiscovery().discover(training);
  const TunedModel *raw = find_model(found.candidates, "Raw Stat Regression");
  ASSERT_NE(raw, nullptr);
  const StatWeights standard = default_weights();
  for (const Stat s : stats_in(StatGroup::Raw))
    EXPECT_NEAR(raw->weights[s], standard[s], 1e-6) << stat_name(s);
  EXPECT_LT(raw->performance.training_mae, 1e-6);
  EXPECT_NE(find_model(found.candidates, "Advanced Metric Regression"), nullptr);
  EXPECT_NE(find_model(found.candidates, "Correlation Regression"), nullptr);

  const TunedModel *ensemble = find_model(found.candidates, "Ensemble (Top 3)");
  ASSERT_NE(ensemble, nullptr);
  EXPECT_GT(ensemble->performance.residual_std, 0.0 - 1e-12);
  EXPECT_EQ(found.candidates.size(), 4u);
}

TEST(Discovery, TooFewRowsIsAWarningNotAFailure) {
  HistoricalGame tiny = synthetic_game("T1", 5);
  tiny.players.resize(4); // QB and three others
  const DiscoveryResult found = ModelDiscovery().discover({tiny});
  EXPECT_TRUE(found.candidates.empty());
  EXPECT_EQ(found.warnings.size(), 3u);
}

TEST(Discovery, HindsightModelsAreAveragedAndFailuresOmitted) {
  const auto training = synthetic_games(4, 200);
  StaticHindsightSource hindsight;
  StatWeights one = default_weights();
  StatWeights two = default_weights();
  one[Stat::RecYds] = 0.2;
  two[Stat::RecYds] = 0.0;
  hindsight.set("G1", one);
  hindsight.set("G2", two);

  const DiscoveryResult found = ModelDiscovery().discover(training, &hindsight);
  const TunedModel *avg =
      find_model(found.candidates, "Averaged Hindsight Model");
  ASSERT_NE(avg, nullptr);
  EXPECT_NEAR(avg->weights[Stat::RecYds], 0.1, 1e-12);
  EXPECT_EQ(std::count_if(found.warnings.begin(), found.warnings.end(),
                          [](const std::string &w) {
                            return w.find("no hindsight model") !=
                                   std::string::npos;
                          }),
            2);

  ThrowingHindsight broken;
  const DiscoveryResult degraded = ModelDiscovery().discover(training, &broken);
  EXPECT_EQ(find_model(degraded.candidates, "Averaged Hindsight Model"),
            nullptr);
  EXPECT_EQ(degraded.candidates.size(), 4u);
  EXPECT_GE(degraded.warnings.size(), 4u);
}

TEST(Discovery, CancelledBeforeFitting) {
  CancellationToken token;
  token.cancel();
  RunContext ctx;
  ctx.cancel = &token;
  EXPECT_THROW(ModelDiscovery().discover(synthetic_games(4, 1), nullptr, ctx),
               Cancelled);
}

TEST(Validator, RanksByValidationError) {
  const auto training = synthetic_games(4, 300);
  const auto validation = synthetic_games(2, 900);
  DiscoveryResult found = ModelDiscovery().discover(training);
  const auto ranked = validate_models(found.candidates, validation);
  ASSERT_EQ(ranked.size(), found.candidates.size());
  for (std::size_t i = 0; i < ranked.size(); ++i) {
    ASSERT_TRUE(ranked[i].performance.validation_mae.has_value());
    ASSERT_TRUE(ranked[i].performance.calibration.has_value());
    EXPECT_GT(ranked[i].performance.calibration->samples, 0u);
    if (i > 0) {
      EXPECT_LE(*ranked[i - 1].performance.validation_mae,
                *ranked[i].performance.validation_mae);
    }
  }
  EXPECT_LT(*ranked.front().performance.validation_mae, 1e-6);

  const auto points = collect_predictions(default_weights(), validation);
  for (const auto &p : points) {
    EXPECT_NE(p.actual, 0.0);
    EXPECT_NEAR(p.predicted, p.actual, 1e-9);
  }
}

TEST(ModelValidator, NoValidationGamesLeavesModelsUnvalidated) {
  const auto training = synthetic_games(4, 300);
  DiscoveryResult found = ModelDiscovery().discover(training);
  ASSERT_FALSE(found.candidates.empty());
  const auto ranked = validate_models(found.candidates, {});
  ASSERT_EQ(ranked.size(), found.candidates.size());
  for (const auto &m : ranked) {
    EXPECT_FALSE(m.performance.validation_mae.has_value()) << m.name;
    EXPECT_FALSE(m.performance.calibration.has_value()) << m.name;
  }
}
