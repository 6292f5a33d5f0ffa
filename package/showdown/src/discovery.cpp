#include "showdown/discovery.hpp"
#include "showdown/logging.hpp"
#include "showdown/validator.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>

#include <fmt/format.h>

namespace showdown {

FeatureMatrix build_feature_matrix(const std::vector<HistoricalGame> &games,
                                   const std::vector<Stat> &keys,
                                   bool require_signal,
                                   bool skip_quarterbacks) {
  std::vector<std::vector<double>> rows;
  std::vector<double> targets;
  for (const auto &game : games) {
    const std::vector<StatLine> features = game_features(game);
    for (std::size_t i = 0; i < game.players.size(); ++i) {
      const auto &p = game.players[i];
      if (p.actual_fantasy_points <= 0.0)
        continue;
      if (skip_quarterbacks && p.position == Position::QB)
        continue;
      std::vector<double> row;
      row.reserve(keys.size());
      for (const Stat s : keys)
        row.push_back(features[i][s]);
      if (require_signal &&
          std::all_of(row.begin(), row.end(),
                      [](double v) { return v == 0.0; }))
        continue;
      rows.push_back(std::move(row));
      targets.push_back(p.actual_fantasy_points);
    }
  }

  FeatureMatrix fm;
  fm.keys = keys;
  fm.x.resize(static_cast<Eigen::Index>(rows.size()),
              static_cast<Eigen::Index>(keys.size()));
  fm.y.resize(static_cast<Eigen::Index>(targets.size()));
  for (std::size_t r = 0; r < rows.size(); ++r) {
    for (std::size_t c = 0; c < keys.size(); ++c)
      fm.x(r, c) = rows[r][c];
    fm.y(r) = targets[r];
  }
  return fm;
}

std::optional<Eigen::VectorXd> fit_least_squares(const FeatureMatrix &fm) {
  if (fm.x.rows() <= fm.x.cols() || fm.x.cols() == 0)
    return std::nullopt;
  // Rank-revealing QR so all-zero or collinear columns get zero weight.
  Eigen::VectorXd beta = fm.x.colPivHouseholderQr().solve(fm.y);
  return beta;
}

StatWeights weights_from_coefficients(const Eigen::VectorXd &coefficients,
                                      const std::vector<Stat> &keys) {
  StatWeights w = default_weights();
  for (std::size_t i = 0; i < keys.size() &&
                          static_cast<Eigen::Index>(i) < coefficients.size();
       ++i) {
    const double c = coefficients(static_cast<Eigen::Index>(i));
    w[keys[i]] = std::isfinite(c) ? c : 0.0;
  }
  return w;
}

namespace {

struct Family {
  std::string name;
  std::vector<Stat> keys;
  bool require_signal;
  bool skip_quarterbacks;
  std::string description;
};

std::vector<Stat> concat(std::vector<Stat> a, const std::vector<Stat> &b) {
  a.insert(a.end(), b.begin(), b.end());
  return a;
}

} // namespace

DiscoveryResult ModelDiscovery::discover(const std::vector<HistoricalGame> &training,
                                         HindsightSource *hindsight,
                                         const RunContext &ctx) const {
  DiscoveryResult out;
  auto warn = [&](const std::string &msg) {
    logger()->warn("discovery: {}", msg);
    out.warnings.push_back(msg);
  };

  std::vector<Family> families;
  if (cfg_.fit_raw) {
    families.push_back({"Raw Stat Regression", stats_in(StatGroup::Raw), true,
                        false, "raw box-score stats"});
  }
  if (cfg_.fit_advanced) {
    families.push_back(
        {"Advanced Metric Regression",
         concat(concat(stats_in(StatGroup::Advanced), stats_in(StatGroup::Team)),
                stats_in(StatGroup::Situational)),
         true, false, "advanced player, team and situational metrics"});
  }
  if (cfg_.fit_correlation) {
    families.push_back({"Correlation Regression",
                        concat(stats_in(StatGroup::Raw),
                               stats_in(StatGroup::Correlation)),
                        false, true,
                        "raw stats plus quarterback and top-teammate output"});
  }

  for (const auto &fam : families) {
    ctx.check_cancelled("fitting " + fam.name);
    const FeatureMatrix fm = build_feature_matrix(training, fam.keys,
                                                  fam.require_signal,
                                                  fam.skip_quarterbacks);
    const auto beta = fit_least_squares(fm);
    if (!beta) {
      warn(fmt::format("skipped {}: {} usable rows for {} features", fam.name,
                       fm.x.rows(), fm.keys.size()));
      continue;
    }
    out.candidates.push_back(make_model(
        fam.name, weights_from_coefficients(*beta, fam.keys),
        fmt::format("Least squares on {} from {} player-games",
                    fam.description, fm.x.rows())));
  }

  if (hindsight) {
    std::vector<StatWeights> collected;
    for (const auto &game : training) {
      ctx.check_cancelled("hindsight model for " + game.game_id);
      try {
        auto w = hindsight->hindsight_weights(game);
        if (w)
          collected.push_back(*w);
        else
          warn(fmt::format("no hindsight model for {}", game.game_id));
      } catch (const std::exception &e) {
        warn(fmt::format("hindsight model for {} failed: {}", game.game_id,
                         e.what()));
      }
    }
    if (!collected.empty()) {
      out.candidates.push_back(make_model(
          "Averaged Hindsight Model", average_weights(collected),
          fmt::format("Averaged from {} hindsight-analysed games",
                      collected.size())));
    }
  }

  for (auto &m : out.candidates)
    score_on_training(m, training);

  if (out.candidates.size() >= 2 && cfg_.top_k_ensemble > 0) {
    ctx.check_cancelled("building ensemble");
    std::vector<const TunedModel *> ranked;
    for (const auto &m : out.candidates)
      ranked.push_back(&m);
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const TunedModel *a, const TunedModel *b) {
                       return a->performance.training_mae <
                              b->performance.training_mae;
                     });
    const std::size_t k =
        std::min(ranked.size(), static_cast<std::size_t>(cfg_.top_k_ensemble));
    std::vector<StatWeights> top;
    for (std::size_t i = 0; i < k; ++i) {
      top.push_back(ranked[i]->weights);
    }
    TunedModel ensemble = make_model(
        fmt::format("Ensemble (Top {})", k), average_weights(top),
        fmt::format("Average of the {} best training candidates", k));
    score_on_training(ensemble, training);
    out.candidates.push_back(std::move(ensemble));
  }

  logger()->info("discovery: {} candidate models from {} training games",
                 out.candidates.size(), training.size());
  return out;
}

} // namespace showdown
