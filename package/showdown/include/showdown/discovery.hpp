#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "showdown/historical.hpp"
#include "showdown/model.hpp"
#include "showdown/progress.hpp"

namespace showdown {

// External supplier of hindsight-optimal weights for a finished game (for
// instance a generative model). May return nullopt or throw; either way the
// game simply contributes nothing.
class HindsightSource {
public:
  virtual ~HindsightSource() = default;
  virtual std::optional<StatWeights> hindsight_weights(const HistoricalGame &game) = 0;
};

// Fixed game_id -> weights table.
class StaticHindsightSource : public HindsightSource {
public:
  void set(const std::string &game_id, const StatWeights &weights) {
    weights_[game_id] = weights;
  }
  std::optional<StatWeights> hindsight_weights(const HistoricalGame &game) override {
    auto it = weights_.find(game.game_id);
    if (it == weights_.end())
      return std::nullopt;
    return it->second;
  }

private:
  std::map<std::string, StatWeights> weights_;
};

struct DiscoveryConfig {
  int top_k_ensemble{3};
  bool fit_raw{true};
  bool fit_advanced{true};
  bool fit_correlation{true};
};

// Labelled regression problem: one row per player-game.
struct FeatureMatrix {
  Eigen::MatrixXd x;
  Eigen::VectorXd y;
  std::vector<Stat> keys;
};

// Rows for players with positive actual points. `require_signal` drops rows
// whose features are all zero; `skip_quarterbacks` drops QB rows.
FeatureMatrix build_feature_matrix(const std::vector<HistoricalGame> &games,
                                   const std::vector<Stat> &keys,
                                   bool require_signal, bool skip_quarterbacks);

// Ordinary least squares without intercept. nullopt when there are no more
// rows than features.
std::optional<Eigen::VectorXd> fit_least_squares(const FeatureMatrix &fm);

// Coefficients written over default_weights(); non-finite values become 0.
StatWeights weights_from_coefficients(const Eigen::VectorXd &coefficients,
                                      const std::vector<Stat> &keys);

struct DiscoveryResult {
  std::vector<TunedModel> candidates;
  std::vector<std::string> warnings;
};

class ModelDiscovery {
public:
  ModelDiscovery() = default;
  explicit ModelDiscovery(DiscoveryConfig cfg) : cfg_(cfg) {}

  // Regression candidates, an averaged hindsight candidate when `hindsight`
  // yields anything, and an ensemble of the best training performers when
  // there are at least two candidates. Every candidate carries its training
  // MAE and residual spread.
  DiscoveryResult discover(const std::vector<HistoricalGame> &training,
                           HindsightSource *hindsight = nullptr,
                           const RunContext &ctx = {}) const;

  const DiscoveryConfig &config() const { return cfg_; }

private:
  DiscoveryConfig cfg_{};
};

} // namespace showdown
