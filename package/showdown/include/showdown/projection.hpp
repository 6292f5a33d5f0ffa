#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

#include <Eigen/Dense>

#include "showdown/player.hpp"
#include "showdown/stats.hpp"

namespace showdown {

// Simple triangular distribution parameterized by low <= mode <= high.
struct Triangular {
  double low{0.0};
  double mode{0.0};
  double high{0.0};

  Triangular() = default;
  Triangular(double low_, double mode_, double high_)
      : low(low_), mode(mode_), high(high_) {
    if (!(low <= mode && mode <= high)) {
      throw std::invalid_argument("Triangular: require low <= mode <= high");
    }
  }

  // Symmetric distribution around `center` with the given standard deviation.
  static Triangular symmetric(double center, double stddev) {
    const double half_width = std::max(0.0, stddev) * std::sqrt(6.0);
    return Triangular(center - half_width, center, center + half_width);
  }

  double mean() const { return (low + mode + high) / 3.0; }

  double variance() const {
    const double l = low, m = mode, h = high;
    return (l * l + m * m + h * h - l * m - l * h - m * h) / 18.0;
  }

  double cdf(double x) const;
  double quantile(double p) const;

  // Continuous ranked probability score of the observation y.
  double crps(double y, int steps = 400) const;

  Eigen::VectorXd sample(std::size_t n, std::uint64_t seed) const {
    if (n == 0)
      return {};
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> unif(0.0, 1.0);
    Eigen::VectorXd vec(n);
    for (std::size_t i = 0; i < n; ++i)
      vec(i) = quantile(unif(rng));
    return vec;
  }
};

enum class ScoringMode { Mean, Ceiling };

ScoringMode parse_scoring_mode(const std::string &text);
std::string to_string(ScoringMode mode);

// Score of the player under the chosen scenario.
inline double target_score(const Player &p, ScoringMode mode) {
  return mode == ScoringMode::Ceiling ? p.ceiling_score : p.mean_score;
}

// Per-player stat projections for both scenarios, as delivered by upstream
// enrichment.
struct StatProjection {
  StatLine mean;
  StatLine ceiling;
  double usage_boost{0.0};
};

// Maps stat projections to fantasy points with a fixed weight vector.
class ScoringModel {
public:
  ScoringModel() : weights_(default_weights()) {}
  explicit ScoringModel(StatWeights weights) : weights_(std::move(weights)) {}

  double score(const StatLine &stats) const { return dot(weights_, stats); }

  // Writes mean_score and ceiling_score, both including the usage boost.
  void apply(Player &player, const StatProjection &proj) const {
    player.mean_score = score(proj.mean) + proj.usage_boost;
    player.ceiling_score = score(proj.ceiling) + proj.usage_boost;
  }

  const StatWeights &weights() const { return weights_; }

private:
  StatWeights weights_;
};

} // namespace showdown
