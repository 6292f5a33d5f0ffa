#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "showdown/stats.hpp"

namespace showdown {

struct CalibrationReport {
  double mae{0.0};
  // Continuous ranked probability score, averaged over samples.
  double crps{0.0};
  // KS test of the PIT values against U(0, 1); near 1 is well calibrated.
  double pit_ks_p_value{1.0};
  // Percent of actuals inside the predictive 25th-75th percentile band.
  double p50_coverage{0.0};
  std::size_t samples{0};
};

struct ModelPerformance {
  double training_mae{0.0};
  // Spread of training residuals; sets the width of predictive distributions.
  double residual_std{0.0};
  std::optional<double> validation_mae;
  std::optional<CalibrationReport> calibration;
};

struct TunedModel {
  std::string id;
  std::string name;
  // Microseconds since epoch, strictly increasing within a process.
  std::int64_t created_at{0};
  StatWeights weights;
  std::string source_description;
  ModelPerformance performance;
};

// Builds a model with a fresh id and creation stamp.
TunedModel make_model(const std::string &name, const StatWeights &weights,
                      const std::string &source_description);

// Lower validation MAE first (missing last), newer first on ties.
bool ranks_before(const TunedModel &a, const TunedModel &b);
void rank_models(std::vector<TunedModel> &models);

struct ValidationReport {
  std::size_t training_set_size{0};
  std::size_t validation_set_size{0};
  std::vector<TunedModel> models;
  std::vector<std::string> warnings;
};

} // namespace showdown
