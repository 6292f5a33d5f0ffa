#pragma once

#include <vector>

#include "showdown/model.hpp"

namespace showdown {

struct PredictionPoint {
  double predicted{0.0};
  double actual{0.0};
};

struct CalibrationConfig {
  // Lower bound on the predictive standard deviation, in fantasy points.
  double min_spread{1.0};
  int crps_steps{400};
};

double mean_absolute_error(const std::vector<PredictionPoint> &points);
// Root mean square of actual - predicted.
double residual_std(const std::vector<PredictionPoint> &points);

// One-sample Kolmogorov-Smirnov p-value of `values` against U(0, 1)
// (asymptotic Kolmogorov distribution with Stephens' small-sample factor).
double ks_uniform_p_value(std::vector<double> values);

// Every prediction is read as Triangular::symmetric(predicted, spread) with
// spread = max(residual std, min_spread); CRPS, PIT and coverage are taken
// against that distribution.
CalibrationReport calibration_report(const std::vector<PredictionPoint> &points,
                                     double spread,
                                     const CalibrationConfig &cfg = {});

} // namespace showdown
