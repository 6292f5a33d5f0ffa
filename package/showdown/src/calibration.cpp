#include "showdown/calibration.hpp"
#include "showdown/projection.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace showdown {

double mean_absolute_error(const std::vector<PredictionPoint> &points) {
  if (points.empty())
    return 0.0;
  double total = 0.0;
  for (const auto &p : points)
    total += std::abs(p.predicted - p.actual);
  return total / static_cast<double>(points.size());
}

double residual_std(const std::vector<PredictionPoint> &points) {
  if (points.empty())
    return 0.0;
  double total = 0.0;
  for (const auto &p : points) {
    const double r = p.actual - p.predicted;
    total += r * r;
  }
  return std::sqrt(total / static_cast<double>(points.size()));
}

double ks_uniform_p_value(std::vector<double> values) {
  if (values.empty())
    return 1.0;
  std::sort(values.begin(), values.end());
  const double n = static_cast<double>(values.size());
  double d = 0.0;
  for (std::size_t i = 0; i < values.size(); ++i) {
    const double u = std::min(1.0, std::max(0.0, values[i]));
    d = std::max(d, (i + 1) / n - u);
    d = std::max(d, u - i / n);
  }

  const double sqrt_n = std::sqrt(n);
  const double lambda = (sqrt_n + 0.12 + 0.11 / sqrt_n) * d;
  const double a2 = -2.0 * lambda * lambda;
  double fac = 2.0, sum = 0.0, previous = 0.0;
  for (int j = 1; j <= 100; ++j) {
    const double term = fac * std::exp(a2 * j * j);
    sum += term;
    if (std::abs(term) <= 0.001 * previous || std::abs(term) <= 1e-8 * sum)
      return std::min(1.0, std::max(0.0, sum));
    fac = -fac;
    previous = std::abs(term);
  }
  // series failed to converge, which only happens as lambda -> 0
  return 1.0;
}

CalibrationReport calibration_report(const std::vector<PredictionPoint> &points,
                                     double spread,
                                     const CalibrationConfig &cfg) {
  CalibrationReport rep;
  rep.samples = points.size();
  if (points.empty())
    return rep;

  const double sigma = std::max(spread, cfg.min_spread);
  std::vector<double> pit;
  pit.reserve(points.size());
  double crps_total = 0.0;
  std::size_t covered = 0;
  for (const auto &p : points) {
    const Triangular dist = Triangular::symmetric(p.predicted, sigma);
    crps_total += dist.crps(p.actual, cfg.crps_steps);
    pit.push_back(dist.cdf(p.actual));
    if (p.actual >= dist.quantile(0.25) && p.actual <= dist.quantile(0.75))
      ++covered;
  }
  const double n = static_cast<double>(points.size());
  rep.mae = mean_absolute_error(points);
  rep.crps = crps_total / n;
  rep.pit_ks_p_value = ks_uniform_p_value(std::move(pit));
  rep.p50_coverage = 100.0 * static_cast<double>(covered) / n;
  return rep;
}

} // namespace showdown
