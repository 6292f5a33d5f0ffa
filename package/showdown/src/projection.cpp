#include "showdown/projection.hpp"
#include "showdown/errors.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

namespace showdown {

double Triangular::cdf(double x) const {
  if (x < low)
    return 0.0;
  if (x >= high)
    return 1.0;
  const double range = high - low;
  if (x <= mode) {
    const double left = mode - low;
    return left > 0.0 ? (x - low) * (x - low) / (range * left) : 0.0;
  }
  const double right = high - mode;
  return right > 0.0 ? 1.0 - (high - x) * (high - x) / (range * right) : 1.0;
}

double Triangular::quantile(double p) const {
  p = std::min(1.0, std::max(0.0, p));
  const double range = high - low;
  if (range <= 0.0)
    return mode;
  const double c = (mode - low) / range;
  if (p < c)
    return low + std::sqrt(p * range * (mode - low));
  return high - std::sqrt((1.0 - p) * range * (high - mode));
}

double Triangular::crps(double y, int steps) const {
  steps = std::max(steps, 1);
  // integral of F(x)^2 below y plus (1 - F(x))^2 above y; both vanish
  // outside [min(low, y), max(high, y)]
  const double a = std::min(low, y);
  const double b = std::max(high, y);
  double total = 0.0;
  if (y > a) {
    const double h = (y - a) / steps;
    for (int i = 0; i < steps; ++i) {
      const double f = cdf(a + (i + 0.5) * h);
      total += f * f * h;
    }
  }
  if (b > y) {
    const double h = (b - y) / steps;
    for (int i = 0; i < steps; ++i) {
      const double g = 1.0 - cdf(y + (i + 0.5) * h);
      total += g * g * h;
    }
  }
  return total;
}

ScoringMode parse_scoring_mode(const std::string &text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "mean")
    return ScoringMode::Mean;
  if (lower == "ceiling")
    return ScoringMode::Ceiling;
  throw ValidationError(fmt::format("Unknown scoring mode '{}'", text));
}

std::string to_string(ScoringMode mode) {
  return mode == ScoringMode::Ceiling ? "ceiling" : "mean";
}

} // namespace showdown
