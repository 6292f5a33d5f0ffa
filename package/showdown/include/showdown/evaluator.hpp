#pragma once

#include <cstdint>
#include <string>

#include "showdown/lineup.hpp"

namespace showdown {

// Heuristic contest constants. Tunable; nothing downstream depends on the
// exact values.
struct EvaluatorConfig {
  double captain_multiplier{kDefaultCaptainMultiplier};
  double field_size{100000.0};
  // Stand-in for a 0% ownership so the product never collapses to zero.
  double ownership_floor{0.0001};
};

struct LineupMetrics {
  double total_mean{0.0};
  double total_ceiling{0.0};
  std::int64_t total_salary{0};
  double average_ownership{0.0}; // percent
  double ownership_product{0.0}; // product of ownership fractions
  double correlation_sum{0.0};
  double average_correlation{0.0};
  std::string stack_signature;
  double duplication_risk{0.0};
  double expected_value{0.0};
  // Mean of the players' leverage values.
  double leverage_score{0.0};
  // Older ranking score kept for the results table: ceiling boosted by
  // correlation and leverage, scaled up for rare rosters.
  double roi_score{0.0};
};

// Pure; calling it twice on the same lineup yields identical metrics.
LineupMetrics evaluate_lineup(const Lineup &lineup,
                              const EvaluatorConfig &cfg = {});

} // namespace showdown
