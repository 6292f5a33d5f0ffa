#include "showdown/evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace showdown {

namespace {

double pair_correlation(const Player &a, const Player &b) {
  const double ab = a.correlation_with(b.id);
  return ab != 0.0 ? ab : b.correlation_with(a.id);
}

} // namespace

LineupMetrics evaluate_lineup(const Lineup &lineup,
                              const EvaluatorConfig &cfg) {
  LineupMetrics m;
  m.total_mean = lineup.total_score(ScoringMode::Mean, cfg.captain_multiplier);
  m.total_ceiling =
      lineup.total_score(ScoringMode::Ceiling, cfg.captain_multiplier);
  m.total_salary = lineup.total_salary();
  m.stack_signature = lineup.stack_signature();

  // Captain slot is owned at captain rates, everyone else at flex rates.
  double ownership_total = lineup.captain.ownership_captain;
  double product = lineup.captain.ownership_captain > 0.0
                       ? lineup.captain.ownership_captain / 100.0
                       : cfg.ownership_floor;
  for (const auto &p : lineup.others) {
    ownership_total += p.ownership_flex;
    product *= p.ownership_flex > 0.0 ? p.ownership_flex / 100.0
                                      : cfg.ownership_floor;
  }
  m.average_ownership = ownership_total / static_cast<double>(lineup.size());
  double leverage_total = lineup.captain.leverage;
  for (const auto &p : lineup.others)
    leverage_total += p.leverage;
  m.leverage_score = leverage_total / static_cast<double>(lineup.size());
  m.ownership_product = product;

  std::vector<const Player *> roster{&lineup.captain};
  for (const auto &p : lineup.others)
    roster.push_back(&p);
  int pairs = 0;
  for (std::size_t i = 0; i < roster.size(); ++i) {
    for (std::size_t j = i + 1; j < roster.size(); ++j) {
      m.correlation_sum += pair_correlation(*roster[i], *roster[j]);
      ++pairs;
    }
  }
  m.average_correlation = pairs > 0 ? m.correlation_sum / pairs : 0.0;

  // Expected copies of this exact roster in the field beyond our own entry;
  // EV rewards ceiling and decays with that risk.
  m.duplication_risk = std::max(0.0, product * cfg.field_size - 1.0);
  m.expected_value = m.total_ceiling / (1.0 + std::sqrt(m.duplication_risk));
  m.roi_score = m.total_ceiling * (1.0 + m.correlation_sum) *
                (1.0 / (std::pow(product, 0.25) + 0.001)) *
                (m.leverage_score / 100.0);
  return m;
}

} // namespace showdown
