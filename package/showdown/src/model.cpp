#include "showdown/model.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <limits>

#include <fmt/format.h>

namespace showdown {

namespace {

std::atomic<std::int64_t> last_stamp{0};

std::int64_t next_stamp() {
  const std::int64_t now =
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count();
  std::int64_t prev = last_stamp.load();
  std::int64_t next = std::max(now, prev + 1);
  while (!last_stamp.compare_exchange_weak(prev, next))
    next = std::max(now, prev + 1);
  return next;
}

} // namespace

TunedModel make_model(const std::string &name, const StatWeights &weights,
                      const std::string &source_description) {
  TunedModel m;
  m.name = name;
  m.created_at = next_stamp();
  std::string slug = name;
  std::replace(slug.begin(), slug.end(), ' ', '_');
  m.id = fmt::format("{}_{}", slug, m.created_at);
  m.weights = weights;
  m.source_description = source_description;
  return m;
}

bool ranks_before(const TunedModel &a, const TunedModel &b) {
  const double inf = std::numeric_limits<double>::infinity();
  const double ma = a.performance.validation_mae.value_or(inf);
  const double mb = b.performance.validation_mae.value_or(inf);
  if (ma != mb)
    return ma < mb;
  return a.created_at > b.created_at;
}

void rank_models(std::vector<TunedModel> &models) {
  std::stable_sort(models.begin(), models.end(), ranks_before);
}

} // namespace showdown
