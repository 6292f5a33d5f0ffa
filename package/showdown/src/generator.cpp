#include "showdown/generator.hpp"
#include "showdown/errors.hpp"
#include "showdown/logging.hpp"

#include <cmath>
#include <map>
#include <set>
#include <string>

#include <fmt/format.h>

namespace showdown {

std::vector<Lineup> LineupGenerator::generate(const PlayerTable &pool,
                                              const RosterConstraintSet &cons,
                                              const GeneratorOptions &opts) const {
  if (opts.num_lineups < 0) {
    throw ValidationError(
        fmt::format("Lineup count must be non-negative, got {}",
                    opts.num_lineups));
  }
  if (!(opts.max_exposure > 0.0 && opts.max_exposure <= 1.0)) {
    throw ValidationError(fmt::format(
        "Max exposure must be in (0, 1], got {}", opts.max_exposure));
  }
  validate_constraints(cons, pool);

  std::vector<Lineup> lineups;
  std::set<LineupSignature> forbidden;
  std::set<std::string> capped;
  std::map<std::string, int> appearances;
  const int exposure_limit = static_cast<int>(
      std::ceil(opts.max_exposure * opts.num_lineups - 1e-9));

  for (int i = 0; i < opts.num_lineups; ++i) {
    auto outcome = solver_.run(pool, cons, opts.mode, forbidden, capped);
    if (!outcome.lineup) {
      if (outcome.status == SolveStatus::Failed) {
        logger()->warn("generator: stopped after {} of {} lineups, solver "
                       "failed: {}",
                       lineups.size(), opts.num_lineups, outcome.message);
      } else {
        logger()->info("generator: stopped after {} of {} lineups, no further "
                       "feasible unique lineup",
                       lineups.size(), opts.num_lineups);
      }
      break;
    }
    auto &next = outcome.lineup;
    forbidden.insert(next->signature());
    if (opts.max_exposure < 1.0) {
      for (const auto &id : next->ids()) {
        if (cons.locked_ids.count(id))
          continue;
        if (++appearances[id] >= exposure_limit)
          capped.insert(id);
      }
    }
    lineups.push_back(std::move(*next));
  }
  return lineups;
}

} // namespace showdown
