#pragma once

#include <utility>
#include <vector>

#include "showdown/constraints.hpp"
#include "showdown/lineup.hpp"
#include "showdown/player.hpp"
#include "showdown/solver.hpp"

namespace showdown {

struct GeneratorOptions {
  int num_lineups{1};
  ScoringMode mode{ScoringMode::Mean};
  // Fraction of the requested lineups any unlocked player may appear in.
  // 1.0 disables the cap.
  double max_exposure{1.0};
};

// Produces up to `num_lineups` distinct lineups by re-solving with a cut for
// every lineup already emitted. Stops early, without error, once the solver
// returns no lineup; a solver failure is logged as a warning. Holds no state
// between calls.
class LineupGenerator {
public:
  LineupGenerator() = default;
  explicit LineupGenerator(LineupSolver solver) : solver_(std::move(solver)) {}

  std::vector<Lineup> generate(const PlayerTable &pool,
                               const RosterConstraintSet &cons,
                               const GeneratorOptions &opts) const;

  const LineupSolver &solver() const { return solver_; }

private:
  LineupSolver solver_{};
};

} // namespace showdown
