#pragma once

#include <optional>
#include <set>
#include <string>

#include "showdown/constraints.hpp"
#include "showdown/lineup.hpp"
#include "showdown/player.hpp"
#include "showdown/projection.hpp"

namespace showdown {

struct SolverConfig {
  double captain_multiplier{kDefaultCaptainMultiplier};
  // Per-solve limit handed to glp_intopt, in milliseconds. 0 means no limit.
  int time_limit_ms{0};
  // Relative gap at which branch and bound may stop. 0 proves optimality.
  double mip_gap{0.0};
};

enum class SolveStatus {
  Optimal,
  // Stopped on the time limit holding an integer-feasible lineup.
  Feasible,
  Infeasible,
  // GLPK gave up (time limit without incumbent, numerical trouble).
  Failed
};

const char *to_string(SolveStatus status);

struct SolveOutcome {
  SolveStatus status{SolveStatus::Infeasible};
  std::optional<Lineup> lineup;
  std::string message;
};

// Integer-program encoding of a single Showdown lineup, solved with GLPK.
//
// Two binaries per eligible player: r_i (rostered) and c_i (captain). Rows:
// sum r = roster size, sum c = 1, c_i <= r_i, salary, position caps,
// optional captain stack / bring-back, and one cut per forbidden signature.
// Locked players have r_i fixed at 1. The objective counts the captain once
// through r_i and again at (multiplier - 1) through c_i.
class LineupSolver {
public:
  LineupSolver() = default;
  explicit LineupSolver(SolverConfig cfg);

  // Throws ValidationError on malformed constraints, never on solver
  // trouble. `also_excluded` removes extra players for this call only and
  // must not contain locked ids.
  SolveOutcome run(const PlayerTable &pool, const RosterConstraintSet &cons,
                   ScoringMode mode,
                   const std::set<LineupSignature> &forbidden = {},
                   const std::set<std::string> &also_excluded = {}) const;

  // Best feasible lineup, or nullopt when none was found.
  std::optional<Lineup> solve(const PlayerTable &pool,
                              const RosterConstraintSet &cons,
                              ScoringMode mode,
                              const std::set<LineupSignature> &forbidden = {},
                              const std::set<std::string> &also_excluded = {}) const {
    return run(pool, cons, mode, forbidden, also_excluded).lineup;
  }

  const SolverConfig &config() const { return cfg_; }

private:
  SolverConfig cfg_{};
};

} // namespace showdown
