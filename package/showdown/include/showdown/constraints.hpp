#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "showdown/player.hpp"

namespace showdown {

struct RosterConstraintSet {
  std::int64_t salary_cap{60000};
  // One captain plus roster_size - 1 others
  int roster_size{5};
  std::map<Position, int> max_per_position;
  std::set<std::string> locked_ids;
  std::set<std::string> excluded_ids;
  // Captain needs at least one selected teammate from stack_partner_positions
  // (any position when empty).
  bool require_captain_stack{false};
  // Only honoured together with require_captain_stack.
  bool require_opponent_bring_back{false};
  std::set<Position> stack_partner_positions;
};

// Throws ValidationError when the set is malformed on its own or against the
// pool. Over-locked salary is not malformed: the solver reports it as
// infeasible.
void validate_constraints(const RosterConstraintSet &cons,
                          const PlayerTable &pool);

struct StrategyPreset {
  std::string name;
  std::string description;
  RosterConstraintSet constraints;
};

std::vector<StrategyPreset> strategy_presets();
// Throws std::out_of_range for an unknown preset name.
RosterConstraintSet preset_constraints(const std::string &name,
                                       std::int64_t salary_cap = 60000);

} // namespace showdown
