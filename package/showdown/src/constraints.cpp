#include "showdown/constraints.hpp"
#include "showdown/errors.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace showdown {

void validate_constraints(const RosterConstraintSet &cons,
                          const PlayerTable &pool) {
  if (cons.salary_cap <= 0) {
    throw ValidationError(
        fmt::format("Salary cap must be positive, got {}", cons.salary_cap));
  }
  if (cons.roster_size < 2) {
    throw ValidationError(fmt::format(
        "Roster size must be at least 2 (captain plus one), got {}",
        cons.roster_size));
  }
  for (const auto &kv : cons.max_per_position) {
    if (kv.second < 0) {
      throw ValidationError(fmt::format("Negative cap {} for position {}",
                                        kv.second, to_string(kv.first)));
    }
  }
  for (const auto &id : cons.locked_ids) {
    if (cons.excluded_ids.count(id)) {
      throw ValidationError(
          fmt::format("Player {} is both locked and excluded", id));
    }
    if (!pool.has_id(id)) {
      throw ValidationError(
          fmt::format("Locked player {} is not in the player pool", id));
    }
  }
  for (const auto &id : cons.excluded_ids) {
    if (!pool.has_id(id)) {
      throw ValidationError(
          fmt::format("Excluded player {} is not in the player pool", id));
    }
  }
}

std::vector<StrategyPreset> strategy_presets() {
  std::vector<StrategyPreset> out;

  StrategyPreset balanced;
  balanced.name = "Balanced Attack";
  balanced.description =
      "Does not force stacks; lets the optimizer find raw value.";
  balanced.constraints.max_per_position = {{Position::K, 1},
                                           {Position::DST, 1}};
  out.push_back(balanced);

  StrategyPreset shootout;
  shootout.name = "Shootout";
  shootout.description = "Captain stacked with a pass catcher plus an "
                         "opposing bring-back, for high-scoring games.";
  shootout.constraints.max_per_position = {{Position::K, 1},
                                           {Position::DST, 1}};
  shootout.constraints.require_captain_stack = true;
  shootout.constraints.require_opponent_bring_back = true;
  shootout.constraints.stack_partner_positions = {Position::WR, Position::TE};
  out.push_back(shootout);

  StrategyPreset team_stack;
  team_stack.name = "Team Stack";
  team_stack.description =
      "Captain stacked with a pass catcher, no bring-back.";
  team_stack.constraints.max_per_position = {{Position::K, 1},
                                             {Position::DST, 1}};
  team_stack.constraints.require_captain_stack = true;
  team_stack.constraints.stack_partner_positions = {Position::WR,
                                                    Position::TE};
  out.push_back(team_stack);

  StrategyPreset grind;
  grind.name = "Grind It Out";
  grind.description = "Low-scoring games: no stacks, up to two kickers and "
                      "two defenses.";
  grind.constraints.max_per_position = {{Position::K, 2}, {Position::DST, 2}};
  out.push_back(grind);

  return out;
}

RosterConstraintSet preset_constraints(const std::string &name,
                                       std::int64_t salary_cap) {
  for (const auto &preset : strategy_presets()) {
    if (preset.name == name) {
      RosterConstraintSet cons = preset.constraints;
      cons.salary_cap = salary_cap;
      return cons;
    }
  }
  throw std::out_of_range("Unknown strategy preset: " + name);
}

} // namespace showdown
