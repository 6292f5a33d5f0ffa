#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "showdown/player.hpp"
#include "showdown/projection.hpp"

namespace showdown {

constexpr double kDefaultCaptainMultiplier = 1.5;

// Canonical (captain id, sorted other ids) identity of a roster.
struct LineupSignature {
  std::string captain_id;
  std::vector<std::string> other_ids; // sorted

  LineupSignature() = default;
  LineupSignature(std::string captain, std::vector<std::string> others);

  std::string to_string() const;

  bool operator<(const LineupSignature &o) const {
    if (captain_id != o.captain_id)
      return captain_id < o.captain_id;
    return other_ids < o.other_ids;
  }
  bool operator==(const LineupSignature &o) const {
    return captain_id == o.captain_id && other_ids == o.other_ids;
  }
};

struct Lineup {
  Player captain;
  std::vector<Player> others;

  std::size_t size() const { return others.size() + 1; }
  bool contains(const std::string &player_id) const;
  std::vector<std::string> ids() const; // captain first

  std::int64_t total_salary() const;
  // Captain scored at `captain_multiplier`, everyone else at 1x.
  double total_score(ScoringMode mode,
                     double captain_multiplier = kDefaultCaptainMultiplier) const;

  LineupSignature signature() const;
  // Per-team player counts, descending, e.g. "4-1".
  std::string stack_signature() const;
};

} // namespace showdown
