#include "showdown/lineup.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace showdown {

LineupSignature::LineupSignature(std::string captain,
                                 std::vector<std::string> others)
    : captain_id(std::move(captain)), other_ids(std::move(others)) {
  std::sort(other_ids.begin(), other_ids.end());
}

std::string LineupSignature::to_string() const {
  if (other_ids.empty())
    return captain_id;
  return fmt::format("{},{}", captain_id, fmt::join(other_ids, ","));
}

bool Lineup::contains(const std::string &player_id) const {
  if (captain.id == player_id)
    return true;
  return std::any_of(others.begin(), others.end(),
                     [&](const Player &p) { return p.id == player_id; });
}

std::vector<std::string> Lineup::ids() const {
  std::vector<std::string> out;
  out.reserve(size());
  out.push_back(captain.id);
  for (const auto &p : others)
    out.push_back(p.id);
  return out;
}

std::int64_t Lineup::total_salary() const {
  std::int64_t total = captain.salary;
  for (const auto &p : others)
    total += p.salary;
  return total;
}

double Lineup::total_score(ScoringMode mode, double captain_multiplier) const {
  double total = target_score(captain, mode) * captain_multiplier;
  for (const auto &p : others)
    total += target_score(p, mode);
  return total;
}

LineupSignature Lineup::signature() const {
  std::vector<std::string> other_ids;
  other_ids.reserve(others.size());
  for (const auto &p : others)
    other_ids.push_back(p.id);
  return LineupSignature(captain.id, std::move(other_ids));
}

std::string Lineup::stack_signature() const {
  std::map<std::string, int> team_counts;
  ++team_counts[captain.team];
  for (const auto &p : others)
    ++team_counts[p.team];
  std::vector<int> counts;
  for (const auto &kv : team_counts)
    counts.push_back(kv.second);
  std::sort(counts.begin(), counts.end(), std::greater<int>());
  return fmt::format("{}", fmt::join(counts, "-"));
}

} // namespace showdown
