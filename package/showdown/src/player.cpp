#include "showdown/player.hpp"
#include "showdown/errors.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

namespace showdown {

Position parse_position(const std::string &text) {
  std::string upper(text);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "QB")
    return Position::QB;
  if (upper == "RB")
    return Position::RB;
  if (upper == "WR")
    return Position::WR;
  if (upper == "TE")
    return Position::TE;
  if (upper == "K")
    return Position::K;
  if (upper == "D" || upper == "DEF" || upper == "DST" || upper == "D/ST")
    return Position::DST;
  throw ValidationError(fmt::format("Unknown position '{}'", text));
}

std::string to_string(Position pos) {
  switch (pos) {
  case Position::QB:
    return "QB";
  case Position::RB:
    return "RB";
  case Position::WR:
    return "WR";
  case Position::TE:
    return "TE";
  case Position::K:
    return "K";
  case Position::DST:
    return "DST";
  }
  return "?";
}

void PlayerTable::add_player(const Player &p) {
  if (p.id.empty()) {
    throw ValidationError(fmt::format("Player '{}' has an empty id", p.name));
  }
  if (p.salary < 0) {
    throw ValidationError(fmt::format("Player {} ({}) has negative salary {}",
                                      p.id, p.name, p.salary));
  }
  if (has_id(p.id)) {
    throw ValidationError(fmt::format("Duplicate player id {}", p.id));
  }
  const std::size_t idx = players_.size();
  players_.push_back(p);
  id_index_[p.id] = idx;
}

} // namespace showdown
