#include "showdown/stats.hpp"

#include <stdexcept>
#include <unordered_map>

namespace showdown {

namespace {

const std::array<const char *, kNumStats> kStatNames = {
    "passYds",
    "passTds",
    "interceptions",
    "rushYds",
    "rushTds",
    "receptions",
    "recYds",
    "recTds",
    "fumblesLost",
    "airYards",
    "redZoneTouches",
    "targetShare",
    "rushAttemptShare",
    "yardsPerRouteRun",
    "aDOT",
    "yardsAfterCatch",
    "routesRun",
    "avoidedTackles",
    "yardsCreatedPerTouch",
    "playActionPassRate",
    "timeToThrow",
    "cleanPocketCompletion",
    "underPressureCompletion",
    "deepBallCompletion",
    "redZoneConversionRate",
    "offensiveLineRank",
    "defensiveLineRank",
    "passRushWinRate",
    "runStopWinRate",
    "secondaryCoverageRank",
    "playsPerGame",
    "neutralSituationPace",
    "neutralSituationPassRate",
    "coachingAggressivenessScore",
    "turnoverDifferential",
    "strengthOfSchedule",
    "weatherFactor",
    "homeFieldAdvantageScore",
    "qb_passYds",
    "qb_rushYds",
    "topTeammate_recYds",
    "topTeammate_rushYds",
    "topTeammate_receptions",
};

} // namespace

StatGroup stat_group(Stat s) {
  if (s <= Stat::FumblesLost)
    return StatGroup::Raw;
  if (s <= Stat::RedZoneConversionRate)
    return StatGroup::Advanced;
  if (s <= Stat::TurnoverDifferential)
    return StatGroup::Team;
  if (s <= Stat::HomeFieldAdvantageScore)
    return StatGroup::Situational;
  return StatGroup::Correlation;
}

std::vector<Stat> stats_in(StatGroup group) {
  std::vector<Stat> out;
  for (std::size_t i = 0; i < kNumStats; ++i) {
    const Stat s = static_cast<Stat>(i);
    if (stat_group(s) == group)
      out.push_back(s);
  }
  return out;
}

std::vector<Stat> all_stats() {
  std::vector<Stat> out;
  out.reserve(kNumStats);
  for (std::size_t i = 0; i < kNumStats; ++i)
    out.push_back(static_cast<Stat>(i));
  return out;
}

std::string stat_name(Stat s) { return kStatNames.at(idx(s)); }

Stat stat_from_name(const std::string &name) {
  static const std::unordered_map<std::string, Stat> lookup = [] {
    std::unordered_map<std::string, Stat> m;
    for (std::size_t i = 0; i < kNumStats; ++i)
      m.emplace(kStatNames[i], static_cast<Stat>(i));
    return m;
  }();
  auto it = lookup.find(name);
  if (it == lookup.end()) {
    throw std::out_of_range("Unknown stat name: " + name);
  }
  return it->second;
}

StatWeights default_weights() {
  StatWeights w;
  w[Stat::PassYds] = 0.04;
  w[Stat::PassTds] = 4.0;
  w[Stat::Interceptions] = -1.0;
  w[Stat::RushYds] = 0.1;
  w[Stat::RushTds] = 6.0;
  w[Stat::Receptions] = 0.5;
  w[Stat::RecYds] = 0.1;
  w[Stat::RecTds] = 6.0;
  w[Stat::FumblesLost] = -2.0;
  return w;
}

double dot(const StatWeights &weights, const StatLine &features) {
  double total = 0.0;
  for (std::size_t i = 0; i < kNumStats; ++i)
    total += weights.values()[i] * features.values()[i];
  return total;
}

double standard_fantasy_points(const StatLine &stats) {
  static const StatWeights standard = default_weights();
  double total = 0.0;
  for (const Stat s : stats_in(StatGroup::Raw))
    total += standard[s] * stats[s];
  return total;
}

StatWeights average_weights(const std::vector<StatWeights> &weights) {
  StatWeights avg;
  if (weights.empty())
    return avg;
  for (const auto &w : weights)
    for (std::size_t i = 0; i < kNumStats; ++i)
      avg.values()[i] += w.values()[i];
  for (auto &v : avg.values())
    v /= static_cast<double>(weights.size());
  return avg;
}

} // namespace showdown
