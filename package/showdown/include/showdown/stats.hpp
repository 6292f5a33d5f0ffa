#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace showdown {

// Every statistical feature a scoring model may weight. Grouped so that
// ranges can be taken with stat_group().
enum class Stat : std::size_t {
  // Raw box score
  PassYds,
  PassTds,
  Interceptions,
  RushYds,
  RushTds,
  Receptions,
  RecYds,
  RecTds,
  FumblesLost,
  // Advanced per-player
  AirYards,
  RedZoneTouches,
  TargetShare,
  RushAttemptShare,
  YardsPerRouteRun,
  ADot,
  YardsAfterCatch,
  RoutesRun,
  AvoidedTackles,
  YardsCreatedPerTouch,
  PlayActionPassRate,
  TimeToThrow,
  CleanPocketCompletion,
  UnderPressureCompletion,
  DeepBallCompletion,
  RedZoneConversionRate,
  // Team metrics
  OffensiveLineRank,
  DefensiveLineRank,
  PassRushWinRate,
  RunStopWinRate,
  SecondaryCoverageRank,
  PlaysPerGame,
  NeutralSituationPace,
  NeutralSituationPassRate,
  CoachingAggressivenessScore,
  TurnoverDifferential,
  // Game situational
  StrengthOfSchedule,
  WeatherFactor,
  HomeFieldAdvantageScore,
  // Teammate correlation
  QbPassYds,
  QbRushYds,
  TopTeammateRecYds,
  TopTeammateRushYds,
  TopTeammateReceptions,
  Count_
};

constexpr std::size_t kNumStats = static_cast<std::size_t>(Stat::Count_);

enum class StatGroup { Raw, Advanced, Team, Situational, Correlation };

StatGroup stat_group(Stat s);
std::vector<Stat> stats_in(StatGroup group);
std::vector<Stat> all_stats();

// camelCase names used by upstream data ("passYds", "qb_passYds", ...).
std::string stat_name(Stat s);
// Throws std::out_of_range on an unknown name.
Stat stat_from_name(const std::string &name);

inline constexpr std::size_t idx(Stat s) { return static_cast<std::size_t>(s); }

// Dense, enum-indexed value vector. Absent values are 0.
class StatLine {
public:
  StatLine() { values_.fill(0.0); }

  double get(Stat s) const { return values_[idx(s)]; }
  void set(Stat s, double v) { values_[idx(s)] = v; }
  double &operator[](Stat s) { return values_[idx(s)]; }
  double operator[](Stat s) const { return values_[idx(s)]; }

  const std::array<double, kNumStats> &values() const { return values_; }
  std::array<double, kNumStats> &values() { return values_; }

  bool operator==(const StatLine &o) const { return values_ == o.values_; }
  bool operator!=(const StatLine &o) const { return !(*this == o); }

private:
  std::array<double, kNumStats> values_;
};

// Coefficients per feature. Unspecified features contribute nothing.
using StatWeights = StatLine;

// Standard site scoring: 0.04/pass yd, 4/pass td, -1/int, 0.1/rush yd,
// 6/rush td, 0.5/rec, 0.1/rec yd, 6/rec td, -2/fumble lost.
StatWeights default_weights();

// Dot product over every feature.
double dot(const StatWeights &weights, const StatLine &features);

// Fantasy points of a raw box score under default_weights().
double standard_fantasy_points(const StatLine &stats);

StatWeights average_weights(const std::vector<StatWeights> &weights);

} // namespace showdown
