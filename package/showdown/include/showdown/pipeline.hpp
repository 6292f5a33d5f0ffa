#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "showdown/calibration.hpp"
#include "showdown/discovery.hpp"
#include "showdown/historical.hpp"
#include "showdown/model.hpp"
#include "showdown/progress.hpp"
#include "showdown/store.hpp"

namespace showdown {

// Supplier of historical games that are not cached yet (a scraper, a file
// loader). fetch() throws when the game cannot be produced.
class GameSource {
public:
  virtual ~GameSource() = default;
  virtual HistoricalGame fetch(const std::string &game_id) = 0;
};

class StaticGameSource : public GameSource {
public:
  void add(const HistoricalGame &game) { games_[game.game_id] = game; }
  HistoricalGame fetch(const std::string &game_id) override;

private:
  std::map<std::string, HistoricalGame> games_;
};

struct SimulationParams {
  // Percent of the games used for training; the rest validate.
  double train_validate_split{75.0};
  std::uint64_t seed{1337};
  int min_games{4};
  DiscoveryConfig discovery{};
  CalibrationConfig calibration{};
  // Save the best validated model into the model store.
  bool promote_best{false};
};

// Deterministic (training, validation) partition of `game_ids`. Throws
// ValidationError with fewer than min_games ids or fewer than two validation
// games.
std::pair<std::vector<std::string>, std::vector<std::string>>
split_games(const std::vector<std::string> &game_ids,
            const SimulationParams &params);

// Fetch-and-cache, discovery and validation in one run. Games missing from
// `games` are fetched from `source` and cached; fetch failures become
// warnings. When fewer than two validation games load, the candidates are
// returned unvalidated and nothing is promoted. Returns the ranked candidates
// with every accumulated warning.
ValidationReport run_full_simulation(const SimulationParams &params,
                                     const std::vector<std::string> &game_ids,
                                     GameSource &source, GameStore &games,
                                     ModelStore &models,
                                     HindsightSource *hindsight = nullptr,
                                     const RunContext &ctx = {});

} // namespace showdown
