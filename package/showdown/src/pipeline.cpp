#include "showdown/pipeline.hpp"
#include "showdown/errors.hpp"
#include "showdown/logging.hpp"
#include "showdown/validator.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <random>
#include <stdexcept>

#include <fmt/format.h>

namespace showdown {

HistoricalGame StaticGameSource::fetch(const std::string &game_id) {
  auto it = games_.find(game_id);
  if (it == games_.end())
    throw std::out_of_range("Unknown game id: " + game_id);
  return it->second;
}

std::pair<std::vector<std::string>, std::vector<std::string>>
split_games(const std::vector<std::string> &game_ids,
            const SimulationParams &params) {
  const std::size_t total = game_ids.size();
  if (total < static_cast<std::size_t>(std::max(params.min_games, 0))) {
    throw ValidationError(fmt::format(
        "A minimum of {} historical games are required, got {}",
        params.min_games, total));
  }
  if (params.train_validate_split < 0.0 || params.train_validate_split > 100.0) {
    throw ValidationError(fmt::format("Split must be in [0, 100], got {}",
                                      params.train_validate_split));
  }
  const auto n_train = static_cast<std::size_t>(
      std::floor(total * params.train_validate_split / 100.0));
  const std::size_t n_valid = total - n_train;
  if (n_valid < 2) {
    throw ValidationError(fmt::format(
        "At least 2 validation games are required, the {}% split leaves {}",
        params.train_validate_split, n_valid));
  }

  std::vector<std::string> shuffled = game_ids;
  std::mt19937_64 rng(params.seed);
  std::shuffle(shuffled.begin(), shuffled.end(), rng);

  std::vector<std::string> validation(shuffled.begin(),
                                      shuffled.begin() + n_valid);
  std::vector<std::string> training(shuffled.begin() + n_valid, shuffled.end());
  return {std::move(training), std::move(validation)};
}

namespace {

int scaled(int from, int span, std::size_t i, std::size_t n) {
  if (n == 0)
    return from;
  return from + static_cast<int>(std::lround(span * static_cast<double>(i) /
                                             static_cast<double>(n)));
}

} // namespace

ValidationReport run_full_simulation(const SimulationParams &params,
                                     const std::vector<std::string> &game_ids,
                                     GameSource &source, GameStore &games,
                                     ModelStore &models,
                                     HindsightSource *hindsight,
                                     const RunContext &ctx) {
  ValidationReport report;
  auto warn = [&](const std::string &msg) {
    logger()->warn("simulation: {}", msg);
    report.warnings.push_back(msg);
  };

  ctx.report("Splitting data into training/validation sets...", 5);
  const auto split = split_games(game_ids, params);

  ctx.report("Fetching and caching historical game data...", 10);
  const std::size_t n_ids = split.first.size() + split.second.size();
  std::size_t step = 0;
  auto load = [&](const std::vector<std::string> &ids) {
    std::vector<HistoricalGame> loaded;
    for (const auto &id : ids) {
      ctx.check_cancelled("loading game " + id);
      const int pct = scaled(10, 40, step++, n_ids);
      if (auto cached = games.get(id)) {
        loaded.push_back(std::move(*cached));
        continue;
      }
      ctx.report(fmt::format("Fetching data for: {}...", id), pct);
      try {
        HistoricalGame game = source.fetch(id);
        games.put(game);
        loaded.push_back(std::move(game));
      } catch (const std::exception &e) {
        warn(fmt::format("could not load game {}: {}", id, e.what()));
      }
    }
    return loaded;
  };
  const std::vector<HistoricalGame> training = load(split.first);
  const std::vector<HistoricalGame> validation = load(split.second);
  report.training_set_size = training.size();
  report.validation_set_size = validation.size();

  ctx.report("Discovering predictive models from training data...", 55);
  ModelDiscovery discovery(params.discovery);
  DiscoveryResult found = discovery.discover(training, hindsight, ctx);
  report.warnings.insert(report.warnings.end(), found.warnings.begin(),
                         found.warnings.end());
  if (found.candidates.empty()) {
    warn("no candidate models could be built from the training data");
    ctx.report("Simulation and validation complete!", 100);
    return report;
  }

  if (validation.size() < 2) {
    warn(fmt::format("only {} validation games could be loaded; models were "
                     "not validated and none was promoted",
                     validation.size()));
    report.models = std::move(found.candidates);
    rank_models(report.models);
    ctx.report("Simulation and validation complete!", 100);
    return report;
  }

  ctx.report("Validating models against unseen historical data...", 90);
  report.models =
      validate_models(std::move(found.candidates), validation, params.calibration, ctx);

  if (params.promote_best && !report.models.empty() &&
      report.models.front().performance.validation_mae) {
    models.put(report.models.front());
    logger()->info("simulation: promoted model '{}' ({})",
                   report.models.front().name, report.models.front().id);
  }

  logger()->info("simulation: {} models validated on {} games",
                 report.models.size(), report.validation_set_size);
  ctx.report("Simulation and validation complete!", 100);
  return report;
}

} // namespace showdown
