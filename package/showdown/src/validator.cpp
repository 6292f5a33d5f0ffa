#include "showdown/validator.hpp"
#include "showdown/logging.hpp"

namespace showdown {

std::vector<PredictionPoint>
collect_predictions(const StatWeights &weights,
                    const std::vector<HistoricalGame> &games) {
  std::vector<PredictionPoint> points;
  for (const auto &game : games) {
    const std::vector<StatLine> features = game_features(game);
    for (std::size_t i = 0; i < game.players.size(); ++i) {
      const auto &p = game.players[i];
      if (p.actual_fantasy_points == 0.0)
        continue;
      points.push_back(
          {predict_points(weights, features[i], p.matchup_advantage),
           p.actual_fantasy_points});
    }
  }
  return points;
}

void score_on_training(TunedModel &model,
                       const std::vector<HistoricalGame> &games) {
  const auto points = collect_predictions(model.weights, games);
  model.performance.training_mae = mean_absolute_error(points);
  model.performance.residual_std = residual_std(points);
}

std::vector<TunedModel>
validate_models(std::vector<TunedModel> candidates,
                const std::vector<HistoricalGame> &validation_games,
                const CalibrationConfig &cfg, const RunContext &ctx) {
  for (auto &model : candidates) {
    ctx.check_cancelled("validating " + model.name);
    const auto points = collect_predictions(model.weights, validation_games);
    if (points.empty()) {
      model.performance.validation_mae.reset();
      model.performance.calibration.reset();
      logger()->warn("validator: no scored player-games to validate {}",
                     model.name);
      continue;
    }
    CalibrationReport rep =
        calibration_report(points, model.performance.residual_std, cfg);
    model.performance.validation_mae = rep.mae;
    model.performance.calibration = rep;
    logger()->debug("validator: {} mae={:.3f} crps={:.3f} n={}", model.name,
                    rep.mae, rep.crps, rep.samples);
  }
  rank_models(candidates);
  return candidates;
}

} // namespace showdown
