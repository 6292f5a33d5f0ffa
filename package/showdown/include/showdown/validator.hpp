#pragma once

#include <vector>

#include "showdown/calibration.hpp"
#include "showdown/historical.hpp"
#include "showdown/model.hpp"
#include "showdown/progress.hpp"

namespace showdown {

// (predicted, actual) for every player-game with a non-zero actual score.
std::vector<PredictionPoint>
collect_predictions(const StatWeights &weights,
                    const std::vector<HistoricalGame> &games);

// Fills training_mae and residual_std from the given games.
void score_on_training(TunedModel &model,
                       const std::vector<HistoricalGame> &games);

// Annotates every candidate with validation MAE and a calibration report and
// returns them ranked best first. A model with no scored player-game in the
// validation games is left without validation MAE and ranks last.
// Cancellation is checked between models.
std::vector<TunedModel>
validate_models(std::vector<TunedModel> candidates,
                const std::vector<HistoricalGame> &validation_games,
                const CalibrationConfig &cfg = {},
                const RunContext &ctx = {});

} // namespace showdown
