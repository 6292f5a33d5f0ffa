#include "showdown/backtest.hpp"
#include "showdown/constraints.hpp"
#include "showdown/discovery.hpp"
#include "showdown/evaluator.hpp"
#include "showdown/generator.hpp"
#include "showdown/historical.hpp"
#include "showdown/lineup.hpp"
#include "showdown/logging.hpp"
#include "showdown/pipeline.hpp"
#include "showdown/player.hpp"
#include "showdown/progress.hpp"
#include "showdown/projection.hpp"
#include "showdown/solver.hpp"
#include "showdown/stats.hpp"
#include "showdown/store.hpp"
#include "showdown/validator.hpp"

#include <chrono>
#include <new>

#include <fmt/format.h>
#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/stl/map.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/set.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/unordered_map.h>
#include <nanobind/stl/vector.h>

namespace {

showdown::RunContext make_context(showdown::ProgressChannel *progress,
                                  const showdown::CancellationToken *cancel) {
  showdown::RunContext ctx;
  ctx.progress = progress;
  ctx.cancel = cancel;
  return ctx;
}

// Stats are addressed by their upstream names from Python.
void bind_stat_line(nanobind::module_ &m) {
  nanobind::class_<showdown::StatLine>(m, "StatLine")
      .def(nanobind::init<>())
      .def("get",
           [](const showdown::StatLine &s, const std::string &name) {
             return s.get(showdown::stat_from_name(name));
           })
      .def("set",
           [](showdown::StatLine &s, const std::string &name, double v) {
             s.set(showdown::stat_from_name(name), v);
           })
      .def("to_dict",
           [](const showdown::StatLine &s) {
             std::map<std::string, double> out;
             for (const auto stat : showdown::all_stats()) {
               if (s.get(stat) != 0.0)
                 out[showdown::stat_name(stat)] = s.get(stat);
             }
             return out;
           })
      .def("__eq__", &showdown::StatLine::operator==);
  m.def("default_weights", &showdown::default_weights);
  m.def("stat_names", []() {
    std::vector<std::string> names;
    for (const auto stat : showdown::all_stats())
      names.push_back(showdown::stat_name(stat));
    return names;
  });
}

} // namespace

NB_MODULE(showdown_core, m) {
  m.doc() = "Showdown lineup optimizer and model validation core.";
  m.def("set_log_level", &showdown::set_log_level, nanobind::arg("level"));

  nanobind::enum_<showdown::Position>(m, "Position")
      .value("QB", showdown::Position::QB)
      .value("RB", showdown::Position::RB)
      .value("WR", showdown::Position::WR)
      .value("TE", showdown::Position::TE)
      .value("K", showdown::Position::K)
      .value("DST", showdown::Position::DST);
  m.def("parse_position", &showdown::parse_position);

  nanobind::enum_<showdown::ScoringMode>(m, "ScoringMode")
      .value("Mean", showdown::ScoringMode::Mean)
      .value("Ceiling", showdown::ScoringMode::Ceiling);

  bind_stat_line(m);

  // Player
  nanobind::class_<showdown::Player>(m, "Player")
      .def(nanobind::init<>())
      .def(nanobind::init<std::string, std::string, std::string, std::string,
                          showdown::Position, std::int64_t, double, double>(),
           nanobind::arg("id"), nanobind::arg("name"), nanobind::arg("team"),
           nanobind::arg("opponent"), nanobind::arg("position"),
           nanobind::arg("salary"), nanobind::arg("mean_score"),
           nanobind::arg("ceiling_score"))
      .def_rw("id", &showdown::Player::id)
      .def_rw("name", &showdown::Player::name)
      .def_rw("team", &showdown::Player::team)
      .def_rw("opponent", &showdown::Player::opponent)
      .def_rw("position", &showdown::Player::position)
      .def_rw("salary", &showdown::Player::salary)
      .def_rw("mean_score", &showdown::Player::mean_score)
      .def_rw("ceiling_score", &showdown::Player::ceiling_score)
      .def_rw("ownership_flex", &showdown::Player::ownership_flex)
      .def_rw("ownership_captain", &showdown::Player::ownership_captain)
      .def_rw("leverage", &showdown::Player::leverage)
      .def_rw("correlations", &showdown::Player::correlations)
      .def("__repr__", [](const showdown::Player &p) {
        return fmt::format("Player(id={}, name={}, position={}, team={}, "
                           "salary={}, mean={}, ceiling={})",
                           p.id, p.name, showdown::to_string(p.position),
                           p.team, p.salary, p.mean_score, p.ceiling_score);
      });

  // PlayerTable
  nanobind::class_<showdown::PlayerTable>(m, "PlayerTable")
      .def(nanobind::init<>())
      .def(nanobind::init<const std::vector<showdown::Player> &>())
      .def("add_player", &showdown::PlayerTable::add_player)
      .def("size", &showdown::PlayerTable::size)
      .def("has_id", &showdown::PlayerTable::has_id)
      .def("get_by_id", &showdown::PlayerTable::get_by_id)
      .def("players", &showdown::PlayerTable::players);

  // Triangular distribution
  nanobind::class_<showdown::Triangular>(m, "Triangular")
      .def(nanobind::init<>())
      .def(nanobind::init<double, double, double>())
      .def_static("symmetric", &showdown::Triangular::symmetric,
                  nanobind::arg("center"), nanobind::arg("stddev"))
      .def_rw("low", &showdown::Triangular::low)
      .def_rw("mode", &showdown::Triangular::mode)
      .def_rw("high", &showdown::Triangular::high)
      .def("mean", &showdown::Triangular::mean)
      .def("variance", &showdown::Triangular::variance)
      .def("cdf", &showdown::Triangular::cdf)
      .def("quantile", &showdown::Triangular::quantile)
      .def("crps", &showdown::Triangular::crps, nanobind::arg("y"),
           nanobind::arg("steps") = 400)
      .def("sample", &showdown::Triangular::sample, nanobind::arg("n"),
           nanobind::arg("seed"))
      .def("__repr__", [](const showdown::Triangular &t) {
        return fmt::format("Triangular(low={}, mode={}, high={})", t.low,
                           t.mode, t.high);
      });

  // Constraints and presets
  nanobind::class_<showdown::RosterConstraintSet>(m, "RosterConstraintSet")
      .def(nanobind::init<>())
      .def_rw("salary_cap", &showdown::RosterConstraintSet::salary_cap)
      .def_rw("roster_size", &showdown::RosterConstraintSet::roster_size)
      .def_rw("max_per_position",
              &showdown::RosterConstraintSet::max_per_position)
      .def_rw("locked_ids", &showdown::RosterConstraintSet::locked_ids)
      .def_rw("excluded_ids", &showdown::RosterConstraintSet::excluded_ids)
      .def_rw("require_captain_stack",
              &showdown::RosterConstraintSet::require_captain_stack)
      .def_rw("require_opponent_bring_back",
              &showdown::RosterConstraintSet::require_opponent_bring_back)
      .def_rw("stack_partner_positions",
              &showdown::RosterConstraintSet::stack_partner_positions);

  nanobind::class_<showdown::StrategyPreset>(m, "StrategyPreset")
      .def_ro("name", &showdown::StrategyPreset::name)
      .def_ro("description", &showdown::StrategyPreset::description)
      .def_ro("constraints", &showdown::StrategyPreset::constraints);
  m.def("strategy_presets", &showdown::strategy_presets);
  m.def("preset_constraints", &showdown::preset_constraints,
        nanobind::arg("name"), nanobind::arg("salary_cap") = 60000);

  // Lineups
  nanobind::class_<showdown::Lineup>(m, "Lineup")
      .def(nanobind::init<>())
      .def_rw("captain", &showdown::Lineup::captain)
      .def_rw("others", &showdown::Lineup::others)
      .def("ids", &showdown::Lineup::ids)
      .def("total_salary", &showdown::Lineup::total_salary)
      .def("total_score", &showdown::Lineup::total_score,
           nanobind::arg("mode"),
           nanobind::arg("captain_multiplier") =
               showdown::kDefaultCaptainMultiplier)
      .def("stack_signature", &showdown::Lineup::stack_signature)
      .def("signature",
           [](const showdown::Lineup &l) { return l.signature().to_string(); })
      .def("__repr__", [](const showdown::Lineup &l) {
        return fmt::format("Lineup({}, salary={})", l.signature().to_string(),
                           l.total_salary());
      });

  nanobind::class_<showdown::SolverConfig>(m, "SolverConfig")
      .def(nanobind::init<>())
      .def_rw("captain_multiplier", &showdown::SolverConfig::captain_multiplier)
      .def_rw("time_limit_ms", &showdown::SolverConfig::time_limit_ms)
      .def_rw("mip_gap", &showdown::SolverConfig::mip_gap);

  nanobind::enum_<showdown::SolveStatus>(m, "SolveStatus")
      .value("Optimal", showdown::SolveStatus::Optimal)
      .value("Feasible", showdown::SolveStatus::Feasible)
      .value("Infeasible", showdown::SolveStatus::Infeasible)
      .value("Failed", showdown::SolveStatus::Failed);

  nanobind::class_<showdown::SolveOutcome>(m, "SolveOutcome")
      .def_ro("status", &showdown::SolveOutcome::status)
      .def_ro("lineup", &showdown::SolveOutcome::lineup)
      .def_ro("message", &showdown::SolveOutcome::message)
      .def("__repr__", [](const showdown::SolveOutcome &o) {
        return fmt::format("SolveOutcome({}, '{}')",
                           showdown::to_string(o.status), o.message);
      });

  nanobind::class_<showdown::LineupSolver>(m, "LineupSolver")
      .def(nanobind::init<>())
      .def(nanobind::init<showdown::SolverConfig>(), nanobind::arg("config"))
      .def(
          "run",
          [](const showdown::LineupSolver &s, const showdown::PlayerTable &pool,
             const showdown::RosterConstraintSet &cons,
             showdown::ScoringMode mode) { return s.run(pool, cons, mode); },
          nanobind::arg("pool"), nanobind::arg("constraints"),
          nanobind::arg("mode") = showdown::ScoringMode::Mean);

  nanobind::class_<showdown::GeneratorOptions>(m, "GeneratorOptions")
      .def(nanobind::init<>())
      .def_rw("num_lineups", &showdown::GeneratorOptions::num_lineups)
      .def_rw("mode", &showdown::GeneratorOptions::mode)
      .def_rw("max_exposure", &showdown::GeneratorOptions::max_exposure);

  nanobind::class_<showdown::LineupGenerator>(m, "LineupGenerator")
      .def(nanobind::init<>())
      .def(
          "__init__",
          [](showdown::LineupGenerator *g, const showdown::SolverConfig &cfg) {
            new (g) showdown::LineupGenerator(showdown::LineupSolver(cfg));
          },
          nanobind::arg("solver_config"))
      .def("generate", &showdown::LineupGenerator::generate,
           nanobind::arg("pool"), nanobind::arg("constraints"),
           nanobind::arg("options"));

  // Evaluator
  nanobind::class_<showdown::EvaluatorConfig>(m, "EvaluatorConfig")
      .def(nanobind::init<>())
      .def_rw("captain_multiplier",
              &showdown::EvaluatorConfig::captain_multiplier)
      .def_rw("field_size", &showdown::EvaluatorConfig::field_size)
      .def_rw("ownership_floor", &showdown::EvaluatorConfig::ownership_floor);

  nanobind::class_<showdown::LineupMetrics>(m, "LineupMetrics")
      .def_ro("total_mean", &showdown::LineupMetrics::total_mean)
      .def_ro("total_ceiling", &showdown::LineupMetrics::total_ceiling)
      .def_ro("total_salary", &showdown::LineupMetrics::total_salary)
      .def_ro("average_ownership", &showdown::LineupMetrics::average_ownership)
      .def_ro("ownership_product", &showdown::LineupMetrics::ownership_product)
      .def_ro("correlation_sum", &showdown::LineupMetrics::correlation_sum)
      .def_ro("average_correlation",
              &showdown::LineupMetrics::average_correlation)
      .def_ro("stack_signature", &showdown::LineupMetrics::stack_signature)
      .def_ro("duplication_risk", &showdown::LineupMetrics::duplication_risk)
      .def_ro("expected_value", &showdown::LineupMetrics::expected_value)
      .def_ro("leverage_score", &showdown::LineupMetrics::leverage_score)
      .def_ro("roi_score", &showdown::LineupMetrics::roi_score)
      .def("__repr__", [](const showdown::LineupMetrics &lm) {
        return fmt::format("LineupMetrics(mean={:.2f}, ceiling={:.2f}, "
                           "stack={}, ev={:.2f})",
                           lm.total_mean, lm.total_ceiling, lm.stack_signature,
                           lm.expected_value);
      });
  m.def("evaluate_lineup", &showdown::evaluate_lineup, nanobind::arg("lineup"),
        nanobind::arg("config") = showdown::EvaluatorConfig{});

  // Historical data
  nanobind::class_<showdown::HistoricalPlayerRecord>(m, "HistoricalPlayerRecord")
      .def(nanobind::init<>())
      .def_rw("name", &showdown::HistoricalPlayerRecord::name)
      .def_rw("team", &showdown::HistoricalPlayerRecord::team)
      .def_rw("position", &showdown::HistoricalPlayerRecord::position)
      .def_rw("archetype", &showdown::HistoricalPlayerRecord::archetype)
      .def_rw("stats", &showdown::HistoricalPlayerRecord::stats)
      .def_rw("actual_fantasy_points",
              &showdown::HistoricalPlayerRecord::actual_fantasy_points)
      .def_rw("salary", &showdown::HistoricalPlayerRecord::salary)
      .def_rw("matchup_advantage",
              &showdown::HistoricalPlayerRecord::matchup_advantage);

  nanobind::class_<showdown::PregameContext>(m, "PregameContext")
      .def(nanobind::init<>())
      .def_rw("injuries", &showdown::PregameContext::injuries)
      .def_rw("vegas_line", &showdown::PregameContext::vegas_line)
      .def_rw("team_metrics", &showdown::PregameContext::team_metrics)
      .def_rw("situational", &showdown::PregameContext::situational);

  nanobind::class_<showdown::HistoricalGame>(m, "HistoricalGame")
      .def(nanobind::init<>())
      .def_rw("game_id", &showdown::HistoricalGame::game_id)
      .def_rw("description", &showdown::HistoricalGame::description)
      .def_rw("context", &showdown::HistoricalGame::context)
      .def_rw("players", &showdown::HistoricalGame::players)
      .def("teams", &showdown::HistoricalGame::teams)
      .def("__repr__", [](const showdown::HistoricalGame &g) {
        return fmt::format("HistoricalGame(id={}, players={})", g.game_id,
                           g.players.size());
      });

  // Models
  nanobind::class_<showdown::CalibrationReport>(m, "CalibrationReport")
      .def_ro("mae", &showdown::CalibrationReport::mae)
      .def_ro("crps", &showdown::CalibrationReport::crps)
      .def_ro("pit_ks_p_value", &showdown::CalibrationReport::pit_ks_p_value)
      .def_ro("p50_coverage", &showdown::CalibrationReport::p50_coverage)
      .def_ro("samples", &showdown::CalibrationReport::samples);

  nanobind::class_<showdown::ModelPerformance>(m, "ModelPerformance")
      .def_ro("training_mae", &showdown::ModelPerformance::training_mae)
      .def_ro("residual_std", &showdown::ModelPerformance::residual_std)
      .def_ro("validation_mae", &showdown::ModelPerformance::validation_mae)
      .def_ro("calibration", &showdown::ModelPerformance::calibration);

  nanobind::class_<showdown::TunedModel>(m, "TunedModel")
      .def_ro("id", &showdown::TunedModel::id)
      .def_ro("name", &showdown::TunedModel::name)
      .def_ro("created_at", &showdown::TunedModel::created_at)
      .def_ro("weights", &showdown::TunedModel::weights)
      .def_ro("source_description", &showdown::TunedModel::source_description)
      .def_ro("performance", &showdown::TunedModel::performance)
      .def("__repr__", [](const showdown::TunedModel &t) {
        return fmt::format("TunedModel(id={}, training_mae={:.3f})", t.id,
                           t.performance.training_mae);
      });

  nanobind::class_<showdown::ValidationReport>(m, "ValidationReport")
      .def_ro("training_set_size", &showdown::ValidationReport::training_set_size)
      .def_ro("validation_set_size",
              &showdown::ValidationReport::validation_set_size)
      .def_ro("models", &showdown::ValidationReport::models)
      .def_ro("warnings", &showdown::ValidationReport::warnings);

  // Stores and sources
  nanobind::class_<showdown::GameStore>(m, "GameStore");
  nanobind::class_<showdown::InMemoryGameStore, showdown::GameStore>(
      m, "InMemoryGameStore")
      .def(nanobind::init<>())
      .def("get", &showdown::InMemoryGameStore::get)
      .def("put", &showdown::InMemoryGameStore::put)
      .def("count", &showdown::InMemoryGameStore::count)
      .def("all", &showdown::InMemoryGameStore::all);

  nanobind::class_<showdown::ModelStore>(m, "ModelStore");
  nanobind::class_<showdown::InMemoryModelStore, showdown::ModelStore>(
      m, "InMemoryModelStore")
      .def(nanobind::init<>())
      .def("get", &showdown::InMemoryModelStore::get)
      .def("put", &showdown::InMemoryModelStore::put)
      .def("remove", &showdown::InMemoryModelStore::remove)
      .def("list", &showdown::InMemoryModelStore::list);

  nanobind::class_<showdown::GameSource>(m, "GameSource");
  nanobind::class_<showdown::StaticGameSource, showdown::GameSource>(
      m, "StaticGameSource")
      .def(nanobind::init<>())
      .def("add", &showdown::StaticGameSource::add);

  nanobind::class_<showdown::HindsightSource>(m, "HindsightSource");
  nanobind::class_<showdown::StaticHindsightSource, showdown::HindsightSource>(
      m, "StaticHindsightSource")
      .def(nanobind::init<>())
      .def("set", &showdown::StaticHindsightSource::set);

  // Progress and cancellation
  nanobind::class_<showdown::ProgressEvent>(m, "ProgressEvent")
      .def_ro("message", &showdown::ProgressEvent::message)
      .def_ro("percent", &showdown::ProgressEvent::percent);

  nanobind::class_<showdown::ProgressChannel>(m, "ProgressChannel")
      .def(nanobind::init<>())
      .def("try_pop", &showdown::ProgressChannel::try_pop)
      .def(
          "pop",
          [](showdown::ProgressChannel &c, int timeout_ms) {
            return c.pop(std::chrono::milliseconds(timeout_ms));
          },
          nanobind::arg("timeout_ms"),
          nanobind::call_guard<nanobind::gil_scoped_release>())
      .def("close", &showdown::ProgressChannel::close)
      .def("closed", &showdown::ProgressChannel::closed);

  nanobind::class_<showdown::CancellationToken>(m, "CancellationToken")
      .def(nanobind::init<>())
      .def("cancel", &showdown::CancellationToken::cancel)
      .def("cancelled", &showdown::CancellationToken::cancelled);

  // Backtest
  nanobind::class_<showdown::BacktestSettings>(m, "BacktestSettings")
      .def(nanobind::init<>())
      .def_rw("salary_cap", &showdown::BacktestSettings::salary_cap)
      .def_rw("roster_size", &showdown::BacktestSettings::roster_size)
      .def_rw("max_per_position", &showdown::BacktestSettings::max_per_position)
      .def_rw("locked_names", &showdown::BacktestSettings::locked_names)
      .def_rw("excluded_names", &showdown::BacktestSettings::excluded_names)
      .def_rw("require_captain_stack",
              &showdown::BacktestSettings::require_captain_stack)
      .def_rw("require_opponent_bring_back",
              &showdown::BacktestSettings::require_opponent_bring_back)
      .def_rw("stack_partner_positions",
              &showdown::BacktestSettings::stack_partner_positions)
      .def_rw("num_lineups", &showdown::BacktestSettings::num_lineups)
      .def_rw("min_pool_size", &showdown::BacktestSettings::min_pool_size)
      .def_rw("ceiling_factor", &showdown::BacktestSettings::ceiling_factor)
      .def_rw("worker_threads", &showdown::BacktestSettings::worker_threads);

  nanobind::class_<showdown::ScoredLineup>(m, "ScoredLineup")
      .def_ro("lineup", &showdown::ScoredLineup::lineup)
      .def_ro("actual_score", &showdown::ScoredLineup::actual_score);

  nanobind::class_<showdown::BacktestGameResult>(m, "BacktestGameResult")
      .def_ro("game_id", &showdown::BacktestGameResult::game_id)
      .def_ro("description", &showdown::BacktestGameResult::description)
      .def_ro("lineups", &showdown::BacktestGameResult::lineups)
      .def_ro("top_score", &showdown::BacktestGameResult::top_score);

  nanobind::class_<showdown::SkippedGame>(m, "SkippedGame")
      .def_ro("game_id", &showdown::SkippedGame::game_id)
      .def_ro("reason", &showdown::SkippedGame::reason);

  nanobind::class_<showdown::PlayerExposure>(m, "PlayerExposure")
      .def_ro("count", &showdown::PlayerExposure::count)
      .def_ro("percentage", &showdown::PlayerExposure::percentage);

  nanobind::class_<showdown::BacktestSummary>(m, "BacktestSummary")
      .def_ro("average_top_score", &showdown::BacktestSummary::average_top_score)
      .def_ro("games_used", &showdown::BacktestSummary::games_used)
      .def_ro("games_skipped", &showdown::BacktestSummary::games_skipped)
      .def_ro("total_lineups", &showdown::BacktestSummary::total_lineups);

  nanobind::class_<showdown::BacktestReport>(m, "BacktestReport")
      .def_ro("settings", &showdown::BacktestReport::settings)
      .def_ro("game_results", &showdown::BacktestReport::game_results)
      .def_ro("skipped", &showdown::BacktestReport::skipped)
      .def_ro("summary", &showdown::BacktestReport::summary)
      .def_ro("player_exposures", &showdown::BacktestReport::player_exposures)
      .def_ro("warnings", &showdown::BacktestReport::warnings)
      .def("__repr__", [](const showdown::BacktestReport &r) {
        return fmt::format("BacktestReport(games={}, skipped={}, avg_top={:.2f})",
                           r.summary.games_used, r.summary.games_skipped,
                           r.summary.average_top_score);
      });

  m.def(
      "run_backtest",
      [](const std::vector<showdown::HistoricalGame> &games,
         const showdown::BacktestSettings &settings,
         showdown::ProgressChannel *progress,
         const showdown::CancellationToken *cancel) {
        return showdown::BacktestRunner().run(games, settings,
                                              make_context(progress, cancel));
      },
      nanobind::arg("games"), nanobind::arg("settings"),
      nanobind::arg("progress").none() = nanobind::none(),
      nanobind::arg("cancel").none() = nanobind::none(),
      nanobind::call_guard<nanobind::gil_scoped_release>());

  // Simulation
  nanobind::class_<showdown::SimulationParams>(m, "SimulationParams")
      .def(nanobind::init<>())
      .def_rw("train_validate_split",
              &showdown::SimulationParams::train_validate_split)
      .def_rw("seed", &showdown::SimulationParams::seed)
      .def_rw("min_games", &showdown::SimulationParams::min_games)
      .def_rw("promote_best", &showdown::SimulationParams::promote_best);

  m.def(
      "run_full_simulation",
      [](const showdown::SimulationParams &params,
         const std::vector<std::string> &game_ids, showdown::GameSource &source,
         showdown::GameStore &games, showdown::ModelStore &models,
         showdown::HindsightSource *hindsight,
         showdown::ProgressChannel *progress,
         const showdown::CancellationToken *cancel) {
        return showdown::run_full_simulation(params, game_ids, source, games,
                                             models, hindsight,
                                             make_context(progress, cancel));
      },
      nanobind::arg("params"), nanobind::arg("game_ids"),
      nanobind::arg("source"), nanobind::arg("games"), nanobind::arg("models"),
      nanobind::arg("hindsight").none() = nanobind::none(),
      nanobind::arg("progress").none() = nanobind::none(),
      nanobind::arg("cancel").none() = nanobind::none(),
      nanobind::call_guard<nanobind::gil_scoped_release>());
}
