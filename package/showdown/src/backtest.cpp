#include "showdown/backtest.hpp"
#include "showdown/errors.hpp"
#include "showdown/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>

#include <fmt/format.h>

namespace showdown {

namespace {

std::string strip_spaces(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char ch : s) {
    if (!std::isspace(ch))
      out.push_back(static_cast<char>(ch));
  }
  return out;
}

void validate_settings(const BacktestSettings &s) {
  if (s.salary_cap <= 0) {
    throw ValidationError(
        fmt::format("Salary cap must be positive, got {}", s.salary_cap));
  }
  if (s.roster_size < 2) {
    throw ValidationError(
        fmt::format("Roster size must be at least 2, got {}", s.roster_size));
  }
  if (s.num_lineups < 0) {
    throw ValidationError(
        fmt::format("Lineup count must be non-negative, got {}", s.num_lineups));
  }
  for (const auto &name : s.locked_names) {
    if (s.excluded_names.count(name)) {
      throw ValidationError(
          fmt::format("Player '{}' is both locked and excluded", name));
    }
  }
}

// Either a finished game or the reason it was skipped.
struct GameOutcome {
  std::optional<BacktestGameResult> result;
  std::string skip_reason;
  std::string warning;
};

} // namespace

PlayerTable build_backtest_pool(const HistoricalGame &game,
                                double ceiling_factor) {
  PlayerTable pool;
  for (const auto &rec : game.players) {
    if (!rec.salary || *rec.salary <= 0)
      continue;
    Player p(fmt::format("{}_{}", game.game_id, strip_spaces(rec.name)),
             rec.name, rec.team, game.opponent_of(rec.team), rec.position,
             *rec.salary, rec.actual_fantasy_points,
             rec.actual_fantasy_points * ceiling_factor);
    pool.add_player(p);
  }
  return pool;
}

RosterConstraintSet backtest_constraints(const BacktestSettings &settings,
                                         const PlayerTable &pool) {
  RosterConstraintSet cons;
  cons.salary_cap = settings.salary_cap;
  cons.roster_size = settings.roster_size;
  cons.max_per_position = settings.max_per_position;
  cons.require_captain_stack = settings.require_captain_stack;
  cons.require_opponent_bring_back = settings.require_opponent_bring_back;
  cons.stack_partner_positions = settings.stack_partner_positions;
  for (const auto &p : pool.players()) {
    if (settings.locked_names.count(p.name))
      cons.locked_ids.insert(p.id);
    if (settings.excluded_names.count(p.name))
      cons.excluded_ids.insert(p.id);
  }
  return cons;
}

double score_with_actuals(const Lineup &lineup, const HistoricalGame &game,
                          double captain_multiplier) {
  std::unordered_map<std::string, double> actual;
  for (const auto &rec : game.players)
    actual[rec.name] = rec.actual_fantasy_points;
  auto points = [&](const Player &p) {
    auto it = actual.find(p.name);
    return it == actual.end() ? 0.0 : it->second;
  };
  double total = points(lineup.captain) * captain_multiplier;
  for (const auto &p : lineup.others)
    total += points(p);
  return total;
}

BacktestReport BacktestRunner::run(const std::vector<HistoricalGame> &games,
                                   const BacktestSettings &settings,
                                   const RunContext &ctx) const {
  validate_settings(settings);
  ctx.report("Initializing backtest...", 0);

  const std::size_t n_games = games.size();
  std::vector<GameOutcome> outcomes(n_games);
  std::atomic<std::size_t> next{0};
  std::atomic<std::size_t> finished{0};
  std::atomic<bool> cancelled{false};

  auto process = [&](const LineupGenerator &generator,
                     const HistoricalGame &game) {
    GameOutcome out;
    try {
      const PlayerTable pool =
          build_backtest_pool(game, settings.ceiling_factor);
      const int needed = std::max(settings.min_pool_size, settings.roster_size);
      if (static_cast<int>(pool.size()) < needed) {
        out.skip_reason = fmt::format(
            "insufficient salary data ({} of {} players priced, need {})",
            pool.size(), game.players.size(), needed);
        return out;
      }
      const RosterConstraintSet cons = backtest_constraints(settings, pool);
      GeneratorOptions opts;
      opts.num_lineups = settings.num_lineups;
      opts.mode = ScoringMode::Mean;
      std::vector<Lineup> lineups = generator.generate(pool, cons, opts);

      BacktestGameResult result;
      result.game_id = game.game_id;
      result.description = game.description;
      for (auto &l : lineups) {
        const double score = score_with_actuals(
            l, game, generator.solver().config().captain_multiplier);
        result.top_score = std::max(result.top_score, score);
        result.lineups.push_back({std::move(l), score});
      }
      if (result.lineups.empty()) {
        out.warning = fmt::format("no feasible lineup for game {}",
                                  game.game_id);
      }
      out.result = std::move(result);
    } catch (const std::exception &e) {
      out.skip_reason = e.what();
    }
    return out;
  };

  auto worker = [&]() {
    const LineupGenerator generator{LineupSolver(solver_cfg_)};
    for (;;) {
      if (ctx.cancel && ctx.cancel->cancelled()) {
        cancelled.store(true);
        return;
      }
      const std::size_t i = next.fetch_add(1);
      if (i >= n_games)
        return;
      outcomes[i] = process(generator, games[i]);
      const std::size_t done = finished.fetch_add(1) + 1;
      ctx.report(fmt::format("Processed game: {}", games[i].description),
                 static_cast<int>(100 * done / n_games));
    }
  };

  const int n_workers = std::max(
      1, std::min(settings.worker_threads, static_cast<int>(n_games)));
  if (n_workers == 1) {
    worker();
  } else {
    std::vector<std::thread> threads;
    threads.reserve(n_workers);
    for (int w = 0; w < n_workers; ++w)
      threads.emplace_back(worker);
    for (auto &t : threads)
      t.join();
  }
  if (cancelled.load())
    throw Cancelled("Backtest cancelled");

  BacktestReport report;
  report.settings = settings;
  double top_total = 0.0;
  for (std::size_t i = 0; i < n_games; ++i) {
    auto &out = outcomes[i];
    if (!out.result) {
      const std::string msg = fmt::format("Skipping game {}: {}",
                                          games[i].game_id, out.skip_reason);
      logger()->warn("backtest: {}", msg);
      report.warnings.push_back(msg);
      report.skipped.push_back({games[i].game_id, out.skip_reason});
      continue;
    }
    if (!out.warning.empty()) {
      logger()->warn("backtest: {}", out.warning);
      report.warnings.push_back(out.warning);
    }
    top_total += out.result->top_score;
    for (const auto &scored : out.result->lineups) {
      ++report.player_exposures[scored.lineup.captain.name].count;
      for (const auto &p : scored.lineup.others)
        ++report.player_exposures[p.name].count;
      ++report.summary.total_lineups;
    }
    report.game_results.push_back(std::move(*out.result));
  }

  report.summary.games_used = report.game_results.size();
  report.summary.games_skipped = report.skipped.size();
  report.summary.average_top_score =
      report.summary.games_used > 0
          ? top_total / static_cast<double>(report.summary.games_used)
          : 0.0;
  for (auto &kv : report.player_exposures) {
    kv.second.percentage =
        100.0 * kv.second.count /
        static_cast<double>(std::max<std::size_t>(1, report.summary.total_lineups));
  }

  logger()->info("backtest: {} games used, {} skipped, average top score {:.2f}",
                 report.summary.games_used, report.summary.games_skipped,
                 report.summary.average_top_score);
  ctx.report("Backtest complete.", 100);
  return report;
}

} // namespace showdown
