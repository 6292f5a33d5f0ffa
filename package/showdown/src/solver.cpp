#include "showdown/solver.hpp"
#include "showdown/errors.hpp"
#include "showdown/logging.hpp"

#include <map>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <glpk.h>

namespace showdown {

namespace {

struct ProblemDeleter {
  void operator()(glp_prob *lp) const { glp_delete_prob(lp); }
};
using Problem = std::unique_ptr<glp_prob, ProblemDeleter>;

// Constraint rows in the 1-based sparse triplet form glp_load_matrix takes.
// Terms are keyed by column so a row never carries a column twice.
class RowBuilder {
public:
  void add(const std::map<int, double> &terms, int type, double lb,
           double ub) {
    const int row = static_cast<int>(bounds_.size()) + 1;
    bounds_.push_back({type, lb, ub});
    for (const auto &kv : terms) {
      if (kv.second == 0.0)
        continue;
      ia_.push_back(row);
      ja_.push_back(kv.first);
      ar_.push_back(kv.second);
    }
  }

  void load(glp_prob *lp) const {
    if (bounds_.empty())
      return;
    glp_add_rows(lp, static_cast<int>(bounds_.size()));
    for (std::size_t i = 0; i < bounds_.size(); ++i) {
      const auto &b = bounds_[i];
      glp_set_row_bnds(lp, static_cast<int>(i) + 1, b.type, b.lb, b.ub);
    }
    glp_load_matrix(lp, static_cast<int>(ia_.size()) - 1, ia_.data(),
                    ja_.data(), ar_.data());
  }

  std::size_t size() const { return bounds_.size(); }

private:
  struct Bound {
    int type;
    double lb;
    double ub;
  };
  std::vector<Bound> bounds_;
  // Index 0 is unused by GLPK.
  std::vector<int> ia_{0};
  std::vector<int> ja_{0};
  std::vector<double> ar_{0.0};
};

} // namespace

const char *to_string(SolveStatus status) {
  switch (status) {
  case SolveStatus::Optimal:
    return "optimal";
  case SolveStatus::Feasible:
    return "feasible";
  case SolveStatus::Infeasible:
    return "infeasible";
  case SolveStatus::Failed:
    return "failed";
  }
  return "unknown";
}

LineupSolver::LineupSolver(SolverConfig cfg) : cfg_(cfg) {
  if (!(cfg_.captain_multiplier > 0.0)) {
    throw ValidationError(fmt::format(
        "Captain multiplier must be positive, got {}", cfg_.captain_multiplier));
  }
  if (cfg_.time_limit_ms < 0 || !(cfg_.mip_gap >= 0.0)) {
    throw ValidationError(
        fmt::format("Solver limits must be non-negative (time {} ms, gap {})",
                    cfg_.time_limit_ms, cfg_.mip_gap));
  }
}

SolveOutcome LineupSolver::run(const PlayerTable &pool,
                               const RosterConstraintSet &cons,
                               ScoringMode mode,
                               const std::set<LineupSignature> &forbidden,
                               const std::set<std::string> &also_excluded) const {
  validate_constraints(cons, pool);
  for (const auto &id : also_excluded) {
    if (cons.locked_ids.count(id)) {
      throw ValidationError(
          fmt::format("Locked player {} cannot be excluded", id));
    }
  }

  SolveOutcome out;
  std::vector<const Player *> eligible;
  for (const auto &p : pool.players()) {
    if (cons.excluded_ids.count(p.id) || also_excluded.count(p.id))
      continue;
    eligible.push_back(&p);
  }
  const int n = static_cast<int>(eligible.size());
  if (n < cons.roster_size) {
    out.message = fmt::format("{} eligible players for a roster of {}", n,
                              cons.roster_size);
    logger()->debug("solver: {}", out.message);
    return out;
  }

  // Columns 2i+1 (rostered) and 2i+2 (captain)
  auto r = [](int i) { return 2 * i + 1; };
  auto c = [](int i) { return 2 * i + 2; };

  Problem lp(glp_create_prob());
  glp_set_prob_name(lp.get(), "showdown_lineup");
  glp_set_obj_dir(lp.get(), GLP_MAX);
  glp_add_cols(lp.get(), 2 * n);

  std::unordered_map<std::string, int> local_index;
  const double bonus = cfg_.captain_multiplier - 1.0;
  for (int i = 0; i < n; ++i) {
    const Player &p = *eligible[i];
    const double score = target_score(p, mode);
    glp_set_col_kind(lp.get(), r(i), GLP_BV);
    glp_set_col_kind(lp.get(), c(i), GLP_BV);
    glp_set_obj_coef(lp.get(), r(i), score);
    glp_set_obj_coef(lp.get(), c(i), score * bonus);
    local_index[p.id] = i;
  }
  for (const auto &id : cons.locked_ids)
    glp_set_col_bnds(lp.get(), r(local_index.at(id)), GLP_FX, 1.0, 1.0);

  RowBuilder rows;
  std::map<int, double> roster_terms, captain_terms, salary_terms;
  for (int i = 0; i < n; ++i) {
    roster_terms[r(i)] = 1.0;
    captain_terms[c(i)] = 1.0;
    salary_terms[r(i)] = static_cast<double>(eligible[i]->salary);
    rows.add({{c(i), 1.0}, {r(i), -1.0}}, GLP_UP, 0.0, 0.0);
  }
  rows.add(roster_terms, GLP_FX, cons.roster_size, cons.roster_size);
  rows.add(captain_terms, GLP_FX, 1.0, 1.0);
  rows.add(salary_terms, GLP_UP, 0.0, static_cast<double>(cons.salary_cap));

  for (const auto &kv : cons.max_per_position) {
    std::map<int, double> terms;
    for (int i = 0; i < n; ++i) {
      if (eligible[i]->position == kv.first)
        terms[r(i)] = 1.0;
    }
    if (!terms.empty())
      rows.add(terms, GLP_UP, 0.0, kv.second);
  }

  if (cons.require_captain_stack) {
    for (int i = 0; i < n; ++i) {
      const Player &cap = *eligible[i];
      std::map<int, double> stack{{c(i), -1.0}};
      for (int j = 0; j < n; ++j) {
        const Player &other = *eligible[j];
        if (j == i || other.team != cap.team)
          continue;
        if (!cons.stack_partner_positions.empty() &&
            !cons.stack_partner_positions.count(other.position))
          continue;
        stack[r(j)] = 1.0;
      }
      rows.add(stack, GLP_LO, 0.0, 0.0);

      if (cons.require_opponent_bring_back) {
        std::map<int, double> bring_back{{c(i), -1.0}};
        for (int j = 0; j < n; ++j) {
          const Player &other = *eligible[j];
          if (j == i)
            continue;
          const bool opposing = cap.opponent.empty()
                                    ? other.team != cap.team
                                    : other.team == cap.opponent;
          if (opposing)
            bring_back[r(j)] = 1.0;
        }
        rows.add(bring_back, GLP_LO, 0.0, 0.0);
      }
    }
  }

  std::size_t cuts = 0;
  for (const auto &sig : forbidden) {
    if (static_cast<int>(sig.other_ids.size()) + 1 != cons.roster_size)
      continue;
    auto cap_it = local_index.find(sig.captain_id);
    if (cap_it == local_index.end())
      continue; // already impossible
    std::map<int, double> terms{{c(cap_it->second), 1.0}};
    bool possible = true;
    for (const auto &id : sig.other_ids) {
      auto it = local_index.find(id);
      if (it == local_index.end()) {
        possible = false;
        break;
      }
      terms[r(it->second)] = 1.0;
    }
    if (!possible)
      continue;
    rows.add(terms, GLP_UP, 0.0, cons.roster_size - 1);
    ++cuts;
  }
  rows.load(lp.get());

  glp_iocp parm;
  glp_init_iocp(&parm);
  parm.msg_lev = GLP_MSG_OFF;
  parm.presolve = GLP_ON;
  parm.mip_gap = cfg_.mip_gap;
  if (cfg_.time_limit_ms > 0)
    parm.tm_lim = cfg_.time_limit_ms;

  const int ret = glp_intopt(lp.get(), &parm);
  const int mip_status = glp_mip_status(lp.get());
  logger()->debug("solver: {} cols, {} rows, {} cuts, glp_intopt={} status={}",
                  2 * n, rows.size(), cuts, ret, mip_status);

  if (ret == GLP_ENOPFS || mip_status == GLP_NOFEAS) {
    out.status = SolveStatus::Infeasible;
    out.message = "no integer-feasible lineup";
    return out;
  }
  if (mip_status != GLP_OPT && mip_status != GLP_FEAS) {
    out.status = SolveStatus::Failed;
    out.message = ret == GLP_ETMLIM
                      ? fmt::format("time limit of {} ms reached before any "
                                    "feasible lineup was found",
                                    cfg_.time_limit_ms)
                      : fmt::format("glp_intopt failed with code {}", ret);
    logger()->warn("solver: {}", out.message);
    return out;
  }

  Lineup lineup;
  int captains = 0;
  for (int i = 0; i < n; ++i) {
    if (glp_mip_col_val(lp.get(), c(i)) > 0.5) {
      lineup.captain = *eligible[i];
      ++captains;
    }
  }
  for (int i = 0; i < n; ++i) {
    if (glp_mip_col_val(lp.get(), r(i)) > 0.5 &&
        glp_mip_col_val(lp.get(), c(i)) < 0.5)
      lineup.others.push_back(*eligible[i]);
  }
  if (captains != 1 ||
      static_cast<int>(lineup.others.size()) + 1 != cons.roster_size) {
    out.status = SolveStatus::Failed;
    out.message = fmt::format("decoded an inconsistent lineup ({} captains, "
                              "{} others)",
                              captains, lineup.others.size());
    logger()->error("solver: {}", out.message);
    return out;
  }

  if (mip_status == GLP_OPT) {
    out.status = SolveStatus::Optimal;
  } else {
    out.status = SolveStatus::Feasible;
    out.message = ret == GLP_ETMLIM
                      ? fmt::format("time limit of {} ms reached, returning "
                                    "best lineup found",
                                    cfg_.time_limit_ms)
                      : "stopped within the relative gap";
    logger()->warn("solver: {}", out.message);
  }
  out.lineup = std::move(lineup);
  return out;
}

} // namespace showdown
