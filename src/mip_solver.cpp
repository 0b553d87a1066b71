#include "mip_solver.h"

#include <atomic>
#include <chrono>
#include <cmath>
#include <future>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

#include <absl/time/time.h>
#include <ortools/linear_solver/linear_solver.h>

using operations_research::MPConstraint;
using operations_research::MPObjective;
using operations_research::MPSolver;
using operations_research::MPVariable;

namespace crew {

namespace {

SolveStatus map_status(MPSolver::ResultStatus s) {
  switch (s) {
    case MPSolver::OPTIMAL: return SolveStatus::kOptimal;
    case MPSolver::FEASIBLE: return SolveStatus::kFeasible;
    case MPSolver::INFEASIBLE: return SolveStatus::kInfeasible;
    default: return SolveStatus::kError;  // UNBOUNDED, ABNORMAL, MODEL_INVALID, NOT_SOLVED
  }
}

// Calls InterruptSolve() once the cancel flag flips, until `done` is set.
std::future<void> watch_cancel(MPSolver* solver,
                               const std::atomic<bool>* cancel,
                               const std::atomic<bool>* done,
                               std::atomic<bool>* interrupted) {
  return std::async(std::launch::async, [=]() {
    while (!done->load()) {
      if (cancel->load()) {
        interrupted->store(true);
        // false on backends without interruption; their time limit ends the solve
        solver->InterruptSolve();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  });
}

} // namespace

SolveStatus resolve_interrupted(SolveStatus mapped, bool interrupted) {
  if (!interrupted) return mapped;
  if (mapped == SolveStatus::kOptimal || mapped == SolveStatus::kInfeasible) return mapped;
  return SolveStatus::kCancelled;
}

OrToolsMipSolver::OrToolsMipSolver(std::string solver_id)
    : solver_id_(std::move(solver_id)) {}

SolveResult OrToolsMipSolver::solve(const MipModel& model, const SolveLimits& limits) const {
  SolveResult out;

  if (limits.cancel && limits.cancel->load()) {
    out.status = SolveStatus::kCancelled;
    out.message = "cancelled before solve";
    return out;
  }

  std::unique_ptr<MPSolver> solver(MPSolver::CreateSolver(solver_id_));
  if (!solver) {
    out.status = SolveStatus::kError;
    out.message = "MIP backend '" + solver_id_ + "' is not available";
    return out;
  }

  const double inf = solver->infinity();

  // ---- columns ----
  std::vector<MPVariable*> vars;
  vars.reserve(model.var_names.size());
  for (const auto& n : model.var_names) vars.push_back(solver->MakeBoolVar(n));

  // ---- rows ----
  for (const auto& row : model.rows) {
    const double lb = std::isinf(row.lb) ? -inf : row.lb;
    const double ub = std::isinf(row.ub) ? inf : row.ub;
    MPConstraint* c = solver->MakeRowConstraint(lb, ub, row.name);
    for (const auto& t : row.terms) c->SetCoefficient(vars[t.var], t.coeff);
  }

  // ---- objective ----
  MPObjective* obj = solver->MutableObjective();
  for (int i = 0; i < model.num_vars(); ++i) {
    if (model.objective[i] != 0.0) obj->SetCoefficient(vars[i], model.objective[i]);
  }
  obj->SetMaximization();

  if (limits.time_limit_seconds > 0)
    solver->SetTimeLimit(absl::Seconds(limits.time_limit_seconds));
  if (limits.log_search)
    solver->EnableOutput();
  else
    solver->SuppressOutput();

  std::atomic<bool> done{false};
  std::atomic<bool> interrupted{false};
  std::future<void> watcher;
  if (limits.cancel) watcher = watch_cancel(solver.get(), limits.cancel, &done, &interrupted);

  const MPSolver::ResultStatus rs = solver->Solve();

  done.store(true);
  if (watcher.valid()) watcher.get();

  out.status = resolve_interrupted(map_status(rs), interrupted.load());
  if (out.status == SolveStatus::kCancelled) {
    out.message = "interrupted";
    return out;
  }
  if (!has_solution(out.status)) {
    out.message = "MPSolver status " + std::to_string(static_cast<int>(rs));
    return out;
  }

  out.objective = obj->Value();
  out.values.reserve(vars.size());
  for (const MPVariable* v : vars) out.values.push_back(v->solution_value());
  return out;
}

} // namespace crew
