// mip_solver.h
#pragma once
#include <string>
#include "solver_adapter.h"

namespace crew {

// SolverAdapter over OR-tools' MPSolver. solver_id is any id accepted by
// MPSolver::CreateSolver ("SCIP", "CBC", "SAT", ...).
// Status of a solve the cancel watcher may have interrupted. OPTIMAL and
// INFEASIBLE mean the search completed, so a late interrupt does not count.
SolveStatus resolve_interrupted(SolveStatus mapped, bool interrupted);

class OrToolsMipSolver : public SolverAdapter {
 public:
  explicit OrToolsMipSolver(std::string solver_id = "SCIP");

  SolveResult solve(const MipModel& model, const SolveLimits& limits) const override;
  std::string name() const override { return "ortools:" + solver_id_; }

 private:
  std::string solver_id_;
};

} // namespace crew
