// day_optimizer.h
#pragma once
#include <atomic>
#include <string>
#include <vector>

#include "solver_adapter.h"
#include "types.h"

namespace crew {

struct DaySolveParams {
  int time_limit_seconds = 30;
  double analysis_penalty = -20.0;
  bool log_search = false;   // backend search log
  bool verbose = false;      // one line per day
  const std::atomic<bool>* cancel = nullptr;
};

// Resolve -> filter -> score -> model -> solve -> extract, for one date.
// task_names keeps schedule order; repeated names are separate slots.
// Solver faults come back as DayStatus::kSolverFailure / kCancelled,
// never as empty lists. Throws InputMalformed on a bad date.
DayOutcome optimize_day(const std::string& date,
                        const std::vector<std::string>& task_names,
                        const std::vector<Worker>& workers,
                        const std::vector<TaskDef>& registry,
                        const SolverAdapter& solver,
                        const DaySolveParams& params = DaySolveParams{});

} // namespace crew
