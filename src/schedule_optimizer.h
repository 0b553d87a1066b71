#pragma once
#include <atomic>
#include <map>
#include <string>
#include <vector>

#include "day_optimizer.h"
#include "solver_adapter.h"
#include "types.h"

namespace crew {

struct ScheduleSolveParams {
  int threads = 1;
  DaySolveParams day;        // day.cancel is overridden by `cancel`
  bool verbose = false;
  const std::atomic<bool>* cancel = nullptr;
};

// date -> task names, schedule order kept inside a date
std::map<std::string, std::vector<std::string>>
group_by_date(const std::vector<ScheduleEntry>& schedule);

// Solves every scheduled date independently (in parallel when threads > 1).
// The result holds exactly the schedule's dates. A failed or cancelled date
// never stops the others.
AggregateResult optimize_schedule(const std::vector<ScheduleEntry>& schedule,
                                  const std::vector<Worker>& workers,
                                  const std::vector<TaskDef>& registry,
                                  const SolverAdapter& solver,
                                  const ScheduleSolveParams& params = ScheduleSolveParams{});

} // namespace crew
