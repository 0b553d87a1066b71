#include "day_optimizer.h"

#include <exception>
#include <iostream>
#include <set>

#include "assignment_model.h"
#include "availability.h"
#include "task_resolver.h"

namespace crew {

namespace {

DayOutcome empty_outcome(const std::string& date, const std::vector<ResolvedTask>& tasks) {
  DayOutcome out;
  out.date = date;
  out.tasks.reserve(tasks.size());
  for (const auto& t : tasks) {
    TaskAssignment ta;
    ta.display_name = t.display_name;
    ta.area = t.def.area;
    ta.required_workers = t.def.required_workers;
    ta.is_unregistered = t.is_unregistered;
    out.tasks.push_back(std::move(ta));
  }
  return out;
}

// Re-check capacity and one-area-per-day on what the backend returned.
std::string check_solution(const AssignmentModel& m,
                           const std::vector<ResolvedTask>& tasks,
                           const std::vector<std::vector<int>>& per_task) {
  std::vector<std::set<int>> worker_areas(m.x.size());
  for (size_t t = 0; t < per_task.size(); ++t) {
    if (static_cast<int>(per_task[t].size()) > tasks[t].def.required_workers)
      return "capacity exceeded on task " + std::to_string(t);
    for (int w : per_task[t]) worker_areas[w].insert(m.task_area[t]);
  }
  for (size_t w = 0; w < worker_areas.size(); ++w)
    if (worker_areas[w].size() > 1)
      return "worker " + std::to_string(w) + " spans several areas";
  return {};
}

} // namespace

DayOutcome optimize_day(const std::string& date,
                        const std::vector<std::string>& task_names,
                        const std::vector<Worker>& workers,
                        const std::vector<TaskDef>& registry,
                        const SolverAdapter& solver,
                        const DaySolveParams& params) {
  // ---- resolve every entry, duplicates included ----
  std::vector<ResolvedTask> tasks;
  tasks.reserve(task_names.size());
  for (const auto& n : task_names) tasks.push_back(resolve_task({date, n}, registry));

  DayOutcome out = empty_outcome(date, tasks);

  // ---- eligible workers ----
  const std::vector<const Worker*> pool = available_workers(workers, date);
  out.eligible_workers = static_cast<int>(pool.size());
  if (pool.empty() || tasks.empty()) {
    if (params.verbose)
      std::cout << "[day_optimizer] " << date << " tasks=" << tasks.size()
                << " eligible=0, nothing to assign\n";
    return out;
  }

  // ---- model + solve ----
  const AssignmentModel m = build_assignment_model(date, pool, tasks, params.analysis_penalty);

  SolveLimits limits;
  limits.time_limit_seconds = params.time_limit_seconds;
  limits.log_search = params.log_search;
  limits.cancel = params.cancel;

  SolveResult r;
  try {
    r = solver.solve(m.mip, limits);
  } catch (const std::exception& e) {
    out.status = DayStatus::kSolverFailure;
    out.message = std::string("solver threw: ") + e.what();
    if (params.verbose)
      std::cerr << "[day_optimizer] " << date << " solver failure (" << out.message << ")\n";
    return out;
  }

  if (r.status == SolveStatus::kCancelled) {
    out.status = DayStatus::kCancelled;
    out.message = r.message;
    return out;
  }
  if (!has_solution(r.status) || static_cast<int>(r.values.size()) != m.mip.num_vars()) {
    out.status = DayStatus::kSolverFailure;
    out.message = std::string(to_string(r.status)) + (r.message.empty() ? "" : ": " + r.message);
    if (params.verbose)
      std::cerr << "[day_optimizer] " << date << " solver failure (" << out.message << ")"
                << " workers=" << pool.size() << " tasks=" << tasks.size() << "\n";
    return out;
  }

  // ---- extract ----
  const auto per_task = extract_assignment(m, r.values);
  const std::string bad = check_solution(m, tasks, per_task);
  if (!bad.empty()) {
    out.status = DayStatus::kSolverFailure;
    out.message = "invalid solution: " + bad;
    return out;
  }

  for (size_t t = 0; t < per_task.size(); ++t)
    for (int w : per_task[t]) out.tasks[t].workers.push_back(pool[w]->name);
  out.objective = r.objective;

  if (params.verbose) {
    int assigned = 0;
    for (const auto& t : out.tasks) assigned += static_cast<int>(t.workers.size());
    std::cout << "[day_optimizer] " << date << " " << to_string(r.status)
              << " tasks=" << tasks.size() << " eligible=" << pool.size()
              << " assigned=" << assigned << " objective=" << r.objective << "\n";
  }
  return out;
}

} // namespace crew
