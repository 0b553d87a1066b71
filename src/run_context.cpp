#include "run_context.h"

#include <utility>

#include "errors.h"
#include "parse.h"
#include "validation.h"

namespace crew {

RunContext::RunContext(std::vector<Worker> workers,
                       std::vector<TaskDef> tasks,
                       std::vector<ScheduleEntry> schedule)
    : workers_(std::move(workers)),
      tasks_(std::move(tasks)),
      schedule_(std::move(schedule)) {
  validate_inputs(workers_, tasks_, schedule_);
}

RunContext RunContext::load(const Sources& src) {
  if (src.workers_path.empty() || src.tasks_path.empty() || src.schedule_path.empty())
    fail("RunContext: workers, tasks and schedule paths are all required");

  RunContext ctx(parse_workers(load_json(src.workers_path)),
                 parse_tasks(load_json(src.tasks_path)),
                 parse_schedule(load_json(src.schedule_path)));
  ctx.src_ = src;
  return ctx;
}

void RunContext::reload() {
  RunContext fresh = load(src_);
  *this = std::move(fresh);
}

} // namespace crew
