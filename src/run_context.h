#pragma once
#include <string>
#include <vector>

#include "types.h"

namespace crew {

// Registries and schedule for one run: loaded once, read by every day
// optimization, replaced only by an explicit reload().
class RunContext {
 public:
  struct Sources {
    std::string workers_path;
    std::string tasks_path;
    std::string schedule_path;
  };

  // Parses and validates; throws InputMalformed.
  static RunContext load(const Sources& src);

  // In-memory construction, validated the same way.
  RunContext(std::vector<Worker> workers,
             std::vector<TaskDef> tasks,
             std::vector<ScheduleEntry> schedule);

  // Re-reads the sources; on failure the current data is kept.
  void reload();

  const std::vector<Worker>& workers() const { return workers_; }
  const std::vector<TaskDef>& tasks() const { return tasks_; }
  const std::vector<ScheduleEntry>& schedule() const { return schedule_; }
  const Sources& sources() const { return src_; }

 private:
  Sources src_;
  std::vector<Worker> workers_;
  std::vector<TaskDef> tasks_;
  std::vector<ScheduleEntry> schedule_;
};

} // namespace crew
