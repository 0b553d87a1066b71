#include "types.h"

namespace crew {

std::map<std::string, std::vector<std::string>> DayOutcome::by_task_name() const {
  std::map<std::string, std::vector<std::string>> out;
  for (const auto& t : tasks) {
    auto& dst = out[t.display_name];
    dst.insert(dst.end(), t.workers.begin(), t.workers.end());
  }
  return out;
}

std::vector<std::string> AggregateResult::dates() const {
  std::vector<std::string> out;
  out.reserve(days.size());
  for (const auto& kv : days) out.push_back(kv.first);
  return out;
}

std::vector<std::string> AggregateResult::failed_dates() const {
  std::vector<std::string> out;
  for (const auto& kv : days)
    if (!kv.second.ok()) out.push_back(kv.first);
  return out;
}

const char* to_string(DayStatus s) {
  switch (s) {
    case DayStatus::kSolved: return "solved";
    case DayStatus::kSolverFailure: return "solver_failure";
    case DayStatus::kCancelled: return "cancelled";
  }
  return "unknown";
}

} // namespace crew
