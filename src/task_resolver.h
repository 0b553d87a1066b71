#pragma once
#include <string>
#include <vector>
#include "types.h"

namespace crew {

// Area given to tasks that match nothing in the registry.
inline const std::string kUnknownArea = "unknown";

// "1.5" -> 1.5, "0.5～3" or "0.5~3" -> 1.75 (midpoint); anything else -> 1.0
double parse_duration(const std::string& raw);

// Defaults used for a schedule entry with no registry match.
TaskDef unregistered_task(const std::string& name);

// Exact match on trimmed names first, then the first registry entry whose
// name contains or is contained in the display name. Registry order decides
// between several substring matches.
ResolvedTask resolve_task(const ScheduleEntry& entry,
                          const std::vector<TaskDef>& registry);

} // namespace crew
