// validation.h
#pragma once
#include <vector>
#include "errors.h"
#include "types.h"

namespace crew {

// All validators throw InputMalformed on the first problem found.

// Non-empty, unique non-blank names, ratings within [kMinRating, kMaxRating],
// no empty weekday set in an availability rule.
void validate_workers(const std::vector<Worker>& workers);

// Non-empty, non-blank names, required_workers >= 1, graded requirements
// within range, finite non-negative duration.
void validate_tasks(const std::vector<TaskDef>& tasks);

// YYYY-MM-DD dates and non-blank task names.
void validate_schedule(const std::vector<ScheduleEntry>& schedule);

void validate_inputs(const std::vector<Worker>& workers,
                     const std::vector<TaskDef>& tasks,
                     const std::vector<ScheduleEntry>& schedule);

} // namespace crew
