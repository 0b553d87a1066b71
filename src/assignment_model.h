// assignment_model.h
#pragma once
#include <string>
#include <vector>

#include "solver_adapter.h"
#include "types.h"

namespace crew {

// One day's binary program plus the index maps needed to read it back.
//   x[w][t] : worker w works task t
//   y[w][a] : worker w is committed to area a
struct AssignmentModel {
  MipModel mip;
  std::vector<std::string> areas;            // first-appearance order
  std::vector<int> task_area;                // task -> index into areas
  std::vector<std::vector<int>> x;           // [worker][task] -> column
  std::vector<std::vector<int>> y;           // [worker][area] -> column
  std::vector<std::vector<double>> weight;   // [worker][task] objective weight
};

// Builds the model over the eligible workers of one date.
//   max  sum (score(w,t) + priority_adjustment(w)) x[w,t]
//   s.t. sum_a y[w,a] <= 1                      one area per day
//        x[w,t] <= y[w,area(t)]                  linking
//        sum_w x[w,t] <= required_workers(t)    capacity
AssignmentModel build_assignment_model(const std::string& date,
                                       const std::vector<const Worker*>& workers,
                                       const std::vector<ResolvedTask>& tasks,
                                       double analysis_penalty = -20.0);

// Workers per task (worker order) from a solved column vector.
std::vector<std::vector<int>> extract_assignment(const AssignmentModel& m,
                                                 const std::vector<double>& values);

} // namespace crew
