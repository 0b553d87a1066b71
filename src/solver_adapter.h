// solver_adapter.h
#pragma once
#include <atomic>
#include <limits>
#include <string>
#include <vector>

namespace crew {

// A pure 0/1 program: binary columns, linear rows lb <= a.x <= ub,
// linear objective to maximize.
struct MipModel {
  struct Term {
    int var;
    double coeff;
  };
  struct Row {
    std::vector<Term> terms;
    double lb = -std::numeric_limits<double>::infinity();
    double ub = std::numeric_limits<double>::infinity();
    std::string name;
  };

  std::string name;
  std::vector<std::string> var_names;
  std::vector<double> objective;  // one coefficient per variable
  std::vector<Row> rows;

  int add_bool_var(const std::string& var_name) {
    var_names.push_back(var_name);
    objective.push_back(0.0);
    return static_cast<int>(var_names.size()) - 1;
  }
  int num_vars() const { return static_cast<int>(var_names.size()); }
  int num_rows() const { return static_cast<int>(rows.size()); }
};

enum class SolveStatus {
  kOptimal,
  kFeasible,     // stopped by a limit with an incumbent
  kInfeasible,
  kError,        // abnormal, invalid model, no solver, timed out empty
  kCancelled
};

inline bool has_solution(SolveStatus s) {
  return s == SolveStatus::kOptimal || s == SolveStatus::kFeasible;
}

inline const char* to_string(SolveStatus s) {
  switch (s) {
    case SolveStatus::kOptimal: return "optimal";
    case SolveStatus::kFeasible: return "feasible";
    case SolveStatus::kInfeasible: return "infeasible";
    case SolveStatus::kError: return "error";
    case SolveStatus::kCancelled: return "cancelled";
  }
  return "unknown";
}

struct SolveResult {
  SolveStatus status = SolveStatus::kError;
  double objective = 0.0;
  std::vector<double> values;  // per variable, only with a solution
  std::string message;
};

struct SolveLimits {
  int time_limit_seconds = 30;  // <= 0: unlimited
  bool log_search = false;
  const std::atomic<bool>* cancel = nullptr;
};

// Generic MIP backend. Implementations must be usable from several threads
// at once, one solve per call.
class SolverAdapter {
 public:
  virtual ~SolverAdapter() = default;
  virtual SolveResult solve(const MipModel& model, const SolveLimits& limits) const = 0;
  virtual std::string name() const = 0;
};

} // namespace crew
