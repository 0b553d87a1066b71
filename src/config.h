#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "schedule_optimizer.h"

namespace crew {

struct Cfg {
  int threads;
  std::string solver_id;
  int day_time_limit_s;
  double analysis_priority_penalty;
  bool log_progress;
  bool solver_output;
  std::string result_out;
};

// Keys are optional; missing keys take defaults. Wrong types or
// out-of-range values throw InputMalformed.
Cfg parse_config(const nlohmann::json& j);

ScheduleSolveParams to_solve_params(const Cfg& c);

} // namespace crew
