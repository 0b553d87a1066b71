#include "config.h"

#include <algorithm>
#include <limits>
#include <thread>

#include "errors.h"

namespace crew {

Cfg parse_config(const nlohmann::json& j) {
  if (!j.is_null() && !j.is_object()) fail("config: expected a JSON object");

  const unsigned def_threads_u = std::max(1u, std::thread::hardware_concurrency());
  const int def_threads = (def_threads_u > static_cast<unsigned>(std::numeric_limits<int>::max()))
      ? std::numeric_limits<int>::max()
      : static_cast<int>(def_threads_u);

  const nlohmann::json obj = j.is_null() ? nlohmann::json::object() : j;
  Cfg c{};
  try {
    c = Cfg{
      /*threads*/                   obj.value("THREADS", def_threads),
      /*solver_id*/                 obj.value("SOLVER_ID", std::string("SCIP")),
      /*day_time_limit_s*/          obj.value("DAY_TIME_LIMIT_SECONDS", 30),
      /*analysis_priority_penalty*/ obj.value("ANALYSIS_PRIORITY_PENALTY", -20.0),
      /*log_progress*/              obj.value("LOG_PROGRESS", true),
      /*solver_output*/             obj.value("SOLVER_OUTPUT", false),
      /*result_out*/                obj.value("RESULT_OUT", std::string("result.json"))
    };
  } catch (const nlohmann::json::exception& e) {
    fail(std::string("config: ") + e.what());
  }

  if (c.threads < 1) fail("config: THREADS must be >= 1");
  if (c.solver_id.empty()) fail("config: SOLVER_ID is empty");
  return c;
}

ScheduleSolveParams to_solve_params(const Cfg& c) {
  ScheduleSolveParams p;
  p.threads = c.threads;
  p.verbose = c.log_progress;
  p.day.time_limit_seconds = c.day_time_limit_s;
  p.day.analysis_penalty = c.analysis_priority_penalty;
  p.day.log_search = c.solver_output;
  return p;
}

} // namespace crew
