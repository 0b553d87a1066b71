// main.cpp
#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.h"
#include "mip_solver.h"
#include "parse.h"
#include "run_context.h"
#include "schedule_optimizer.h"
#include "utils.h"

using json = nlohmann::json;

// ---------------- Minimal CLI ----------------
struct Flags {
  std::string workers_path;   // required
  std::string tasks_path;     // required
  std::string schedule_path;  // required
  std::string config_path;    // optional
  std::string out_path;       // overrides RESULT_OUT
  std::string date;           // optimize a single date
  bool verbose = true;        // flipped by --quiet
};

static void print_usage() {
  std::cout <<
R"(Usage:
  crew_planner --workers workers.json --tasks tasks.json --schedule schedule.json
               [--config config.json] [--out result.json] [--date YYYY-MM-DD] [--quiet]

Required:
  --workers PATH
  --tasks PATH
  --schedule PATH

Optional:
  --config PATH       THREADS, SOLVER_ID, DAY_TIME_LIMIT_SECONDS, ...
  --out PATH          Result file (default: RESULT_OUT or result.json)
  --date YYYY-MM-DD   Only optimize this scheduled date
  --quiet             Less logging
  --help
)";
}

static Flags parse_flags(int argc, char** argv) {
  Flags f;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* name) {
      if (i + 1 >= argc) { std::cerr << "Missing value for " << name << "\n"; std::exit(2); }
      return std::string(argv[++i]);
    };
    if (a == "--help" || a == "-h") { print_usage(); std::exit(0); }
    else if (a == "--workers")  f.workers_path = need("--workers");
    else if (a == "--tasks")    f.tasks_path = need("--tasks");
    else if (a == "--schedule") f.schedule_path = need("--schedule");
    else if (a == "--config")   f.config_path = need("--config");
    else if (a == "--out")      f.out_path = need("--out");
    else if (a == "--date")     f.date = need("--date");
    else if (a == "--quiet")    f.verbose = false;
    else { std::cerr << "Unknown flag: " << a << "\n"; print_usage(); std::exit(2); }
  }
  if (f.workers_path.empty() || f.tasks_path.empty() || f.schedule_path.empty()) {
    std::cerr << "Missing required --workers/--tasks/--schedule.\n"; print_usage(); std::exit(2);
  }
  return f;
}

// Ctrl-C stops outstanding days; finished days are still written.
static std::atomic<bool> g_cancel{false};
extern "C" void on_sigint(int) { g_cancel.store(true); }

static void print_preview(const crew::AggregateResult& agg, size_t max_dates) {
  size_t shown = 0;
  for (const auto& kv : agg.days) {
    if (shown++ >= max_dates) break;
    std::cout << "\n" << kv.first << ":";
    if (!kv.second.ok()) {
      std::cout << " FAILED (" << crew::to_string(kv.second.status) << ")\n";
      continue;
    }
    std::cout << "\n";
    for (const auto& t : kv.second.tasks) {
      std::cout << "  " << t.display_name << (t.is_unregistered ? " [unregistered]" : "") << ": ";
      if (t.workers.empty()) { std::cout << "(unassigned)\n"; continue; }
      for (size_t i = 0; i < t.workers.size(); ++i) std::cout << (i ? ", " : "") << t.workers[i];
      std::cout << "\n";
    }
  }
}

// ---------------- Main ----------------
int main(int argc, char** argv) {
  const Flags flags = parse_flags(argc, argv);

  if (flags.verbose) std::cout << "Field crew assignment\n";

  crew::Cfg cfg{};
  std::vector<crew::ScheduleEntry> schedule;
  std::unique_ptr<crew::RunContext> ctx;
  try {
    ctx = std::make_unique<crew::RunContext>(crew::RunContext::load(
        {flags.workers_path, flags.tasks_path, flags.schedule_path}));
    cfg = crew::parse_config(flags.config_path.empty() ? json::object()
                                                       : crew::load_json(flags.config_path));
  } catch (const std::exception& e) {
    std::cerr << "Failed to load inputs: " << e.what() << "\n"; return 1;
  }

  schedule = ctx->schedule();
  if (!flags.date.empty()) {
    schedule.erase(std::remove_if(schedule.begin(), schedule.end(),
                                  [&](const crew::ScheduleEntry& e) { return e.date != flags.date; }),
                   schedule.end());
    if (schedule.empty()) {
      std::cerr << "Date " << flags.date << " not found in schedule\n"; return 1;
    }
  }

  crew::ScheduleSolveParams params = crew::to_solve_params(cfg);
  params.verbose = params.verbose && flags.verbose;
  params.cancel = &g_cancel;

  if (flags.verbose) {
    std::cout << "Inputs: workers=" << ctx->workers().size()
              << " tasks=" << ctx->tasks().size()
              << " entries=" << schedule.size()
              << " backend=" << cfg.solver_id << "\n";
  }

  std::signal(SIGINT, on_sigint);

  const crew::OrToolsMipSolver solver(cfg.solver_id);
  const auto t0 = crew::NowMillis();
  const crew::AggregateResult agg =
      crew::optimize_schedule(schedule, ctx->workers(), ctx->tasks(), solver, params);
  const auto t1 = crew::NowMillis();

  if (flags.verbose) {
    std::cout << "Solved " << agg.days.size() << " dates in " << (t1 - t0) << " ms\n";
    print_preview(agg, 5);
  }

  const std::string out_path = flags.out_path.empty() ? cfg.result_out : flags.out_path;
  try { crew::save_json(out_path, crew::result_to_json(agg)); }
  catch (const std::exception& e) { std::cerr << "Failed to write result: " << e.what() << "\n"; return 4; }

  if (flags.verbose) std::cout << "\nResult written to " << out_path << "\n";

  const auto failed = agg.failed_dates();
  if (!failed.empty()) {
    std::cerr << failed.size() << " date(s) failed to optimize:";
    for (const auto& d : failed) std::cerr << " " << d;
    std::cerr << "\n";
    return 3;
  }
  return 0;
}
