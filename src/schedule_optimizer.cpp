#include "schedule_optimizer.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <iostream>
#include <mutex>

#include "utils.h"

namespace crew {

std::map<std::string, std::vector<std::string>>
group_by_date(const std::vector<ScheduleEntry>& schedule) {
  std::map<std::string, std::vector<std::string>> calendar;
  for (const auto& e : schedule) calendar[e.date].push_back(e.task_name);
  return calendar;
}

AggregateResult optimize_schedule(const std::vector<ScheduleEntry>& schedule,
                                  const std::vector<Worker>& workers,
                                  const std::vector<TaskDef>& registry,
                                  const SolverAdapter& solver,
                                  const ScheduleSolveParams& params) {
  const auto calendar = group_by_date(schedule);

  std::vector<const std::pair<const std::string, std::vector<std::string>>*> jobs;
  jobs.reserve(calendar.size());
  for (const auto& kv : calendar) jobs.push_back(&kv);
  const int n = static_cast<int>(jobs.size());

  DaySolveParams dp = params.day;
  dp.cancel = params.cancel;
  dp.verbose = false;  // per-day lines are printed here, under io_mu

  if (params.verbose) {
    std::cout << "[schedule] dates=" << n << " entries=" << schedule.size()
              << " workers=" << workers.size() << " threads=" << params.threads
              << " backend=" << solver.name() << "\n";
  }

  std::atomic<int> next_idx{0};
  std::mutex io_mu;
  std::vector<DayOutcome> outcomes(n);

  auto run = [&]() {
    for (;;) {
      const int i = next_idx.fetch_add(1);
      if (i >= n) break;
      const std::string& date = jobs[i]->first;
      const auto& names = jobs[i]->second;

      if (params.cancel && params.cancel->load()) {
        outcomes[i] = DayOutcome{};
        outcomes[i].date = date;
        outcomes[i].status = DayStatus::kCancelled;
        outcomes[i].message = "cancelled before start";
        continue;
      }

      const auto t0 = NowMillis();
      DayOutcome day;
      try {
        day = optimize_day(date, names, workers, registry, solver, dp);
      } catch (const std::exception& e) {
        day = DayOutcome{};
        day.date = date;
        day.status = DayStatus::kSolverFailure;
        day.message = std::string("day failed: ") + e.what();
      }
      const auto t1 = NowMillis();

      if (params.verbose || !day.ok()) {
        std::lock_guard<std::mutex> lk(io_mu);
        auto& os = day.ok() ? std::cout : std::cerr;
        os << "[schedule] " << date << " " << to_string(day.status)
           << " tasks=" << names.size() << " eligible=" << day.eligible_workers
           << " objective=" << day.objective << " (" << (t1 - t0) << " ms)";
        if (!day.message.empty()) os << " " << day.message;
        os << "\n";
      }
      outcomes[i] = std::move(day);
    }
  };

  const int max_threads = std::max(1, std::min(params.threads, n));
  if (max_threads == 1) {
    run();
  } else {
    std::vector<std::future<void>> pool;
    for (int t = 0; t < max_threads; ++t) pool.emplace_back(std::async(std::launch::async, run));
    for (auto& fut : pool) fut.get();
  }

  AggregateResult agg;
  for (auto& o : outcomes) {
    const std::string date = o.date;
    agg.days.emplace(date, std::move(o));
  }

  if (params.verbose) {
    const int failed = static_cast<int>(agg.failed_dates().size());
    std::cout << "[schedule] done: " << (n - failed) << "/" << n
              << " dates solved\n";
  }
  return agg;
}

} // namespace crew
