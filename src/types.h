// types.h
#pragma once
#include <map>
#include <string>
#include <vector>

namespace crew {

// Ratings are small bounded integers.
constexpr int kMinRating = 1;
constexpr int kMaxRating = 5;

// A graded requirement at or above this level switches the matching
// capability term on.
constexpr int kRequirementThreshold = 3;

enum class Weekday { Mon = 0, Tue, Wed, Thu, Fri, Sat, Sun };

// "only on these weekdays"
struct AvailabilityRule {
  std::vector<Weekday> only_weekdays;
};

struct Worker {
  std::string name;            // unique within a run
  int priority = 0;            // ordinal, descriptive
  int skill = 3;
  int physical_strength = 3;
  int temperament = 3;
  int trouble_tolerance = 3;   // lower is better, descriptive only
  bool can_work_on_vessel = false;
  bool can_drive = false;
  bool can_navigate = false;
  bool analysis_priority = false;  // prefers lab work over field sampling
  std::vector<AvailabilityRule> availability;
};

struct TaskDef {
  int task_id = 0;
  std::string name;
  std::string area;
  int required_workers = 1;    // upper bound, not a quota
  int required_skill = 3;
  int required_strength = 3;
  int urgency = 3;             // not scored
  int requires_vessel_work = 1;
  int requires_navigation = 1;
  double duration = 1.0;       // hours
};

struct ScheduleEntry {
  std::string date;            // "YYYY-MM-DD"
  std::string task_name;       // free text, matched approximately
};

struct ResolvedTask {
  TaskDef def;
  std::string date;
  std::string display_name;    // original schedule text, result key
  bool is_unregistered = false;
};

// One slot of a day's assignment, in schedule order.
struct TaskAssignment {
  std::string display_name;
  std::string area;
  int required_workers = 1;
  bool is_unregistered = false;
  std::vector<std::string> workers;  // worker iteration order
};

enum class DayStatus {
  kSolved,         // includes "no eligible workers"
  kSolverFailure,
  kCancelled
};

struct DayOutcome {
  std::string date;
  DayStatus status = DayStatus::kSolved;
  std::string message;              // empty when solved
  double objective = 0.0;
  int eligible_workers = 0;
  std::vector<TaskAssignment> tasks;

  bool ok() const { return status == DayStatus::kSolved; }

  // task name -> workers; duplicate names merge in slot order
  std::map<std::string, std::vector<std::string>> by_task_name() const;
};

struct AggregateResult {
  std::map<std::string, DayOutcome> days;  // date -> outcome

  std::vector<std::string> dates() const;
  std::vector<std::string> failed_dates() const;
  bool all_solved() const { return failed_dates().empty(); }
};

const char* to_string(DayStatus s);

} // namespace crew
