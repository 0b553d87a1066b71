#include "parse.h"

#include <filesystem>
#include <fstream>
#include <iomanip>

#include "errors.h"
#include "task_resolver.h"
#include "utils.h"

namespace fs = std::filesystem;

namespace crew {

namespace {

// Spreadsheet exports carry capabilities as 0/1 numbers; accept both.
bool get_flag(const json& j, const char* key) {
  if (!j.contains(key) || j[key].is_null()) return false;
  const auto& v = j[key];
  if (v.is_boolean()) return v.get<bool>();
  if (v.is_number()) return v.get<double>() > 0.0;
  throw std::runtime_error(std::string("field '") + key + "' is not a flag");
}

double get_duration(const json& j) {
  if (!j.contains("duration") || j["duration"].is_null()) return 1.0;
  const auto& v = j["duration"];
  if (v.is_number()) return v.get<double>();
  if (v.is_string()) return parse_duration(v.get<std::string>());
  return 1.0;
}

void require_array(const json& arr, const char* what) {
  if (!arr.is_array()) fail(std::string(what) + ": expected a JSON array");
}

} // namespace

json load_json(const std::string& path) {
  std::ifstream in(path);
  if (!in) fail("Cannot open file: " + path);
  try {
    json j;
    in >> j;
    return j;
  } catch (const json::exception& e) {
    fail(path + ": " + e.what());
  }
}

void save_json(const std::string& path, const json& j) {
  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Cannot write file: " + path);
  out << std::setw(2) << j << "\n";
}

void apply_notes(const std::string& notes, Worker& w) {
  if (notes.find("月火のみ") != std::string::npos)
    w.availability.push_back({{Weekday::Mon, Weekday::Tue}});
  if (notes.find("分析優先") != std::string::npos)
    w.analysis_priority = true;
}

std::vector<Worker> parse_workers(const json& arr) {
  require_array(arr, "workers");
  std::vector<Worker> out;
  out.reserve(arr.size());
  for (size_t i = 0; i < arr.size(); ++i) {
    const json& j = arr[i];
    try {
      Worker w;
      w.name = j.at("name").get<std::string>();
      w.priority = j.value("priority", 0);
      w.skill = j.at("skill").get<int>();
      w.physical_strength = j.at("physical_strength").get<int>();
      w.temperament = j.value("temperament", 3);
      w.trouble_tolerance = j.value("trouble_tolerance", 3);
      w.can_work_on_vessel = get_flag(j, "can_work_on_vessel");
      w.can_drive = get_flag(j, "can_drive");
      w.can_navigate = get_flag(j, "can_navigate");
      w.analysis_priority = get_flag(j, "analysis_priority");

      if (j.contains("availability")) {
        for (const auto& r : j.at("availability")) {
          AvailabilityRule rule;
          for (const auto& d : r.at("only_weekdays")) {
            const auto wd = weekday_from_name(d.get<std::string>());
            if (!wd) throw std::runtime_error("unknown weekday '" + d.get<std::string>() + "'");
            rule.only_weekdays.push_back(*wd);
          }
          w.availability.push_back(std::move(rule));
        }
      }
      if (j.contains("notes") && j["notes"].is_string())
        apply_notes(j["notes"].get<std::string>(), w);

      out.push_back(std::move(w));
    } catch (const std::exception& e) {
      fail("workers[" + std::to_string(i) + "]: " + e.what());
    }
  }
  return out;
}

std::vector<TaskDef> parse_tasks(const json& arr) {
  require_array(arr, "tasks");
  std::vector<TaskDef> out;
  out.reserve(arr.size());
  for (size_t i = 0; i < arr.size(); ++i) {
    const json& j = arr[i];
    try {
      TaskDef t;
      t.task_id = j.value("task_id", static_cast<int>(i + 1));
      t.name = j.at("name").get<std::string>();
      t.area = j.value("area", kUnknownArea);
      t.required_workers = j.value("required_workers", 1);
      t.required_skill = j.value("required_skill", 3);
      t.required_strength = j.value("required_strength", 3);
      t.urgency = j.value("urgency", 3);
      t.requires_vessel_work = j.value("requires_vessel_work", 1);
      t.requires_navigation = j.value("requires_navigation", 1);
      t.duration = get_duration(j);
      out.push_back(std::move(t));
    } catch (const std::exception& e) {
      fail("tasks[" + std::to_string(i) + "]: " + e.what());
    }
  }
  return out;
}

std::vector<ScheduleEntry> parse_schedule(const json& arr) {
  require_array(arr, "schedule");
  std::vector<ScheduleEntry> out;
  out.reserve(arr.size());
  for (size_t i = 0; i < arr.size(); ++i) {
    const json& j = arr[i];
    try {
      ScheduleEntry e;
      e.date = j.at("date").get<std::string>();
      e.task_name = j.contains("task") ? j.at("task").get<std::string>()
                                       : j.at("task_name").get<std::string>();
      out.push_back(std::move(e));
    } catch (const std::exception& e) {
      fail("schedule[" + std::to_string(i) + "]: " + e.what());
    }
  }
  return out;
}

json result_to_json(const AggregateResult& agg) {
  json out;
  out["schedule_dates"] = agg.dates();
  out["results"] = json::object();
  out["unregistered"] = json::object();
  out["failed_dates"] = json::array();

  int solved = 0, slots = 0, empty_slots = 0, understaffed = 0, assigned = 0;

  for (const auto& kv : agg.days) {
    const DayOutcome& d = kv.second;

    json unreg = json::array();
    for (const auto& t : d.tasks)
      if (t.is_unregistered) unreg.push_back(t.display_name);
    if (!unreg.empty()) out["unregistered"][kv.first] = std::move(unreg);

    if (!d.ok()) {
      // null, so a failed date never reads as "nobody fits"
      out["results"][kv.first] = nullptr;
      out["failed_dates"].push_back({{"date", kv.first},
                                     {"status", to_string(d.status)},
                                     {"message", d.message}});
      continue;
    }

    ++solved;
    json day = json::object();
    for (const auto& name_workers : d.by_task_name()) day[name_workers.first] = name_workers.second;
    out["results"][kv.first] = std::move(day);

    for (const auto& t : d.tasks) {
      ++slots;
      const int n = static_cast<int>(t.workers.size());
      assigned += n;
      if (n == 0) ++empty_slots;
      if (n < t.required_workers) ++understaffed;
    }
  }

  out["summary"] = {{"dates", agg.days.size()},
                    {"solved_dates", solved},
                    {"failed_dates", agg.days.size() - solved},
                    {"task_slots", slots},
                    {"unassigned_slots", empty_slots},
                    {"understaffed_slots", understaffed},
                    {"assignments", assigned}};
  return out;
}

} // namespace crew
