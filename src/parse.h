#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.h"

namespace crew {

using json = nlohmann::json;

// File helpers. Throw InputMalformed on unreadable or invalid JSON.
json load_json(const std::string& path);
void save_json(const std::string& path, const json& j);

// Record parsers. Missing required fields and wrong types throw
// InputMalformed naming the offending record.
std::vector<Worker> parse_workers(const json& arr);
std::vector<TaskDef> parse_tasks(const json& arr);
std::vector<ScheduleEntry> parse_schedule(const json& arr);

// Typed rules from a free-text notes field: "月火のみ" (Mon/Tue only) and
// "分析優先" (analysis priority).
void apply_notes(const std::string& notes, Worker& w);

// {schedule_dates, results, unregistered, failed_dates, summary}
json result_to_json(const AggregateResult& agg);

} // namespace crew
