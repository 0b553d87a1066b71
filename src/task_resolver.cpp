#include "task_resolver.h"
#include "utils.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace crew {

namespace {

// fullwidth tilde, U+FF5E
const std::string kWideTilde = "\xEF\xBD\x9E";

bool parse_number(const std::string& s, double& out) {
  const std::string t = trim(s);
  if (t.empty()) return false;
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(t.c_str(), &end);
  if (errno != 0 || end != t.c_str() + t.size() || !std::isfinite(v)) return false;
  out = v;
  return true;
}

} // namespace

double parse_duration(const std::string& raw) {
  std::string s = raw;
  for (auto pos = s.find(kWideTilde); pos != std::string::npos; pos = s.find(kWideTilde, pos))
    s.replace(pos, kWideTilde.size(), "~");

  const auto tilde = s.find('~');
  if (tilde != std::string::npos) {
    double lo = 0, hi = 0;
    if (parse_number(s.substr(0, tilde), lo) && parse_number(s.substr(tilde + 1), hi))
      return (lo + hi) / 2.0;
    return 1.0;
  }

  double v = 0;
  return parse_number(s, v) ? v : 1.0;
}

TaskDef unregistered_task(const std::string& name) {
  TaskDef t;
  t.task_id = 0;
  t.name = name;
  t.area = kUnknownArea;
  t.required_workers = 1;
  t.required_skill = 3;
  t.required_strength = 3;
  t.urgency = 3;
  t.requires_vessel_work = 1;  // below threshold: no vessel term
  t.requires_navigation = 1;   // below threshold: no navigation term
  t.duration = 1.0;
  return t;
}

ResolvedTask resolve_task(const ScheduleEntry& entry,
                          const std::vector<TaskDef>& registry) {
  ResolvedTask r;
  r.date = entry.date;
  r.display_name = entry.task_name;

  const std::string wanted = trim(entry.task_name);

  for (const auto& def : registry) {
    if (trim(def.name) == wanted) {
      r.def = def;
      return r;
    }
  }

  for (const auto& def : registry) {
    const std::string name = trim(def.name);
    if (name.empty() || wanted.empty()) continue;
    if (wanted.find(name) != std::string::npos || name.find(wanted) != std::string::npos) {
      r.def = def;
      return r;
    }
  }

  r.def = unregistered_task(wanted);
  r.is_unregistered = true;
  return r;
}

} // namespace crew
