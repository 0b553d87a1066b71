#include "availability.h"
#include "errors.h"
#include "utils.h"

#include <algorithm>

namespace crew {

bool is_available(const Worker& w, Weekday wd) {
  for (const auto& rule : w.availability) {
    const auto& days = rule.only_weekdays;
    if (std::find(days.begin(), days.end(), wd) == days.end()) return false;
  }
  return true;
}

bool is_available(const Worker& w, const std::string& date) {
  const auto wd = weekday_of(date);
  if (!wd) fail("Bad date: " + date);
  return is_available(w, *wd);
}

std::vector<const Worker*> available_workers(const std::vector<Worker>& workers,
                                             const std::string& date) {
  const auto wd = weekday_of(date);
  if (!wd) fail("Bad date: " + date);

  std::vector<const Worker*> out;
  out.reserve(workers.size());
  for (const auto& w : workers)
    if (is_available(w, *wd)) out.push_back(&w);
  return out;
}

} // namespace crew
