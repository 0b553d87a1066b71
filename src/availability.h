#pragma once
#include <string>
#include <vector>
#include "types.h"

namespace crew {

// Every "only on weekdays" rule must contain the weekday; no rules means
// always available.
bool is_available(const Worker& w, Weekday wd);

// Throws InputMalformed if the date is not a valid YYYY-MM-DD.
bool is_available(const Worker& w, const std::string& date);

// Workers available on the date, registry order kept.
std::vector<const Worker*> available_workers(const std::vector<Worker>& workers,
                                             const std::string& date);

} // namespace crew
