// suitability.h
#pragma once
#include <utility>
#include "types.h"

namespace crew {

// Shape of one graded term: surplus earns base + surplus_mult*d,
// shortfall costs deficit_mult*|d|.
struct GradedTerm {
  int base;
  int surplus_mult;
  int deficit_mult;
};

struct SuitabilityWeights {
  GradedTerm skill    {30, 5, 20};
  GradedTerm strength {20, 3, 15};
  GradedTerm vessel   {15, 2, 10};
  int nav_base = 10;
  int nav_mult = 2;
  int nav_missing = -30;
};

inline double graded_term(int have, int need, const GradedTerm& g) {
  const int d = have - need;
  if (d >= 0) return g.base + g.surplus_mult * d;
  return -static_cast<double>(g.deficit_mult) * -d;
}

double score(const Worker& w, const TaskDef& t,
             const SuitabilityWeights& W = SuitabilityWeights{});

// Flat penalty added to every task score of an analysis-priority worker.
inline double priority_adjustment(const Worker& w, double analysis_penalty = -20.0) {
  return w.analysis_priority ? analysis_penalty : 0.0;
}

// [min, max] of score() over the rating domain and every task the
// resolver can produce.
std::pair<double, double> score_bounds(const SuitabilityWeights& W = SuitabilityWeights{});

} // namespace crew
