// suitability.cpp
#include "suitability.h"
#include <algorithm>
#include <limits>

namespace crew {

double score(const Worker& w, const TaskDef& t, const SuitabilityWeights& W) {
  double s = 0.0;

  s += graded_term(w.skill, t.required_skill, W.skill);
  s += graded_term(w.physical_strength, t.required_strength, W.strength);

  if (t.requires_vessel_work >= kRequirementThreshold)
    s += graded_term(w.can_work_on_vessel ? 1 : 0, t.requires_vessel_work, W.vessel);

  if (t.requires_navigation >= kRequirementThreshold) {
    // discouraged, not forbidden
    if (w.can_navigate)
      s += W.nav_base + W.nav_mult * 1;
    else
      s += W.nav_missing;
  }
  return s;
}

std::pair<double, double> score_bounds(const SuitabilityWeights& W) {
  double lo = std::numeric_limits<double>::max();
  double hi = std::numeric_limits<double>::lowest();

  Worker w;
  TaskDef t;
  for (int ws = kMinRating; ws <= kMaxRating; ++ws)
    for (int ts = kMinRating; ts <= kMaxRating; ++ts)
      for (int wp = kMinRating; wp <= kMaxRating; ++wp)
        for (int tp = kMinRating; tp <= kMaxRating; ++tp)
          for (int vessel = 0; vessel <= 1; ++vessel)
            for (int tv = kMinRating; tv <= kMaxRating; ++tv)
              for (int nav = 0; nav <= 1; ++nav)
                for (int tn = kMinRating; tn <= kMaxRating; ++tn) {
                  w.skill = ws;
                  w.physical_strength = wp;
                  w.can_work_on_vessel = vessel != 0;
                  w.can_navigate = nav != 0;
                  t.required_skill = ts;
                  t.required_strength = tp;
                  t.requires_vessel_work = tv;
                  t.requires_navigation = tn;
                  const double s = score(w, t, W);
                  lo = std::min(lo, s);
                  hi = std::max(hi, s);
                }
  return {lo, hi};
}

} // namespace crew
