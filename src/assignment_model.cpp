#include "assignment_model.h"
#include "suitability.h"

#include <unordered_map>

namespace crew {

AssignmentModel build_assignment_model(const std::string& date,
                                       const std::vector<const Worker*>& workers,
                                       const std::vector<ResolvedTask>& tasks,
                                       double analysis_penalty) {
  AssignmentModel m;
  m.mip.name = "assignment_" + date;

  const int W = static_cast<int>(workers.size());
  const int T = static_cast<int>(tasks.size());

  // ---- group tasks by area ----
  std::unordered_map<std::string, int> area_idx;
  m.task_area.reserve(T);
  for (const auto& t : tasks) {
    auto it = area_idx.find(t.def.area);
    if (it == area_idx.end()) {
      it = area_idx.emplace(t.def.area, static_cast<int>(m.areas.size())).first;
      m.areas.push_back(t.def.area);
    }
    m.task_area.push_back(it->second);
  }
  const int A = static_cast<int>(m.areas.size());

  // ---- columns + objective ----
  m.x.assign(W, std::vector<int>(T, -1));
  m.y.assign(W, std::vector<int>(A, -1));
  m.weight.assign(W, std::vector<double>(T, 0.0));

  for (int w = 0; w < W; ++w) {
    const double adj = priority_adjustment(*workers[w], analysis_penalty);
    for (int t = 0; t < T; ++t) {
      const int col = m.mip.add_bool_var("x_" + std::to_string(w) + "_" + std::to_string(t));
      m.x[w][t] = col;
      m.weight[w][t] = score(*workers[w], tasks[t].def) + adj;
      m.mip.objective[col] = m.weight[w][t];
    }
    for (int a = 0; a < A; ++a)
      m.y[w][a] = m.mip.add_bool_var("y_" + std::to_string(w) + "_" + std::to_string(a));
  }

  // ---- one area per worker ----
  for (int w = 0; w < W; ++w) {
    MipModel::Row row;
    row.name = "one_area_" + std::to_string(w);
    row.ub = 1.0;
    for (int a = 0; a < A; ++a) row.terms.push_back({m.y[w][a], 1.0});
    m.mip.rows.push_back(std::move(row));
  }

  // ---- linking: x[w,t] - y[w,area(t)] <= 0 ----
  for (int w = 0; w < W; ++w) {
    for (int t = 0; t < T; ++t) {
      MipModel::Row row;
      row.name = "link_" + std::to_string(w) + "_" + std::to_string(t);
      row.ub = 0.0;
      row.terms.push_back({m.x[w][t], 1.0});
      row.terms.push_back({m.y[w][m.task_area[t]], -1.0});
      m.mip.rows.push_back(std::move(row));
    }
  }

  // ---- capacity ----
  for (int t = 0; t < T; ++t) {
    MipModel::Row row;
    row.name = "cap_" + std::to_string(t);
    row.ub = static_cast<double>(tasks[t].def.required_workers);
    for (int w = 0; w < W; ++w) row.terms.push_back({m.x[w][t], 1.0});
    m.mip.rows.push_back(std::move(row));
  }

  return m;
}

std::vector<std::vector<int>> extract_assignment(const AssignmentModel& m,
                                                 const std::vector<double>& values) {
  const int W = static_cast<int>(m.x.size());
  const int T = static_cast<int>(m.task_area.size());
  std::vector<std::vector<int>> per_task(T);
  for (int t = 0; t < T; ++t)
    for (int w = 0; w < W; ++w)
      if (values[m.x[w][t]] > 0.5) per_task[t].push_back(w);
  return per_task;
}

} // namespace crew
