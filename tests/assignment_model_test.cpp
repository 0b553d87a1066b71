#include <gtest/gtest.h>

#include "assignment_model.h"
#include "task_resolver.h"
#include "test_utils.h"

namespace crew {
namespace {

using test::make_task;
using test::make_worker;

ResolvedTask resolved(const TaskDef& def) {
  ResolvedTask r;
  r.def = def;
  r.date = "2025-04-01";
  r.display_name = def.name;
  return r;
}

TEST(AssignmentModelTest, ShapeOfTheProgram) {
  const Worker a = make_worker("a", 3, 3), b = make_worker("b", 4, 4);
  const std::vector<const Worker*> pool = {&a, &b};
  const std::vector<ResolvedTask> tasks = {resolved(make_task("t0", "north", 2)),
                                           resolved(make_task("t1", "south")),
                                           resolved(make_task("t2", "north"))};

  const AssignmentModel m = build_assignment_model("2025-04-01", pool, tasks);

  ASSERT_EQ(m.areas.size(), 2u);
  EXPECT_EQ(m.areas[0], "north");
  EXPECT_EQ(m.areas[1], "south");
  EXPECT_EQ(m.task_area, (std::vector<int>{0, 1, 0}));

  // 2x3 x-columns + 2x2 y-columns
  EXPECT_EQ(m.mip.num_vars(), 10);
  // one-area rows + linking rows + capacity rows
  EXPECT_EQ(m.mip.num_rows(), 2 + 6 + 3);
  EXPECT_NE(m.mip.name.find("2025-04-01"), std::string::npos);

  // capacity rows carry required_workers as upper bound
  const auto& cap0 = m.mip.rows[2 + 6];
  EXPECT_DOUBLE_EQ(cap0.ub, 2.0);
  EXPECT_EQ(cap0.terms.size(), 2u);

  // y columns have no objective weight
  for (int w = 0; w < 2; ++w)
    for (int ai = 0; ai < 2; ++ai) EXPECT_DOUBLE_EQ(m.mip.objective[m.y[w][ai]], 0.0);
}

TEST(AssignmentModelTest, ObjectiveIncludesPriorityAdjustment) {
  Worker lab = make_worker("lab", 3, 3);
  lab.analysis_priority = true;
  const Worker field = make_worker("field", 3, 3);
  const std::vector<const Worker*> pool = {&lab, &field};
  const std::vector<ResolvedTask> tasks = {resolved(make_task("t", "x"))};

  const AssignmentModel m = build_assignment_model("2025-04-01", pool, tasks, -20.0);
  EXPECT_DOUBLE_EQ(m.mip.objective[m.x[0][0]], 30.0);
  EXPECT_DOUBLE_EQ(m.mip.objective[m.x[1][0]], 50.0);
}

TEST(AssignmentModelTest, UnregisteredTasksShareTheUnknownArea) {
  const Worker a = make_worker("a", 3, 3);
  const std::vector<const Worker*> pool = {&a};
  ResolvedTask u1 = resolved(unregistered_task("x"));
  ResolvedTask u2 = resolved(unregistered_task("y"));
  const AssignmentModel m = build_assignment_model("2025-04-01", pool, {u1, u2});
  ASSERT_EQ(m.areas.size(), 1u);
  EXPECT_EQ(m.areas[0], kUnknownArea);
}

TEST(AssignmentModelTest, ExtractFollowsWorkerOrder) {
  const Worker a = make_worker("a", 3, 3), b = make_worker("b", 3, 3), c = make_worker("c", 3, 3);
  const std::vector<const Worker*> pool = {&a, &b, &c};
  const std::vector<ResolvedTask> tasks = {resolved(make_task("t", "x", 3))};
  const AssignmentModel m = build_assignment_model("2025-04-01", pool, tasks);

  std::vector<double> values(m.mip.num_vars(), 0.0);
  values[m.x[2][0]] = 1.0;
  values[m.x[0][0]] = 0.9999;
  values[m.x[1][0]] = 0.2;
  const auto per_task = extract_assignment(m, values);
  ASSERT_EQ(per_task.size(), 1u);
  EXPECT_EQ(per_task[0], (std::vector<int>{0, 2}));
}

TEST(AssignmentModelTest, BruteForceRespectsOneAreaPerDay) {
  // One strong worker, two attractive tasks in different areas: only one
  // can be taken.
  const Worker a = make_worker("a", 5, 5);
  const std::vector<const Worker*> pool = {&a};
  const std::vector<ResolvedTask> tasks = {resolved(make_task("n", "north")),
                                           resolved(make_task("s", "south"))};
  const AssignmentModel m = build_assignment_model("2025-04-01", pool, tasks);

  const test::BruteForceSolver bf;
  const SolveResult r = bf.solve(m.mip, SolveLimits{});
  ASSERT_EQ(r.status, SolveStatus::kOptimal);
  const auto per_task = extract_assignment(m, r.values);
  EXPECT_EQ(per_task[0].size() + per_task[1].size(), 1u);
  EXPECT_DOUBLE_EQ(r.objective, 66.0);
}

} // namespace
} // namespace crew
