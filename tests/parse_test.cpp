#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>

#include "config.h"
#include "errors.h"
#include "parse.h"
#include "run_context.h"
#include "test_utils.h"

namespace crew {
namespace {

namespace fs = std::filesystem;

TEST(ParseTest, WorkersWithStructuredAndLegacyRules) {
  const json j = json::parse(R"([
    {"name": "Sato", "priority": 1, "skill": 4, "physical_strength": 3,
     "can_work_on_vessel": true, "can_navigate": 1,
     "availability": [{"only_weekdays": ["Mon", "Tue"]}]},
    {"name": "Suzuki", "skill": 5, "physical_strength": 2, "can_drive": 0,
     "notes": "分析優先"},
    {"name": "Tanaka", "skill": 3, "physical_strength": 3, "notes": "月火のみ可能"}
  ])");
  const auto ws = parse_workers(j);
  ASSERT_EQ(ws.size(), 3u);

  EXPECT_TRUE(ws[0].can_work_on_vessel);
  EXPECT_TRUE(ws[0].can_navigate);
  ASSERT_EQ(ws[0].availability.size(), 1u);
  EXPECT_EQ(ws[0].availability[0].only_weekdays,
            (std::vector<Weekday>{Weekday::Mon, Weekday::Tue}));

  EXPECT_TRUE(ws[1].analysis_priority);
  EXPECT_FALSE(ws[1].can_drive);
  EXPECT_TRUE(ws[1].availability.empty());
  EXPECT_EQ(ws[1].temperament, 3);

  ASSERT_EQ(ws[2].availability.size(), 1u);
  EXPECT_FALSE(ws[2].analysis_priority);
}

TEST(ParseTest, WorkerErrorsBecomeInputMalformed) {
  EXPECT_THROW(parse_workers(json::parse(R"([{"skill": 3, "physical_strength": 3}])")),
               InputMalformed);
  EXPECT_THROW(parse_workers(json::parse(R"([{"name": "a", "skill": "high", "physical_strength": 3}])")),
               InputMalformed);
  EXPECT_THROW(parse_workers(json::parse(R"([{"name": "a", "skill": 3, "physical_strength": 3,
                                              "availability": [{"only_weekdays": ["Funday"]}]}])")),
               InputMalformed);
  EXPECT_THROW(parse_workers(json::parse(R"({"name": "a"})")), InputMalformed);
}

TEST(ParseTest, TasksWithDurationForms) {
  const json j = json::parse(R"([
    {"task_id": 7, "name": "River", "area": "north", "required_workers": 2, "duration": 2.5},
    {"name": "Bay", "area": "bay", "requires_navigation": 4, "duration": "0.5～3"},
    {"name": "Dock", "duration": "ask the foreman"},
    {"name": "Pier"}
  ])");
  const auto ts = parse_tasks(j);
  ASSERT_EQ(ts.size(), 4u);
  EXPECT_EQ(ts[0].task_id, 7);
  EXPECT_EQ(ts[0].required_workers, 2);
  EXPECT_DOUBLE_EQ(ts[0].duration, 2.5);
  EXPECT_EQ(ts[1].task_id, 2);
  EXPECT_EQ(ts[1].requires_navigation, 4);
  EXPECT_DOUBLE_EQ(ts[1].duration, 1.75);
  EXPECT_DOUBLE_EQ(ts[2].duration, 1.0);
  EXPECT_EQ(ts[2].area, "unknown");
  EXPECT_DOUBLE_EQ(ts[3].duration, 1.0);
}

TEST(ParseTest, ScheduleAcceptsBothKeys) {
  const auto s = parse_schedule(json::parse(R"([
    {"date": "2025-04-01", "task": "River"},
    {"date": "2025-04-01", "task_name": "Bay"}
  ])"));
  ASSERT_EQ(s.size(), 2u);
  EXPECT_EQ(s[1].task_name, "Bay");
  EXPECT_THROW(parse_schedule(json::parse(R"([{"date": "2025-04-01"}])")), InputMalformed);
}

TEST(ParseTest, ResultJsonSeparatesFailuresFromEmptyTasks) {
  AggregateResult agg;

  DayOutcome ok;
  ok.date = "2025-04-01";
  TaskAssignment filled{"River", "north", 2, false, {"a", "b"}};
  TaskAssignment nobody{"Soil survey", "unknown", 1, true, {}};
  TaskAssignment again{"River", "north", 2, false, {"c"}};
  ok.tasks = {filled, nobody, again};
  agg.days[ok.date] = ok;

  DayOutcome bad;
  bad.date = "2025-04-02";
  bad.status = DayStatus::kSolverFailure;
  bad.message = "infeasible";
  bad.tasks = {TaskAssignment{"River", "north", 2, false, {}}};
  agg.days[bad.date] = bad;

  const json j = result_to_json(agg);
  EXPECT_EQ(j["schedule_dates"], json::parse(R"(["2025-04-01", "2025-04-02"])"));
  EXPECT_EQ(j["results"]["2025-04-01"]["River"], json::parse(R"(["a", "b", "c"])"));
  EXPECT_TRUE(j["results"]["2025-04-01"]["Soil survey"].empty());
  EXPECT_TRUE(j["results"]["2025-04-01"]["Soil survey"].is_array());
  EXPECT_TRUE(j["results"]["2025-04-02"].is_null());
  EXPECT_EQ(j["unregistered"]["2025-04-01"], json::parse(R"(["Soil survey"])"));
  ASSERT_EQ(j["failed_dates"].size(), 1u);
  EXPECT_EQ(j["failed_dates"][0]["date"], "2025-04-02");
  EXPECT_EQ(j["failed_dates"][0]["status"], "solver_failure");
  EXPECT_EQ(j["summary"]["solved_dates"], 1);
  EXPECT_EQ(j["summary"]["task_slots"], 3);
  EXPECT_EQ(j["summary"]["unassigned_slots"], 1);
  EXPECT_EQ(j["summary"]["understaffed_slots"], 2);
  EXPECT_EQ(j["summary"]["assignments"], 3);
}

TEST(ConfigTest, DefaultsAndOverrides) {
  const Cfg d = parse_config(json::object());
  EXPECT_GE(d.threads, 1);
  EXPECT_EQ(d.solver_id, "SCIP");
  EXPECT_EQ(d.day_time_limit_s, 30);
  EXPECT_DOUBLE_EQ(d.analysis_priority_penalty, -20.0);
  EXPECT_EQ(d.result_out, "result.json");

  const Cfg c = parse_config(json::parse(R"({"THREADS": 2, "SOLVER_ID": "CBC",
      "DAY_TIME_LIMIT_SECONDS": 5, "ANALYSIS_PRIORITY_PENALTY": -10, "LOG_PROGRESS": false})"));
  const ScheduleSolveParams p = to_solve_params(c);
  EXPECT_EQ(p.threads, 2);
  EXPECT_EQ(c.solver_id, "CBC");
  EXPECT_EQ(p.day.time_limit_seconds, 5);
  EXPECT_DOUBLE_EQ(p.day.analysis_penalty, -10.0);
  EXPECT_FALSE(p.verbose);
}

TEST(ConfigTest, BadValuesAreFatal) {
  EXPECT_THROW(parse_config(json::parse(R"({"THREADS": 0})")), InputMalformed);
  EXPECT_THROW(parse_config(json::parse(R"({"THREADS": "many"})")), InputMalformed);
  EXPECT_THROW(parse_config(json::parse(R"([1, 2])")), InputMalformed);
}

class RunContextTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("crew_ctx_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)));
    fs::create_directories(dir_);
    write("workers.json", R"([{"name": "a", "skill": 3, "physical_strength": 3}])");
    write("tasks.json", R"([{"name": "River", "area": "north"}])");
    write("schedule.json", R"([{"date": "2025-04-01", "task": "River"}])");
  }
  void TearDown() override { fs::remove_all(dir_); }

  void write(const std::string& name, const std::string& body) {
    std::ofstream(dir_ / name) << body;
  }
  RunContext::Sources sources() const {
    return {(dir_ / "workers.json").string(), (dir_ / "tasks.json").string(),
            (dir_ / "schedule.json").string()};
  }

  fs::path dir_;
};

TEST_F(RunContextTest, LoadAndExplicitReload) {
  RunContext ctx = RunContext::load(sources());
  EXPECT_EQ(ctx.workers().size(), 1u);

  write("workers.json", R"([{"name": "a", "skill": 3, "physical_strength": 3},
                            {"name": "b", "skill": 4, "physical_strength": 4}])");
  EXPECT_EQ(ctx.workers().size(), 1u);  // nothing changes until reload()
  ctx.reload();
  EXPECT_EQ(ctx.workers().size(), 2u);
}

TEST_F(RunContextTest, FailedReloadKeepsCurrentData) {
  RunContext ctx = RunContext::load(sources());
  write("tasks.json", "[]");
  EXPECT_THROW(ctx.reload(), InputMalformed);
  EXPECT_EQ(ctx.tasks().size(), 1u);
}

TEST_F(RunContextTest, MissingFileIsInputMalformed) {
  auto src = sources();
  src.schedule_path = (dir_ / "nope.json").string();
  EXPECT_THROW(RunContext::load(src), InputMalformed);
}

TEST_F(RunContextTest, BrokenJsonIsInputMalformed) {
  write("schedule.json", "[{\"date\": ");
  EXPECT_THROW(RunContext::load(sources()), InputMalformed);
}

} // namespace
} // namespace crew
