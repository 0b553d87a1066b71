#include "validation.h"
#include "utils.h"

#include <cmath>
#include <unordered_set>

namespace crew
{

    namespace
    {

        void check_rating(const std::string &where, const char *field, int v, int lo = kMinRating)
        {
            if (v < lo || v > kMaxRating)
                fail(where + ": " + field + "=" + std::to_string(v) + " outside [" +
                     std::to_string(lo) + "," + std::to_string(kMaxRating) + "]");
        }

    } // namespace

    void validate_workers(const std::vector<Worker> &workers)
    {
        if (workers.empty())
            fail("Worker registry is empty");

        std::unordered_set<std::string> seen;
        for (size_t i = 0; i < workers.size(); ++i)
        {
            const Worker &w = workers[i];
            const std::string where = "worker[" + std::to_string(i) + "]";
            if (trim(w.name).empty())
                fail(where + ": blank name");
            if (!seen.insert(w.name).second)
                fail(where + ": duplicate name '" + w.name + "'");

            check_rating(where, "skill", w.skill);
            check_rating(where, "physical_strength", w.physical_strength);
            check_rating(where, "temperament", w.temperament);
            check_rating(where, "trouble_tolerance", w.trouble_tolerance);

            for (const auto &rule : w.availability)
            {
                if (rule.only_weekdays.empty())
                    fail(where + " '" + w.name + "': availability rule with no weekdays");
            }
        }
    }

    void validate_tasks(const std::vector<TaskDef> &tasks)
    {
        if (tasks.empty())
            fail("Task registry is empty");

        for (size_t i = 0; i < tasks.size(); ++i)
        {
            const TaskDef &t = tasks[i];
            const std::string where = "task[" + std::to_string(i) + "]";
            if (trim(t.name).empty())
                fail(where + ": blank name");
            if (t.required_workers < 1)
                fail(where + " '" + t.name + "': required_workers must be >= 1");

            check_rating(where, "required_skill", t.required_skill);
            check_rating(where, "required_strength", t.required_strength);
            // 0 means "not needed"; only >= kRequirementThreshold switches the term on
            check_rating(where, "requires_vessel_work", t.requires_vessel_work, 0);
            check_rating(where, "requires_navigation", t.requires_navigation, 0);

            if (!std::isfinite(t.duration) || t.duration < 0.0)
                fail(where + " '" + t.name + "': bad duration");
        }
    }

    void validate_schedule(const std::vector<ScheduleEntry> &schedule)
    {
        for (size_t i = 0; i < schedule.size(); ++i)
        {
            const auto &e = schedule[i];
            const std::string where = "schedule[" + std::to_string(i) + "]";
            if (!parse_ymd(e.date))
                fail(where + ": bad date '" + e.date + "'");
            if (trim(e.task_name).empty())
                fail(where + ": blank task name on " + e.date);
        }
    }

    void validate_inputs(const std::vector<Worker> &workers,
                         const std::vector<TaskDef> &tasks,
                         const std::vector<ScheduleEntry> &schedule)
    {
        validate_workers(workers);
        validate_tasks(tasks);
        validate_schedule(schedule);
    }

} // namespace crew
