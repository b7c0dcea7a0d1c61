#include "validation.h"
#include "utils.h"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace rota
{

    [[noreturn]] void fail(const std::string &msg)
    {
        throw ConfigError(msg);
    }

    void validate_request(const RosterRequest &req, const EngineOptions &opts)
    {
        // 1) Engine knobs
        validate_engine_options(opts);

        // 2) Horizon
        validate_horizon(req.start_date, req.end_date);

        // 3) People
        validate_people(req.people);

        // 4) Floor
        validate_staffing(req, opts);

        // 5) Task templates (tasks mode needs at least one)
        validate_tasks(req);

        // NOTE: rotation settings are checked while resolving them (resolve_rotations),
        // because only the people who fall back to the default need it to be valid.
    }

    void validate_horizon(const std::string &start_date, const std::string &end_date)
    {
        if (start_date.empty() || end_date.empty())
            fail("Missing start_date/end_date.");
        const int s = parse_ymd(start_date);
        const int e = parse_ymd(end_date);
        if (e < s)
            fail("end_date " + end_date + " is before start_date " + start_date);
    }

    void validate_people(const std::vector<Person> &people)
    {
        std::unordered_set<std::string> seen;
        seen.reserve(people.size() * 2);
        for (std::size_t i = 0; i < people.size(); ++i)
        {
            const Person &p = people[i];
            if (p.id.empty())
                fail("Person " + std::to_string(i) + " missing required field: id");
            if (!seen.insert(p.id).second)
                fail("Duplicate person id found: " + p.id);
        }
    }

    void validate_staffing(const RosterRequest &req, const EngineOptions &opts)
    {
        if (opts.min_daily_staff < 0)
            fail("MIN_DAILY_STAFF must be >= 0.");
        if (req.custom_min_staff && *req.custom_min_staff < 0)
            fail("custom_min_staff must be >= 0.");
    }

    void validate_tasks(const RosterRequest &req)
    {
        if (req.mode == OptimizationMode::Tasks && req.tasks.empty())
            fail("Optimization mode 'tasks' requires at least one task template.");

        for (const auto &t : req.tasks)
        {
            if (!t.start_date.empty())
                parse_ymd(t.start_date);
            if (!t.end_date.empty())
                parse_ymd(t.end_date);
            for (const auto &s : t.segments)
            {
                if (s.required_people < 0)
                    fail("Task " + t.name + " segment " + s.name + " has negative required_people.");
                if (!std::isfinite(s.duration_hours) || !std::isfinite(s.min_rest_hours_after))
                    fail("Task " + t.name + " segment " + s.name + " has a non-numeric duration.");
            }
        }
    }

    void validate_engine_options(const EngineOptions &opts)
    {
        if (opts.repair_max_passes < 0)
            fail("REPAIR_MAX_PASSES must be >= 0.");
        if (opts.sa_iterations < 0)
            fail("SA_ITERATIONS must be >= 0.");
        if (!(opts.sa_alpha > 0.0 && opts.sa_alpha <= 1.0))
            fail("SA_ALPHA must be in (0, 1].");
        if (!(opts.sa_t0 > 0.0))
            fail("SA_T0 must be > 0.");
        if (opts.no_transition_weekday < -1 || opts.no_transition_weekday > 6)
            fail("NO_TRANSITION_WEEKDAY must be -1 (off) or 0..6.");
    }

    std::optional<std::string> capacity_warning(double theoretical_capacity, int floor)
    {
        if (floor <= 0 || theoretical_capacity >= floor)
            return std::nullopt;
        std::ostringstream oss;
        oss << "Rotation ratios give about " << std::fixed << std::setprecision(1) << theoretical_capacity
            << " people on base per day, below the required minimum of " << floor
            << "; the minimum cannot be met without breaking rotations";
        return oss.str();
    }

} // namespace rota
