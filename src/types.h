// types.h
#pragma once
#include <vector>
#include <string>
#include <map>
#include <optional>
#include <stdexcept>

namespace rota {

enum class DayStatus { Base, Home, Unavailable };

enum class OverrideSource { Manual, Algorithm };

enum class ConstraintKind { NeverAssign, AlwaysAssign };

enum class AbsenceStatus { Approved, Pending, Rejected };

enum class SegmentFrequency { Daily, Weekly, Once };

enum class OptimizationMode { Ratio, MinStaff, Tasks, Anneal };

// Fatal input problems. Everything else ends up in RosterResult::warnings.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct DayOverride {
  bool available = true;
  std::optional<DayStatus> status;            // what the human (or a previous run) wrote
  OverrideSource source = OverrideSource::Manual;

  bool marks_unavailable() const { return !available || status == DayStatus::Unavailable; }
};

struct Person {
  std::string id;
  std::string name;
  std::string team_id;                        // empty = no team
  bool active = true;
  std::map<std::string, DayOverride> daily_availability; // "YYYY-MM-DD" -> override
};

struct SchedulingConstraint {
  std::string person_id;
  std::string start;                          // date or ISO date-time, date part is used
  std::string end;
  ConstraintKind kind = ConstraintKind::NeverAssign;
};

struct Absence {
  std::string person_id;
  std::string start_date;
  std::string end_date;
  AbsenceStatus status = AbsenceStatus::Approved;
};

struct HourlyBlockage {
  std::string person_id;
  std::string date;
  std::string start_time = "00:00";           // "HH:MM"
  std::string end_time = "23:59";
};

struct RotationConfig {
  int days_base = 11;
  int days_home = 3;
  int cycle() const { return days_base + days_home; }
};

struct TeamRotation {
  std::string team_id;
  int days_on_base = 11;
  int days_at_home = 3;
};

struct PersonHistory {
  DayStatus last_status = DayStatus::Base;    // Base or Home
  int consecutive_days = 0;                   // streak length ending the day before the horizon
};

struct TaskSegment {
  std::string id;
  std::string name;
  double duration_hours = 0.0;
  double min_rest_hours_after = 0.0;
  int required_people = 0;
  SegmentFrequency frequency = SegmentFrequency::Daily;
  bool is_repeat = false;                     // continuous cycle
};

struct TaskTemplate {
  std::string id;
  std::string name;
  std::vector<TaskSegment> segments;
  std::string start_date;                     // optional validity window, empty = open
  std::string end_date;
};

struct RosterRequest {
  std::string start_date;                     // inclusive, "YYYY-MM-DD"
  std::string end_date;                       // inclusive
  std::vector<Person> people;
  std::vector<TeamRotation> team_rotations;
  std::vector<SchedulingConstraint> constraints;
  std::vector<Absence> absences;
  std::vector<HourlyBlockage> hourly_blockages;
  OptimizationMode mode = OptimizationMode::Ratio;
  std::optional<int> custom_min_staff;
  std::optional<RotationConfig> custom_rotation;
  std::map<std::string, PersonHistory> history;   // person_id -> seed
  std::vector<TaskTemplate> tasks;
};

// Organization-level knobs; see parse_engine_options() for the JSON keys.
struct EngineOptions {
  int min_daily_staff = 0;
  RotationConfig default_rotation{11, 3};
  int repair_max_passes = 200;
  bool ratio_exit_day_as_home = false;
  int no_transition_weekday = -1;             // 0=Sun..6=Sat, -1 = off
  int sa_iterations = 20000;
  double sa_t0 = 100.0;
  double sa_alpha = 0.9995;
  int rng_seed = 42;
  bool verbose = false;
  int log_every = 2000;
};

struct DailyPresence {
  std::string date;
  std::string person_id;
  DayStatus status = DayStatus::Home;
  OverrideSource source = OverrideSource::Algorithm;
};

struct ConstraintStats {
  int total = 0;
  int met = 0;
  int percentage = 100;
};

struct RosterStats {
  int total_days = 0;
  double avg_staff_per_day = 0.0;
  ConstraintStats constraint_stats;
};

struct UnfulfilledConstraint {
  std::string person_id;
  std::string person_name;
  std::string date;
  std::string reason;
};

struct RosterResult {
  std::vector<DailyPresence> roster;
  std::map<std::string, std::map<std::string, DayStatus>> person_statuses; // date -> person -> status
  RosterStats stats;
  OptimizationMode mode = OptimizationMode::Ratio;
  int min_staff = 0;                          // floor actually applied
  std::vector<std::string> warnings;
  std::vector<UnfulfilledConstraint> unfulfilled_constraints;
};

const char* to_string(DayStatus s);
const char* to_string(OptimizationMode m);
DayStatus status_from_string(const std::string& s);
OptimizationMode mode_from_string(const std::string& s);

} // namespace rota
