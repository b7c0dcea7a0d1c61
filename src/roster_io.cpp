#include "roster_io.h"

namespace rota {

// ---------- enum helpers ----------
static OverrideSource source_from_string(const std::string& s) {
  if (s == "algorithm") return OverrideSource::Algorithm;
  if (s == "manual" || s.empty()) return OverrideSource::Manual;
  throw ConfigError("Unknown override source: " + s);
}
static const char* to_string(OverrideSource s) {
  return s == OverrideSource::Algorithm ? "algorithm" : "manual";
}
static ConstraintKind kind_from_string(const std::string& s) {
  if (s == "never_assign") return ConstraintKind::NeverAssign;
  if (s == "always_assign") return ConstraintKind::AlwaysAssign;
  throw ConfigError("Unknown constraint type: " + s);
}
static AbsenceStatus absence_status_from_string(const std::string& s) {
  if (s == "approved") return AbsenceStatus::Approved;
  if (s == "pending") return AbsenceStatus::Pending;
  if (s == "rejected") return AbsenceStatus::Rejected;
  throw ConfigError("Unknown absence status: " + s);
}
static SegmentFrequency frequency_from_string(const std::string& s) {
  if (s == "daily") return SegmentFrequency::Daily;
  if (s == "weekly") return SegmentFrequency::Weekly;
  if (s == "once" || s == "specific_date") return SegmentFrequency::Once;
  throw ConfigError("Unknown segment frequency: " + s);
}

// ---------- settings ----------
EngineOptions parse_engine_options(const json& j) {
  EngineOptions o;
  o.min_daily_staff          = j.value("MIN_DAILY_STAFF", o.min_daily_staff);
  o.default_rotation.days_base = j.value("DEFAULT_DAYS_ON_BASE", o.default_rotation.days_base);
  o.default_rotation.days_home = j.value("DEFAULT_DAYS_AT_HOME", o.default_rotation.days_home);
  o.repair_max_passes        = j.value("REPAIR_MAX_PASSES", o.repair_max_passes);
  o.ratio_exit_day_as_home   = j.value("RATIO_EXIT_DAY_AS_HOME", o.ratio_exit_day_as_home);
  o.no_transition_weekday    = j.value("NO_TRANSITION_WEEKDAY", o.no_transition_weekday);
  o.sa_iterations            = j.value("SA_ITERATIONS", o.sa_iterations);
  o.sa_t0                    = j.value("SA_T0", o.sa_t0);
  o.sa_alpha                 = j.value("SA_ALPHA", o.sa_alpha);
  o.rng_seed                 = j.value("RNG_SEED", o.rng_seed);
  o.verbose                  = j.value("LOG_PROGRESS", o.verbose);
  o.log_every                = j.value("LOG_EVERY", o.log_every);
  return o;
}

OptimizationMode parse_default_mode(const json& j) {
  return mode_from_string(j.value("OPTIMIZATION_MODE", std::string("ratio")));
}

// ---------- request ----------
Person parse_person(const json& j) {
  Person p;
  p.id = j.at("id").get<std::string>();
  p.name = j.value("name", p.id);
  if (j.contains("team_id") && j["team_id"].is_string()) p.team_id = j["team_id"].get<std::string>();
  p.active = j.value("active", true);
  if (j.contains("daily_availability")) {
    for (const auto& [date, a] : j["daily_availability"].items()) {
      DayOverride ov;
      ov.available = a.value("available", true);
      if (a.contains("status") && a["status"].is_string()) {
        const std::string s = a["status"].get<std::string>();
        // arrival/departure are partial days: the person is on base that day
        if (s != "arrival" && s != "departure") ov.status = status_from_string(s);
      }
      ov.source = source_from_string(a.value("source", std::string("manual")));
      p.daily_availability.emplace(date, ov);
    }
  }
  return p;
}

TaskTemplate parse_task(const json& j) {
  TaskTemplate t;
  t.id = j.value("id", std::string());
  t.name = j.value("name", t.id);
  t.start_date = j.value("start_date", std::string());
  t.end_date = j.value("end_date", std::string());
  if (j.contains("segments")) {
    for (const auto& s : j["segments"]) {
      TaskSegment seg;
      seg.id = s.value("id", std::string());
      seg.name = s.value("name", seg.id);
      seg.duration_hours = s.at("duration_hours").get<double>();
      seg.min_rest_hours_after = s.value("min_rest_hours_after", 0.0);
      seg.required_people = s.value("required_people", 0);
      seg.frequency = frequency_from_string(s.value("frequency", std::string("daily")));
      seg.is_repeat = s.value("is_repeat", false);
      t.segments.push_back(std::move(seg));
    }
  }
  return t;
}

RosterRequest parse_request(const json& j, OptimizationMode fallback_mode) {
  if (!j.is_object()) throw ConfigError("Request must be a JSON object.");
  RosterRequest r;
  r.start_date = j.at("start_date").get<std::string>();
  r.end_date = j.at("end_date").get<std::string>();
  r.mode = j.contains("mode") ? mode_from_string(j["mode"].get<std::string>()) : fallback_mode;

  for (const auto& p : j.value("people", json::array())) r.people.push_back(parse_person(p));

  for (const auto& t : j.value("team_rotations", json::array())) {
    TeamRotation tr;
    tr.team_id = t.at("team_id").get<std::string>();
    tr.days_on_base = t.at("days_on_base").get<int>();
    tr.days_at_home = t.at("days_at_home").get<int>();
    r.team_rotations.push_back(tr);
  }

  for (const auto& c : j.value("constraints", json::array())) {
    SchedulingConstraint sc;
    sc.person_id = c.at("person_id").get<std::string>();
    sc.start = c.at("start").get<std::string>();
    sc.end = c.at("end").get<std::string>();
    sc.kind = kind_from_string(c.value("kind", std::string("never_assign")));
    r.constraints.push_back(sc);
  }

  for (const auto& a : j.value("absences", json::array())) {
    Absence ab;
    ab.person_id = a.at("person_id").get<std::string>();
    ab.start_date = a.at("start_date").get<std::string>();
    ab.end_date = a.at("end_date").get<std::string>();
    ab.status = absence_status_from_string(a.value("status", std::string("approved")));
    r.absences.push_back(ab);
  }

  for (const auto& b : j.value("hourly_blockages", json::array())) {
    HourlyBlockage hb;
    hb.person_id = b.at("person_id").get<std::string>();
    hb.date = b.at("date").get<std::string>();
    hb.start_time = b.value("start_time", hb.start_time);
    hb.end_time = b.value("end_time", hb.end_time);
    r.hourly_blockages.push_back(hb);
  }

  if (j.contains("custom_min_staff") && !j["custom_min_staff"].is_null())
    r.custom_min_staff = j["custom_min_staff"].get<int>();

  if (j.contains("custom_rotation") && !j["custom_rotation"].is_null()) {
    const auto& cr = j["custom_rotation"];
    r.custom_rotation = RotationConfig{cr.at("days_base").get<int>(), cr.at("days_home").get<int>()};
  }

  if (j.contains("history")) {
    for (const auto& [pid, h] : j["history"].items()) {
      PersonHistory ph;
      ph.last_status = status_from_string(h.at("last_status").get<std::string>());
      if (ph.last_status == DayStatus::Unavailable) ph.last_status = DayStatus::Home;
      ph.consecutive_days = h.at("consecutive_days").get<int>();
      r.history.emplace(pid, ph);
    }
  }

  for (const auto& t : j.value("tasks", json::array())) r.tasks.push_back(parse_task(t));
  return r;
}

// ---------- result ----------
json result_to_json(const RosterResult& r) {
  json out;
  out["mode"] = to_string(r.mode);
  out["min_staff"] = r.min_staff;

  json roster = json::array();
  auto& arr = roster.get_ref<json::array_t&>();
  arr.reserve(r.roster.size());
  for (const auto& e : r.roster) {
    arr.push_back({{"date", e.date},
                   {"person_id", e.person_id},
                   {"status", to_string(e.status)},
                   {"source", to_string(e.source)}});
  }
  out["roster"] = std::move(roster);

  json statuses = json::object();
  for (const auto& [date, people] : r.person_statuses) {
    json day = json::object();
    for (const auto& [pid, s] : people) day[pid] = to_string(s);
    statuses[date] = std::move(day);
  }
  out["person_statuses"] = std::move(statuses);

  out["stats"] = {
    {"total_days", r.stats.total_days},
    {"avg_staff_per_day", r.stats.avg_staff_per_day},
    {"constraint_stats", {{"total", r.stats.constraint_stats.total},
                          {"met", r.stats.constraint_stats.met},
                          {"percentage", r.stats.constraint_stats.percentage}}}
  };

  out["warnings"] = r.warnings;

  json unfulfilled = json::array();
  for (const auto& u : r.unfulfilled_constraints) {
    unfulfilled.push_back({{"person_id", u.person_id},
                           {"person_name", u.person_name},
                           {"date", u.date},
                           {"type", "constraint"},
                           {"reason", u.reason}});
  }
  out["unfulfilled_constraints"] = std::move(unfulfilled);
  return out;
}

} // namespace rota
