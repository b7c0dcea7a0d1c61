// utils.h
#pragma once
#include <chrono>
#include <cstdio>
#include <string>
#include "types.h"

namespace rota {

// Returns current time in milliseconds since epoch
static inline long long NowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
               steady_clock::now().time_since_epoch()
           ).count();
}

// ---------- small date helpers ----------
// Dates are whole calendar days. A "serial" is the day count since 1970-01-01,
// computed arithmetically so the result never depends on TZ or locale.

static inline int days_from_civil(int y, int m, int d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const int yoe = y - era * 400;
    const int doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

static inline void civil_from_days(int z, int& y, int& m, int& d) {
    z += 719468;
    const int era = (z >= 0 ? z : z - 146096) / 146097;
    const int doe = z - era * 146097;
    const int yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = yoe + era * 400 + (m <= 2);
}

// "YYYY-MM-DD" (anything after the 10th char, e.g. "T08:00:00", is ignored)
static inline int parse_ymd(const std::string& ymd) {
    auto digit = [&](size_t i) { return ymd[i] >= '0' && ymd[i] <= '9'; };
    if (ymd.size() < 10 || ymd[4] != '-' || ymd[7] != '-')
        throw ConfigError("Bad date: " + ymd);
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9})
        if (!digit(i)) throw ConfigError("Bad date: " + ymd);
    const int y = (ymd[0] - '0') * 1000 + (ymd[1] - '0') * 100 + (ymd[2] - '0') * 10 + (ymd[3] - '0');
    const int m = (ymd[5] - '0') * 10 + (ymd[6] - '0');
    const int d = (ymd[8] - '0') * 10 + (ymd[9] - '0');
    if (m < 1 || m > 12 || d < 1 || d > 31)
        throw ConfigError("Bad date: " + ymd);
    const int serial = days_from_civil(y, m, d);
    int yy = 0, mm = 0, dd = 0;
    civil_from_days(serial, yy, mm, dd);
    if (mm != m || dd != d) throw ConfigError("Bad date: " + ymd); // e.g. 2026-02-30
    return serial;
}

static inline std::string ymd_from_serial(int serial) {
    int y = 0, m = 0, d = 0;
    civil_from_days(serial, y, m, d);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", y, m, d);
    return buf;
}

static inline std::string ymd_add_days(const std::string& ymd, int d) {
    return ymd_from_serial(parse_ymd(ymd) + d);
}

// b - a in days
static inline int ymd_days_between(const std::string& a, const std::string& b) {
    return parse_ymd(b) - parse_ymd(a);
}

// 0=Sun..6=Sat (1970-01-01 was a Thursday)
static inline int weekday_from_serial(int serial) {
    const int w = (serial + 4) % 7;
    return w < 0 ? w + 7 : w;
}

} // namespace rota
