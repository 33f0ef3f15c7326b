#pragma once
// ─────────────────────────────────────────────────────────────
// WallClock – naive local wall-clock time.
// The source publishes files named after local (day, hour), so every
// time computation in the core works on local wall time expressed as
// a time zone free seconds count.
// ─────────────────────────────────────────────────────────────
#include <chrono>
#include <ctime>

using LocalSeconds = std::chrono::sys_seconds; // local wall time, no zone attached

struct WallTime {
    int year{0};
    int month{0};
    int day{0};
    int hour{0};
    int minute{0};
    int second{0};
};

inline WallTime toWallTime(LocalSeconds t) {
    using namespace std::chrono;
    const auto dayStart = floor<days>(t);
    const year_month_day ymd{dayStart};
    const hh_mm_ss hms{t - dayStart};
    return WallTime{int(ymd.year()), int(unsigned(ymd.month())), int(unsigned(ymd.day())),
                    int(hms.hours().count()), int(hms.minutes().count()), int(hms.seconds().count())};
}

inline LocalSeconds fromWallTime(const WallTime& w) {
    using namespace std::chrono;
    const sys_days d = year{w.year} / month{unsigned(w.month)} / day{unsigned(w.day)};
    return d + hours{w.hour} + minutes{w.minute} + seconds{w.second};
}

// Current instant as local wall time.
inline LocalSeconds localNow() {
    using namespace std::chrono;
    const std::time_t tt = system_clock::to_time_t(system_clock::now());
    std::tm tm{};
    localtime_r(&tt, &tm);
    return fromWallTime(WallTime{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                                 tm.tm_hour, tm.tm_min, tm.tm_sec});
}
