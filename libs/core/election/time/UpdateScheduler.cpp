#include "UpdateScheduler.hpp"
#include "Log.hpp"
#include <stdexcept>

using namespace std::chrono;

UpdateScheduler::UpdateScheduler(int minute, int second)
    : m_minute(minute)
    , m_second(second)
{
    if (minute < 0 || minute > 59 || second < 0 || second > 59) {
        throw std::invalid_argument("UpdateScheduler: minute/second must be within 0..59");
    }
}

bool UpdateScheduler::reachedMark(LocalSeconds now) const {
    const auto intoHour = now - floor<hours>(now);
    return intoHour >= minutes{m_minute} + seconds{m_second};
}

NextUpdate UpdateScheduler::nextUpdate(LocalSeconds now) const {
    const auto hourStart = floor<hours>(now);
    LocalSeconds at = hourStart + minutes{m_minute} + seconds{m_second};
    if (reachedMark(now)) {
        at += hours{1};
    }
    return NextUpdate{at, at - now};
}

bool UpdateScheduler::shouldFire(LocalSeconds now) {
    const auto hour = floor<hours>(now);
    if (m_lastFiredHour && *m_lastFiredHour == hour) {
        return false;
    }
    if (!reachedMark(now)) {
        return false;
    }
    m_lastFiredHour = hour;
    const auto w = toWallTime(now);
    LOG_I("sched", "refresh due at {:02d}:{:02d}:{:02d}", w.hour, w.minute, w.second);
    return true;
}
