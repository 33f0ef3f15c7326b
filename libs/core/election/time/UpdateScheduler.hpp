/*
Turnout – UpdateScheduler
Role: Aligns automatic refreshes to a fixed (minute, second) of every wall-clock hour.
Inputs/Outputs: Takes local wall time; returns the next refresh instant and whether a refresh is due.
Threading: Not thread-safe; owned and polled by a single timer loop.
Integration: Polled once per second by UpdateController; holds no resources that need teardown.
*/
#pragma once
#include <chrono>
#include <optional>
#include "WallClock.hpp"

struct NextUpdate {
    LocalSeconds         at;
    std::chrono::seconds wait;
};

class UpdateScheduler {
public:
    UpdateScheduler(int minute, int second);

    // The configured (minute, second) in this hour if it is still ahead, otherwise in the next hour.
    [[nodiscard]] NextUpdate nextUpdate(LocalSeconds now) const;

    // True at most once per wall-clock hour: the hour changed since the last fire and the
    // configured (minute, second) has been reached.
    bool shouldFire(LocalSeconds now);

    // Forget the last fire, e.g. after a manual "update now" that failed.
    void reset() noexcept { m_lastFiredHour.reset(); }

    [[nodiscard]] int minute() const noexcept { return m_minute; }
    [[nodiscard]] int second() const noexcept { return m_second; }

private:
    [[nodiscard]] bool reachedMark(LocalSeconds now) const;

    int m_minute;
    int m_second;
    std::optional<std::chrono::sys_time<std::chrono::hours>> m_lastFiredHour;
};
