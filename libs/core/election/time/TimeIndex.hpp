/*
Turnout – TimeIndex
Role: Produces the ordered (day, hour) observation timestamps from the configured window start up to
      min(window end, current hour), and maps each one to its prior-round counterpart.
Inputs/Outputs: Pure function of (now, start, end); no network or cache access.
Assumptions: The window lies within one calendar month; rolling past hour 23 advances the day.
*/
#pragma once
#include "election/model/ElectionTypes.hpp"
#include "WallClock.hpp"

namespace TimeIndex {

// Empty when now.minute == 0: at the top of the hour the source is still assembling the file for
// the hour that just ended, so the whole cycle is refused rather than reading a half-written bucket.
// Callers treat an empty result as "no data this cycle", not as a failure.
[[nodiscard]] TimeIndexSeq generate(const WallTime& now,
                                    ObservationTimestamp start,
                                    ObservationTimestamp end);

[[nodiscard]] ObservationTimestamp next(ObservationTimestamp ts) noexcept;

// Same hour, `dayOffset` days earlier.
[[nodiscard]] constexpr ObservationTimestamp priorRound(ObservationTimestamp ts, int dayOffset) noexcept {
    return ObservationTimestamp{ts.day - dayOffset, ts.hour};
}

} // namespace TimeIndex
