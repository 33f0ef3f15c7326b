#include "TimeIndex.hpp"
#include "Log.hpp"

namespace TimeIndex {

ObservationTimestamp next(ObservationTimestamp ts) noexcept {
    if (ts.hour == 23) {
        return ObservationTimestamp{ts.day + 1, 0};
    }
    return ObservationTimestamp{ts.day, ts.hour + 1};
}

TimeIndexSeq generate(const WallTime& now, ObservationTimestamp start, ObservationTimestamp end) {
    TimeIndexSeq out;
    if (now.minute == 0) {
        LOG_D("sched", "refusing to sample at {:02d}:00, source bucket not final yet", now.hour);
        return out;
    }

    const ObservationTimestamp current{now.day, now.hour};
    for (auto ts = start; ts < end && ts <= current; ts = next(ts)) {
        out.push_back(ts);
    }
    return out;
}

} // namespace TimeIndex
