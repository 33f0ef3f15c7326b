#ifndef TURNOUT_STATISTICSENGINE_H
#define TURNOUT_STATISTICSENGINE_H

#include <cstdint>
#include <vector>
#include "election/model/ElectionTypes.hpp"

/**
 * StatisticsEngine: derives round-over-round and hour-over-hour figures from two aligned series.
 *
 * Pure computation, no I/O. Note that hourlyIncrease here starts at 0, while the Aggregator's
 * running increase starts at the first value itself; the two feed different displays and are
 * kept separate on purpose.
 */
class StatisticsEngine
{
public:
    struct Derived {
        std::vector<double>       deltaPercent;
        std::vector<std::int64_t> hourlyIncrease;
    };

    // deltaPercent[i] = (current[i] - prior[i]) / prior[i] * 100, or 0 when prior[i] <= 0.
    // hourlyIncrease[i] = current[i] - current[i-1], and 0 at i = 0.
    // Both results have current.size() elements; missing prior values are treated as 0.
    static Derived derive(const std::vector<std::int64_t>& current,
                          const std::vector<std::int64_t>& prior);

    // Fills series.deltaPercent and series.hourlyIncrease in place.
    static void apply(SeriesPair& series);
};

#endif // TURNOUT_STATISTICSENGINE_H
