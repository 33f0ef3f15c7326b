#include "StatisticsEngine.hpp"
#include <utility>

StatisticsEngine::Derived StatisticsEngine::derive(const std::vector<std::int64_t>& current,
                                                   const std::vector<std::int64_t>& prior)
{
    const auto n = current.size();
    Derived out;
    out.deltaPercent.assign(n, 0.0);
    out.hourlyIncrease.assign(n, 0);

    for (std::size_t i = 0; i < n; ++i) {
        const std::int64_t before = i < prior.size() ? prior[i] : 0;
        if (before > 0) {
            out.deltaPercent[i] = static_cast<double>(current[i] - before) / static_cast<double>(before) * 100.0;
        }
        if (i > 0) {
            out.hourlyIncrease[i] = current[i] - current[i - 1];
        }
    }
    return out;
}

void StatisticsEngine::apply(SeriesPair& series)
{
    auto derived = derive(series.current, series.prior);
    series.deltaPercent = std::move(derived.deltaPercent);
    series.hourlyIncrease = std::move(derived.hourlyIncrease);
}
