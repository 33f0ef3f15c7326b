#include "AggregationCycle.hpp"
#include "Log.hpp"
#include "election/stats/StatisticsEngine.hpp"
#include "election/time/TimeIndex.hpp"
#include <chrono>

namespace {

// Clears the in-progress flag on every exit path.
class InProgressGuard {
public:
    explicit InProgressGuard(std::atomic<bool>& flag) : m_flag(flag) {}
    ~InProgressGuard() { m_flag.store(false); }
    InProgressGuard(const InProgressGuard&) = delete;
    InProgressGuard& operator=(const InProgressGuard&) = delete;
private:
    std::atomic<bool>& m_flag;
};

} // namespace

AggregationCycle::AggregationCycle(Aggregator& aggregator, EntityCatalog& catalog, RequestCache& cache,
                                   const MonitorConfig& cfg)
    : m_aggregator(aggregator)
    , m_catalog(catalog)
    , m_cache(cache)
    , m_start(cfg.windowStart)
    , m_end(cfg.windowEnd)
{}

std::optional<CycleReport> AggregationCycle::run(LocalSeconds now) {
    bool expected = false;
    if (!m_inProgress.compare_exchange_strong(expected, true)) {
        LOG_W("aggregate", "update already in progress, skipping");
        return std::nullopt;
    }
    InProgressGuard guard(m_inProgress);
    return execute(now);
}

CycleReport AggregationCycle::execute(LocalSeconds now) {
    CycleReport report;
    m_cache.beginCycle();

    report.index = TimeIndex::generate(toWallTime(now), m_start, m_end);
    if (report.index.empty()) {
        LOG_I("aggregate", "no observation timestamps available yet, skipping cycle");
        report.snapshots = m_aggregator.snapshots();
        return report;
    }

    const auto started = std::chrono::steady_clock::now();
    const auto fetchesBefore = m_cache.networkFetches();

    report.entities = m_catalog.entities(m_aggregator.snapshots());
    for (const auto& entity : report.entities) {
        m_aggregator.ensureSnapshot(entity);
    }
    report.series = m_aggregator.run(report.index, report.entities);
    for (auto& [entity, series] : report.series) {
        StatisticsEngine::apply(series);
    }
    report.snapshots = m_aggregator.snapshots();

    m_cache.durable().save();

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    const auto& last = report.index.back();
    LOG_I("aggregate", "cycle done: {} entities x {} hours up to ({:02d} {:02d}:00), {} network fetches, {} ms",
          report.entities.size(), report.index.size(), last.day, last.hour,
          m_cache.networkFetches() - fetchesBefore, elapsed.count());
    return report;
}
