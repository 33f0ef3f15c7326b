/*
Turnout – AggregationCycle
Role: One complete update: clear request scope, build the TimeIndex, aggregate every entity, derive
      statistics, persist the durable cache.
Inputs/Outputs: Local wall time in; CycleReport out (plain data for the presentation layer).
Threading: run() may be called from a timer thread and a manual "update now" path concurrently; an
           in-progress flag lets exactly one through and makes the other return std::nullopt.
Integration: Owned by the host (turnout_monitor / UpdateController).
*/
#pragma once
#include <atomic>
#include <map>
#include <optional>
#include <vector>
#include "Aggregator.hpp"
#include "EntityCatalog.hpp"
#include "election/config/MonitorConfig.hpp"
#include "election/time/WallClock.hpp"

struct CycleReport {
    TimeIndexSeq                          index;
    std::vector<EntityId>                 entities;   // processing order
    std::map<EntityId, SeriesPair>        series;     // statistics already applied
    std::map<EntityId, EntitySnapshot>    snapshots;

    [[nodiscard]] bool hadData() const noexcept { return !index.empty(); }
};

class AggregationCycle {
public:
    AggregationCycle(Aggregator& aggregator, EntityCatalog& catalog, RequestCache& cache,
                     const MonitorConfig& cfg);

    // std::nullopt if another cycle is already running. An empty TimeIndex yields a report with
    // hadData() == false and does not touch the cache file.
    std::optional<CycleReport> run(LocalSeconds now);

    [[nodiscard]] bool inProgress() const noexcept { return m_inProgress.load(); }

    AggregationCycle(const AggregationCycle&) = delete;
    AggregationCycle& operator=(const AggregationCycle&) = delete;

private:
    CycleReport execute(LocalSeconds now);

    Aggregator&          m_aggregator;
    EntityCatalog&       m_catalog;
    RequestCache&        m_cache;
    ObservationTimestamp m_start;
    ObservationTimestamp m_end;
    std::atomic<bool>    m_inProgress{false};
};
