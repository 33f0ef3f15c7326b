/*
Turnout – Aggregator
Role: Builds the two aligned series (round 2 vs round 1) per entity over a TimeIndex and keeps the
      latest per-entity snapshot.
Inputs/Outputs: TimeIndex + entity list in; SeriesPair per entity out; snapshots updated in place.
Threading: run() is called by a single updater at a time. Snapshots are published under a
           shared_mutex after each entity's loop completes, so readers never see a torn record.
Performance: One blocking fetch per distinct URL per cycle at most; the durable tier removes most
             of the rest across runs.
Observability: Every cell that degrades to zero is logged with entity, round, timestamp and URL.
Related: RequestCache.hpp, EntityExtractor.hpp, PresenceUrls.hpp, StatisticsEngine.hpp.
*/
#pragma once
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "election/cache/RequestCache.hpp"
#include "election/model/ElectionTypes.hpp"
#include "election/source/PresenceUrls.hpp"

class Aggregator {
public:
    Aggregator(RequestCache& cache, PresenceUrls urls);

    // Entities are processed in the order given. An empty index yields empty series and leaves
    // every snapshot untouched.
    std::map<EntityId, SeriesPair> run(const TimeIndexSeq& index, const std::vector<EntityId>& entities);

    // One entity over the whole index; publishes its snapshot when done.
    SeriesPair runEntity(const TimeIndexSeq& index, const EntityId& entity);

    // Value of one (entity, round, timestamp) cell through the durable cache.
    CachedValue valueAt(const EntityId& entity, Round round, ObservationTimestamp ts);

    // Current global total from the live endpoint, bypassing both cache tiers. Zero on failure.
    [[nodiscard]] std::int64_t liveTotal();

    // New votes since the last hourly sample. Falls back to the global total snapshot when the live
    // read fails or returns zero; everything is zero until a cycle has produced that snapshot.
    [[nodiscard]] HourProgress votesSinceHourStart();

    // Make sure an entity appears in snapshots() before its first cycle (all zeros).
    void ensureSnapshot(const EntityId& entity);

    [[nodiscard]] std::optional<EntitySnapshot> snapshot(const EntityId& entity) const;
    [[nodiscard]] std::map<EntityId, EntitySnapshot> snapshots() const;

    [[nodiscard]] const PresenceUrls& urls() const noexcept { return m_urls; }

    // Non-copyable, non-movable (holds references and a mutex)
    Aggregator(const Aggregator&) = delete;
    Aggregator& operator=(const Aggregator&) = delete;

private:
    CachedValue regionValue(const std::string& region, const std::string& url);
    CachedValue globalValue(const std::string& url, CachePolicy policy = CachePolicy::UseDurable);
    CachedValue abroadValue(const std::string& url);
    CachedValue domesticValue(const std::string& totalUrl, const std::string& abroadUrl);

    CachedValue liveValue();

    void publish(const EntityId& entity, const EntitySnapshot& snap);

    RequestCache&                        m_cache;
    PresenceUrls                         m_urls;
    mutable std::shared_mutex            m_mxSnapshots;
    std::map<EntityId, EntitySnapshot>   m_snapshots;
};
