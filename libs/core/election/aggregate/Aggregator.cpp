#include "Aggregator.hpp"
#include "Log.hpp"
#include "election/cache/CacheKeys.hpp"
#include "election/extract/EntityExtractor.hpp"
#include <algorithm>
#include <mutex>

Aggregator::Aggregator(RequestCache& cache, PresenceUrls urls)
    : m_cache(cache)
    , m_urls(std::move(urls))
{}

CachedValue Aggregator::regionValue(const std::string& region, const std::string& url) {
    return m_cache.getOrCompute(CacheKeys::region(region, url), [&]() -> std::optional<std::int64_t> {
        auto raw = m_cache.fetchRaw(url);
        if (!raw) return std::nullopt;
        return EntityExtractor::regionTotal(*raw, region, url);
    });
}

CachedValue Aggregator::globalValue(const std::string& url, CachePolicy policy) {
    return m_cache.getOrCompute(CacheKeys::total(url), [&]() -> std::optional<std::int64_t> {
        auto raw = policy == CachePolicy::Bypass ? m_cache.fetchFresh(url) : m_cache.fetchRaw(url);
        if (!raw) return std::nullopt;
        return EntityExtractor::globalTotal(*raw, url);
    }, policy);
}

CachedValue Aggregator::abroadValue(const std::string& url) {
    return m_cache.getOrCompute(CacheKeys::abroad(url), [&]() -> std::optional<std::int64_t> {
        auto raw = m_cache.fetchRaw(url);
        if (!raw) return std::nullopt;
        return EntityExtractor::abroadTotal(*raw, url);
    });
}

CachedValue Aggregator::domesticValue(const std::string& totalUrl, const std::string& abroadUrl) {
    return m_cache.getOrCompute(CacheKeys::domestic(totalUrl, abroadUrl), [&]() -> std::optional<std::int64_t> {
        // Both halves must be good; one stale or missing half would make the difference meaningless.
        const auto global = globalValue(totalUrl);
        if (global.failed) return std::nullopt;
        const auto abroad = abroadValue(abroadUrl);
        if (abroad.failed) return std::nullopt;
        return EntityExtractor::domesticTotal(global.value, abroad.value);
    });
}

CachedValue Aggregator::valueAt(const EntityId& entity, Round round, ObservationTimestamp ts) {
    CachedValue out;
    std::string url;
    switch (entity.kind()) {
        case EntityKind::Region:
            url = m_urls.hourly(round, PresenceVariant::Abroad, ts);
            out = regionValue(entity.name(), url);
            break;
        case EntityKind::GlobalTotal:
            url = m_urls.hourly(round, PresenceVariant::National, ts);
            out = globalValue(url);
            break;
        case EntityKind::Domestic: {
            url = m_urls.hourly(round, PresenceVariant::National, ts);
            out = domesticValue(url, m_urls.hourly(round, PresenceVariant::Abroad, ts));
            break;
        }
    }
    if (out.failed) {
        LOG_E("aggregate", "{} round {} at ({:02d} {:02d}:00) degraded to 0 [{}]",
              entity.label(), round == Round::First ? 1 : 2, ts.day, ts.hour, url);
    }
    return out;
}

SeriesPair Aggregator::runEntity(const TimeIndexSeq& index, const EntityId& entity) {
    SeriesPair series;
    const auto n = index.size();
    series.current.reserve(n);
    series.prior.reserve(n);
    series.difference.reserve(n);
    series.runningIncrease.reserve(n);

    std::size_t hits = 0;
    std::int64_t previous = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const auto today = valueAt(entity, Round::Second, index[i]);
        const auto before = valueAt(entity, Round::First, index[i]);
        hits += static_cast<std::size_t>(today.wasCached) + static_cast<std::size_t>(before.wasCached);

        // First sample has no same-day predecessor, so its increase is its own magnitude.
        const std::int64_t increase = i > 0 ? today.value - previous : today.value;
        previous = today.value;

        series.current.push_back(today.value);
        series.prior.push_back(before.value);
        series.difference.push_back(today.value - before.value);
        series.runningIncrease.push_back(increase);
    }

    if (n > 0) {
        publish(entity, EntitySnapshot{series.prior.back(), series.current.back(), series.runningIncrease.back()});
    }
    LOG_D("aggregate", "{}: {} points, {} of {} cells from durable cache", entity.label(), n, hits, 2 * n);
    return series;
}

std::map<EntityId, SeriesPair> Aggregator::run(const TimeIndexSeq& index, const std::vector<EntityId>& entities) {
    std::map<EntityId, SeriesPair> out;
    for (const auto& entity : entities) {
        out[entity] = runEntity(index, entity);
    }
    return out;
}

CachedValue Aggregator::liveValue() {
    const auto url = m_urls.live(Round::Second, PresenceVariant::National);
    auto live = globalValue(url, CachePolicy::Bypass);
    if (live.failed) {
        LOG_E("aggregate", "live total unavailable from {}", url);
    }
    return live;
}

std::int64_t Aggregator::liveTotal() {
    return liveValue().value;
}

HourProgress Aggregator::votesSinceHourStart() {
    HourProgress out;
    if (auto total = snapshot(EntityId::globalTotal())) {
        out.baseline = total->round2Votes;
    }

    const auto live = liveValue();
    if (!live.failed && live.value > 0) {
        out.currentTotal = live.value;
        out.live = true;
    } else {
        out.currentTotal = out.baseline;
    }
    if (out.baseline > 0) {
        out.sinceHourStart = std::max<std::int64_t>(0, out.currentTotal - out.baseline);
    }
    return out;
}

void Aggregator::publish(const EntityId& entity, const EntitySnapshot& snap) {
    std::unique_lock<std::shared_mutex> lock(m_mxSnapshots);
    m_snapshots[entity] = snap;
}

void Aggregator::ensureSnapshot(const EntityId& entity) {
    std::unique_lock<std::shared_mutex> lock(m_mxSnapshots);
    m_snapshots.try_emplace(entity);
}

std::optional<EntitySnapshot> Aggregator::snapshot(const EntityId& entity) const {
    std::shared_lock<std::shared_mutex> lock(m_mxSnapshots);
    auto it = m_snapshots.find(entity);
    if (it == m_snapshots.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<EntityId, EntitySnapshot> Aggregator::snapshots() const {
    std::shared_lock<std::shared_mutex> lock(m_mxSnapshots);
    return m_snapshots;
}
