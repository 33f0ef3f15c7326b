#include "EntityCatalog.hpp"
#include "Log.hpp"
#include "election/extract/EntityExtractor.hpp"
#include <algorithm>

EntityCatalog::EntityCatalog(RequestCache& cache, const MonitorConfig& cfg)
    : m_cache(cache)
    , m_urls(cfg)
    , m_homeCountry(cfg.homeCountry)
    , m_defaults(cfg.defaultRegions)
    , m_displayNames(cfg.displayNames)
{}

std::vector<std::string> EntityCatalog::discover() {
    const auto url = m_urls.live(Round::Second, PresenceVariant::Abroad);
    LOG_I("catalog", "fetching region list from {}", url);

    auto raw = m_cache.fetchFresh(url);
    if (!raw) {
        return {};
    }

    auto votes = EntityExtractor::regionVotes(*raw, url);
    votes.erase(std::remove_if(votes.begin(), votes.end(),
                               [this](const auto& entry) { return entry.first == m_homeCountry; }),
                votes.end());
    std::stable_sort(votes.begin(), votes.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<std::string> names;
    names.reserve(votes.size());
    for (auto& [name, count] : votes) {
        names.push_back(std::move(name));
    }

    if (!names.empty()) {
        auto& durable = m_cache.durable();
        durable.setRegionList(names);
        durable.save();
        LOG_I("catalog", "discovered {} regions", names.size());
    }
    return names;
}

std::vector<std::string> EntityCatalog::regions() {
    if (auto cached = m_cache.durable().regionList(); cached && !cached->empty()) {
        LOG_D("catalog", "using cached region list ({} entries)", cached->size());
        return *cached;
    }
    auto found = discover();
    if (!found.empty()) {
        return found;
    }
    LOG_W("catalog", "using default region list as fallback");
    return m_defaults;
}

std::vector<std::string> EntityCatalog::refresh() {
    m_cache.durable().eraseRegionList();
    auto list = regions();
    m_cache.durable().save();
    return list;
}

std::vector<std::string> EntityCatalog::orderByLatest(std::vector<std::string> regions,
                                                      const std::map<EntityId, EntitySnapshot>& snapshots) {
    auto latest = [&snapshots](const std::string& name) -> std::int64_t {
        auto it = snapshots.find(EntityId::region(name));
        return it == snapshots.end() ? 0 : it->second.round2Votes;
    };
    std::stable_sort(regions.begin(), regions.end(),
                     [&latest](const std::string& a, const std::string& b) { return latest(a) > latest(b); });
    return regions;
}

std::string EntityCatalog::displayName(const std::string& region) const {
    auto it = m_displayNames.find(region);
    return it == m_displayNames.end() ? region : it->second;
}

std::vector<EntityId> EntityCatalog::entities(const std::map<EntityId, EntitySnapshot>& latest) {
    std::vector<EntityId> out;
    for (auto& name : orderByLatest(regions(), latest)) {
        out.push_back(EntityId::region(std::move(name)));
    }
    out.push_back(EntityId::domestic());
    out.push_back(EntityId::globalTotal());
    return out;
}
