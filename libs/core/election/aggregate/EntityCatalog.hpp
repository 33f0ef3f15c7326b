/*
Turnout – EntityCatalog
Role: Knows which named regions to track and how to show them.
Inputs/Outputs: Discovers region names from the live abroad snapshot, persists the list in the durable
                cache, and falls back to the configured default list when discovery is impossible.
Threading: Called from the updater role only.
Observability: Logs which source (cache, live discovery, defaults) produced the list.
*/
#pragma once
#include <map>
#include <string>
#include <vector>
#include "election/cache/RequestCache.hpp"
#include "election/config/MonitorConfig.hpp"
#include "election/model/ElectionTypes.hpp"
#include "election/source/PresenceUrls.hpp"

class EntityCatalog {
public:
    EntityCatalog(RequestCache& cache, const MonitorConfig& cfg);

    // Cached list if present; otherwise discover(); otherwise the configured defaults.
    [[nodiscard]] std::vector<std::string> regions();

    // Distinct region names from the live abroad snapshot, most votes first, home country excluded.
    // Stores a non-empty result in the durable cache and saves it. Empty on failure.
    std::vector<std::string> discover();

    // Drops the cached list and runs regions() again.
    std::vector<std::string> refresh();

    // Stable sort by latest round-2 votes, descending. Unknown regions keep their relative order.
    [[nodiscard]] static std::vector<std::string> orderByLatest(std::vector<std::string> regions,
                                                                const std::map<EntityId, EntitySnapshot>& snapshots);

    // Short alias for long official names; the name itself otherwise.
    [[nodiscard]] std::string displayName(const std::string& region) const;

    // Regions ordered by `latest` (see orderByLatest), then the domestic aggregate, then the global total.
    [[nodiscard]] std::vector<EntityId> entities(const std::map<EntityId, EntitySnapshot>& latest = {});

private:
    RequestCache&                      m_cache;
    PresenceUrls                       m_urls;
    std::string                        m_homeCountry;
    std::vector<std::string>           m_defaults;
    std::map<std::string, std::string> m_displayNames;
};
