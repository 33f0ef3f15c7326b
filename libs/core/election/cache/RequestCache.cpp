#include "RequestCache.hpp"
#include "Log.hpp"

RequestCache::RequestCache(SnapshotSource& source, DurableCache& durable)
    : m_source(source)
    , m_durable(durable)
{}

void RequestCache::beginCycle() {
    std::lock_guard<std::mutex> lock(m_scopeMx);
    m_scope.clear();
}

std::size_t RequestCache::scopeSize() const {
    std::lock_guard<std::mutex> lock(m_scopeMx);
    return m_scope.size();
}

std::optional<nlohmann::json> RequestCache::fetchFromSource(const std::string& url) {
    ++m_networkFetches;
    try {
        return m_source.fetch(url);
    }
    catch (const FetchError& ex) {
        LOG_E("http", "error fetching URL {}: {}", ex.url(), ex.what());
    }
    catch (const std::exception& ex) {
        LOG_E("http", "error fetching URL {}: {}", url, ex.what());
    }
    return std::nullopt;
}

std::optional<nlohmann::json> RequestCache::fetchRaw(const std::string& url) {
    {
        std::lock_guard<std::mutex> lock(m_scopeMx);
        auto it = m_scope.find(url);
        if (it != m_scope.end()) {
            return it->second;
        }
    }

    auto data = fetchFromSource(url);
    if (data) {
        std::lock_guard<std::mutex> lock(m_scopeMx);
        m_scope.emplace(url, *data);
    }
    return data;
}

std::optional<nlohmann::json> RequestCache::fetchFresh(const std::string& url) {
    return fetchFromSource(url);
}

CachedValue RequestCache::getOrCompute(const std::string& key, const ComputeFn& compute, CachePolicy policy) {
    if (policy == CachePolicy::UseDurable) {
        if (auto hit = m_durable.get(key)) {
            LOG_T("cache", "hit {}", key);
            return CachedValue{true, *hit};
        }
    }

    const auto value = compute();
    if (!value) {
        return CachedValue{false, 0, true};
    }
    if (policy == CachePolicy::UseDurable) {
        m_durable.put(key, *value);
    }
    return CachedValue{false, *value};
}
