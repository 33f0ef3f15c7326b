/*
Turnout – RequestCache
Role: Two-tier front for the SnapshotSource.
      Tier 1 (request scope): url -> raw snapshot, cleared at the start of every aggregation cycle so
      several entities reading the same file within one cycle trigger a single fetch.
      Tier 2 (durable): key -> integer, persisted across runs by DurableCache.
Threading: Used by one aggregation cycle at a time; the request-scope map is guarded for safety.
Observability: Fetch failures are logged with the URL and swallowed into an empty optional.
Related: DurableCache.hpp, SnapshotSource.hpp, Aggregator.hpp.
*/
#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "DurableCache.hpp"
#include "election/model/ElectionTypes.hpp"
#include "election/source/SnapshotSource.hpp"

enum class CachePolicy {
    UseDurable, // read and write the durable tier
    Bypass      // "live" reads: neither read nor write the durable tier
};

class RequestCache {
public:
    // Returns the derived integer, or nullopt when the inputs could not be fetched or understood.
    using ComputeFn = std::function<std::optional<std::int64_t>()>;

    RequestCache(SnapshotSource& source, DurableCache& durable);

    // Start of an aggregation cycle: forget every raw snapshot held in request scope.
    void beginCycle();

    // Request-scope lookup, falling back to the source. Never touches the durable tier.
    // Failures are logged and not memoized, so a later call in the same cycle retries.
    [[nodiscard]] std::optional<nlohmann::json> fetchRaw(const std::string& url);

    // Uncached fetch that skips the request scope too; used for live/now reads.
    [[nodiscard]] std::optional<nlohmann::json> fetchFresh(const std::string& url);

    // Durable value for `key` if present; otherwise runs `compute` and stores a successful result.
    // A failed compute returns {false, 0} and is not stored.
    CachedValue getOrCompute(const std::string& key, const ComputeFn& compute,
                             CachePolicy policy = CachePolicy::UseDurable);

    [[nodiscard]] DurableCache& durable() noexcept { return m_durable; }
    [[nodiscard]] std::size_t scopeSize() const;
    [[nodiscard]] std::uint64_t networkFetches() const noexcept { return m_networkFetches.load(); }

    // Non-copyable, non-movable (holds references)
    RequestCache(const RequestCache&) = delete;
    RequestCache& operator=(const RequestCache&) = delete;

private:
    std::optional<nlohmann::json> fetchFromSource(const std::string& url);

    SnapshotSource&                                 m_source;
    DurableCache&                                   m_durable;
    mutable std::mutex                              m_scopeMx;
    std::unordered_map<std::string, nlohmann::json> m_scope;
    std::atomic<std::uint64_t>                      m_networkFetches{0};
};
