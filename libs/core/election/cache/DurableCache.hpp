/*
Turnout – DurableCache
Role: Cross-run key -> integer store persisted as one flat JSON object.
Inputs/Outputs: load() reads the whole file, save() overwrites it. Keys are opaque strings built by
                the aggregation layer; values are vote totals.
Threading: Thread-safe. std::shared_mutex for concurrent reads and exclusive writes, like DataCache.
Observability: A missing or corrupt file is logged as a warning and yields an empty cache.
Assumptions: Once written, a key is treated as immutable truth until explicitly erased.
*/
#pragma once
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

class DurableCache {
public:
    // Reserved key holding the discovered region list.
    static constexpr const char* kRegionListKey = "COUNTRY_LIST";

    DurableCache() = default;
    explicit DurableCache(std::string path) : m_path(std::move(path)) {}

    // Replaces the in-memory content with the file's. Never throws for a missing or corrupt file.
    void load();
    // Full overwrite. Returns false (and logs) if the file cannot be written.
    bool save() const;

    [[nodiscard]] std::optional<std::int64_t> get(const std::string& key) const;
    void put(const std::string& key, std::int64_t value);
    bool erase(const std::string& key);
    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::size_t size() const;
    void clear();

    [[nodiscard]] std::optional<std::vector<std::string>> regionList() const;
    void setRegionList(std::vector<std::string> regions);
    void eraseRegionList();

    [[nodiscard]] const std::string& path() const noexcept { return m_path; }

private:
    std::string                                   m_path;
    mutable std::shared_mutex                     m_mx;
    std::unordered_map<std::string, std::int64_t> m_values;
    std::optional<std::vector<std::string>>       m_regionList;
};
