#include "DurableCache.hpp"
#include "Log.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <map>
#include <mutex>
#include <stdexcept>

void DurableCache::load() {
    std::unordered_map<std::string, std::int64_t> values;
    std::optional<std::vector<std::string>> regions;

    std::ifstream in(m_path);
    if (!in.is_open()) {
        LOG_W("cache", "cache file '{}' missing, starting with an empty cache", m_path);
    } else {
        try {
            nlohmann::json j;
            in >> j;
            if (!j.is_object()) {
                throw std::runtime_error("top-level value is not an object");
            }
            std::size_t skipped = 0;
            for (auto it = j.begin(); it != j.end(); ++it) {
                if (it.key() == kRegionListKey && it.value().is_array()) {
                    regions = it.value().get<std::vector<std::string>>();
                } else if (it.value().is_number_integer()) {
                    values.emplace(it.key(), it.value().get<std::int64_t>());
                } else {
                    ++skipped;
                }
            }
            if (skipped > 0) {
                LOG_W("cache", "skipped {} non-integer entries in '{}'", skipped, m_path);
            }
        }
        catch (const std::exception& ex) {
            LOG_W("cache", "cache file '{}' invalid ({}), recreating", m_path, ex.what());
            values.clear();
            regions.reset();
        }
    }

    std::unique_lock<std::shared_mutex> lock(m_mx);
    m_values = std::move(values);
    m_regionList = std::move(regions);
    LOG_I("cache", "loaded {} cached values from '{}'", m_values.size(), m_path);
}

bool DurableCache::save() const {
    nlohmann::json j = nlohmann::json::object();
    {
        std::shared_lock<std::shared_mutex> lock(m_mx);
        // Sorted for stable, diff-friendly output.
        const std::map<std::string, std::int64_t> sorted(m_values.begin(), m_values.end());
        for (const auto& [key, value] : sorted) {
            j[key] = value;
        }
        if (m_regionList) {
            j[kRegionListKey] = *m_regionList;
        }
    }

    std::ofstream out(m_path, std::ios::trunc);
    if (!out.is_open()) {
        LOG_E("cache", "cannot open '{}' for writing", m_path);
        return false;
    }
    out << j.dump(4);
    if (!out) {
        LOG_E("cache", "write to '{}' failed", m_path);
        return false;
    }
    LOG_D("cache", "saved {} values to '{}'", j.size(), m_path);
    return true;
}

std::optional<std::int64_t> DurableCache::get(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_mx);
    auto it = m_values.find(key);
    if (it == m_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

void DurableCache::put(const std::string& key, std::int64_t value) {
    std::unique_lock<std::shared_mutex> lock(m_mx);
    m_values[key] = value;
}

bool DurableCache::erase(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_mx);
    return m_values.erase(key) > 0;
}

bool DurableCache::contains(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_mx);
    return m_values.count(key) > 0;
}

std::size_t DurableCache::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mx);
    return m_values.size();
}

void DurableCache::clear() {
    std::unique_lock<std::shared_mutex> lock(m_mx);
    m_values.clear();
    m_regionList.reset();
}

std::optional<std::vector<std::string>> DurableCache::regionList() const {
    std::shared_lock<std::shared_mutex> lock(m_mx);
    return m_regionList;
}

void DurableCache::setRegionList(std::vector<std::string> regions) {
    std::unique_lock<std::shared_mutex> lock(m_mx);
    m_regionList = std::move(regions);
}

void DurableCache::eraseRegionList() {
    std::unique_lock<std::shared_mutex> lock(m_mx);
    m_regionList.reset();
}
