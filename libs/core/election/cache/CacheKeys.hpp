#pragma once
// ─────────────────────────────────────────────────────────────
// CacheKeys – durable keys, derived from (purpose, entity, url).
// ─────────────────────────────────────────────────────────────
#include <string>

namespace CacheKeys {

inline std::string region(const std::string& name, const std::string& url) { return name + "_" + url; }
inline std::string total(const std::string& url) { return "total_" + url; }
inline std::string abroad(const std::string& url) { return "abroad_" + url; }
inline std::string domestic(const std::string& totalUrl, const std::string& abroadUrl) {
    return "domestic_" + totalUrl + "_" + abroadUrl;
}

} // namespace CacheKeys
