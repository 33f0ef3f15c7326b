#include "EntityExtractor.hpp"
#include "Log.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <unordered_map>

namespace EntityExtractor {
namespace {

const nlohmann::json* arrayField(const nlohmann::json& snapshot, const char* field) {
    if (!snapshot.is_object()) return nullptr;
    auto it = snapshot.find(field);
    if (it == snapshot.end() || !it->is_array()) return nullptr;
    return &*it;
}

// Fractional counts truncate; a value outside the int64 range is a shape error.
std::int64_t toCount(const nlohmann::json& value, const char* field) {
    if (value.is_number_unsigned()) {
        if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw std::runtime_error(std::string("field ") + field + " is out of range");
        }
        return static_cast<std::int64_t>(value.get<std::uint64_t>());
    }
    if (value.is_number_integer()) return value.get<std::int64_t>();
    const double d = value.get<double>();
    // 2^63 is exactly representable; anything at or beyond it does not fit.
    constexpr double kLimit = 9223372036854775808.0;
    if (!std::isfinite(d) || d >= kLimit || d < -kLimit) {
        throw std::runtime_error(std::string("field ") + field + " is out of range");
    }
    return static_cast<std::int64_t>(d);
}

// Records without LT count as zero; a non-numeric LT is a shape error.
std::int64_t votesOf(const nlohmann::json& record) {
    auto it = record.find(kVotesField);
    if (it == record.end() || it->is_null()) return 0;
    if (it->is_number()) return toCount(*it, kVotesField);
    throw std::runtime_error(std::string("field ") + kVotesField + " is not numeric");
}

std::int64_t sumVotes(const nlohmann::json& records) {
    std::int64_t total = 0;
    for (const auto& rec : records) {
        if (!rec.is_object()) {
            throw std::runtime_error("record is not an object");
        }
        total += votesOf(rec);
    }
    return total;
}

std::string regionOf(const nlohmann::json& record) {
    auto uat = record.find("uat");
    if (uat == record.end() || !uat->is_object()) return {};
    auto name = uat->find("name");
    if (name == uat->end() || !name->is_string()) return {};
    return name->get<std::string>();
}

} // namespace

std::optional<std::int64_t> regionTotal(const nlohmann::json& snapshot, const std::string& region, std::string_view source) {
    const auto* precincts = arrayField(snapshot, "precinct");
    if (!precincts) {
        LOG_E("extract", "no precinct array for {} in {}", region, source);
        return std::nullopt;
    }
    try {
        std::int64_t total = 0;
        for (const auto& rec : *precincts) {
            if (rec.is_object() && regionOf(rec) == region) {
                total += votesOf(rec);
            }
        }
        return total;
    }
    catch (const std::exception& ex) {
        LOG_E("extract", "error processing data for {} from {}: {}", region, source, ex.what());
        return std::nullopt;
    }
}

std::optional<std::int64_t> globalTotal(const nlohmann::json& snapshot, std::string_view source) {
    const auto* counties = arrayField(snapshot, "county");
    if (!counties) {
        LOG_E("extract", "no county array in {}", source);
        return std::nullopt;
    }
    try {
        return sumVotes(*counties);
    }
    catch (const std::exception& ex) {
        LOG_E("extract", "error processing total data from {}: {}", source, ex.what());
        return std::nullopt;
    }
}

std::optional<std::int64_t> abroadTotal(const nlohmann::json& snapshot, std::string_view source) {
    try {
        if (const auto* precincts = arrayField(snapshot, "precinct")) {
            return sumVotes(*precincts);
        }
        std::int64_t flat = 0;
        if (snapshot.is_object() && snapshot.contains(kFlatTotalField)) {
            const auto& v = snapshot[kFlatTotalField];
            if (!v.is_number()) {
                throw std::runtime_error(std::string("field ") + kFlatTotalField + " is not numeric");
            }
            flat = toCount(v, kFlatTotalField);
            if (flat != 0) {
                return flat;
            }
        }
        if (const auto* counties = arrayField(snapshot, "county")) {
            return sumVotes(*counties);
        }
        if (snapshot.is_object() && snapshot.contains(kFlatTotalField)) {
            return flat;
        }
    }
    catch (const std::exception& ex) {
        LOG_E("extract", "error processing abroad data from {}: {}", source, ex.what());
        return std::nullopt;
    }
    LOG_E("extract", "abroad snapshot {} has neither precinct, totalv nor county data", source);
    return std::nullopt;
}

std::vector<std::pair<std::string, std::int64_t>> regionVotes(const nlohmann::json& snapshot, std::string_view source) {
    std::vector<std::pair<std::string, std::int64_t>> out;
    const auto* precincts = arrayField(snapshot, "precinct");
    if (!precincts) {
        LOG_E("extract", "no precinct array in {}", source);
        return out;
    }
    std::unordered_map<std::string, std::size_t> position;
    for (const auto& rec : *precincts) {
        if (!rec.is_object()) continue;
        auto name = regionOf(rec);
        if (name.empty()) continue;
        std::int64_t votes = 0;
        try {
            votes = votesOf(rec);
        }
        catch (const std::exception& ex) {
            LOG_FIRST_N(WARN, 5, "extract", "ignoring votes for {} in {}: {}", name, source, ex.what());
        }
        auto [it, inserted] = position.emplace(name, out.size());
        if (inserted) {
            out.emplace_back(std::move(name), votes);
        } else {
            out[it->second].second += votes;
        }
    }
    return out;
}

} // namespace EntityExtractor
