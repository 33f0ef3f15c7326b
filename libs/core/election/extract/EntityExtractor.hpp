/*
Turnout – EntityExtractor
Role: Pulls one scalar vote total out of a raw presence snapshot.
Inputs/Outputs: Raw nlohmann::json in, std::optional<int64_t> out. An empty optional means the
                snapshot did not have the expected shape; a present zero means "no matching records".
Threading: Stateless free functions.
Observability: Every shape failure is logged at error level with the source URL.
*/
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace EntityExtractor {

// Precinct records carry the region name under uat.name and the running vote count under LT.
inline constexpr const char* kVotesField = "LT";
inline constexpr const char* kFlatTotalField = "totalv";

// Sum of LT over precinct records whose uat.name equals `region` exactly.
[[nodiscard]] std::optional<std::int64_t> regionTotal(const nlohmann::json& snapshot,
                                                      const std::string& region,
                                                      std::string_view source = {});

// Sum of LT over the county-level view (never over precincts).
[[nodiscard]] std::optional<std::int64_t> globalTotal(const nlohmann::json& snapshot,
                                                      std::string_view source = {});

// Abroad total. The source has served more than one shape for this query, so try in order:
// precinct records -> flat "totalv" -> county records.
[[nodiscard]] std::optional<std::int64_t> abroadTotal(const nlohmann::json& snapshot,
                                                      std::string_view source = {});

// Global minus abroad, floored at zero: the two files can come from different data generations.
[[nodiscard]] constexpr std::int64_t domesticTotal(std::int64_t global, std::int64_t abroad) noexcept {
    return global > abroad ? global - abroad : 0;
}

// Distinct non-empty region names with their summed LT, in first-seen order.
[[nodiscard]] std::vector<std::pair<std::string, std::int64_t>> regionVotes(const nlohmann::json& snapshot,
                                                                             std::string_view source = {});

} // namespace EntityExtractor
