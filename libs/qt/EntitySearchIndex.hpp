/*
Turnout – EntitySearchIndex
Role: Ranks entity names against a free-text query for the region picker.
Inputs/Outputs: Query + candidate names in (display order); ranked subset out, at most `limit` long.
Threading: Stateless; safe from any thread.
Performance: One normalization per candidate per query; fine for a few hundred names.
Observability: Debug log of the query and result count.
Related: EntityCatalog.hpp (produces the candidate list).
Assumptions: Matching is diacritic- and case-insensitive, so "Germania" finds "GERMANIA" and
             "romania" finds "ROMÂNIA".
*/
#pragma once
#include <string>
#include <vector>
#include <QString>

class EntitySearchIndex
{
public:
    // Match tiers. Each tier adds a bonus proportional to queryLength / nameLength.
    static constexpr double kExactScore     = 100.0;
    static constexpr double kPrefixScore    = 75.0;
    static constexpr double kPrefixBonus    = 20.0;
    static constexpr double kWordScore      = 60.0;
    static constexpr double kWordBonus      = 15.0;
    static constexpr double kSubstringScore = 30.0;
    static constexpr double kSubstringBonus = 25.0;

    // Empty query: the first `limit` names unfiltered, in input order.
    // Otherwise: names containing the normalized query, best score first, ties in input order.
    [[nodiscard]] static std::vector<std::string> search(const std::string& query,
                                                         const std::vector<std::string>& names,
                                                         std::size_t limit);

    // Lowercase, canonical decomposition, combining marks removed.
    [[nodiscard]] static QString normalize(const QString& text);

    // Score of an already-normalized name against an already-normalized, non-empty query.
    // Zero when the query is not a substring of the name.
    [[nodiscard]] static double score(const QString& normalizedQuery, const QString& normalizedName);
};
