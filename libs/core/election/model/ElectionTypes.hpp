/*
Turnout – ElectionTypes
Role: Plain data shared by every stage of the pipeline: observation timestamps, entity identifiers,
      per-entity snapshots and aligned series.
Threading: Value types only; no synchronization.
Related: TimeIndex.hpp, Aggregator.hpp, StatisticsEngine.hpp.
*/
#pragma once
#include <compare>
#include <cstdint>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

// One hourly snapshot published by the source: (calendar day, hour of day).
struct ObservationTimestamp {
    int day{0};
    int hour{0};

    auto operator<=>(const ObservationTimestamp&) const = default;
};

using TimeIndexSeq = std::vector<ObservationTimestamp>;

enum class Round { First, Second };

enum class EntityKind {
    Region,      // a named region published by the source (e.g. a diaspora country)
    Domestic,    // global total minus the abroad total
    GlobalTotal  // sum over every county
};

// Closed entity identifier. Only Region carries a name.
class EntityId {
public:
    static EntityId region(std::string name) { return EntityId(EntityKind::Region, std::move(name)); }
    static EntityId domestic() { return EntityId(EntityKind::Domestic, {}); }
    static EntityId globalTotal() { return EntityId(EntityKind::GlobalTotal, {}); }

    [[nodiscard]] EntityKind kind() const noexcept { return m_kind; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] bool isRegion() const noexcept { return m_kind == EntityKind::Region; }

    // Human-readable label for logs and reports.
    [[nodiscard]] std::string label() const {
        switch (m_kind) {
            case EntityKind::Region:      return m_name;
            case EntityKind::Domestic:    return "<domestic>";
            case EntityKind::GlobalTotal: return "<total>";
        }
        return m_name;
    }

    bool operator==(const EntityId& o) const { return m_kind == o.m_kind && m_name == o.m_name; }
    bool operator<(const EntityId& o) const {
        return std::tie(m_kind, m_name) < std::tie(o.m_kind, o.m_name);
    }

private:
    EntityId(EntityKind kind, std::string name) : m_kind(kind), m_name(std::move(name)) {}

    EntityKind  m_kind;
    std::string m_name;
};

// Latest values for one entity, always taken from the last TimeIndex position.
struct EntitySnapshot {
    std::int64_t round1Votes{0};
    std::int64_t round2Votes{0};
    std::int64_t hourlyIncrease{0};
};

// Live global total against the last hourly sample of the global total.
struct HourProgress {
    std::int64_t baseline{0};        // global total round 2 at the last TimeIndex position
    std::int64_t currentTotal{0};    // live total, or the baseline when the live read failed
    std::int64_t sinceHourStart{0};  // max(0, currentTotal - baseline)
    bool         live{false};
};

// Two aligned series plus their derivations. All vectors share the TimeIndex length.
struct SeriesPair {
    std::vector<std::int64_t> current;          // round 2
    std::vector<std::int64_t> prior;            // round 1, shifted by the configured day offset
    std::vector<std::int64_t> difference;       // current - prior
    std::vector<std::int64_t> runningIncrease;  // aggregator convention: index 0 is the value itself
    std::vector<double>       deltaPercent;     // filled by StatisticsEngine
    std::vector<std::int64_t> hourlyIncrease;   // filled by StatisticsEngine: index 0 is 0

    [[nodiscard]] std::size_t size() const noexcept { return current.size(); }
    [[nodiscard]] bool empty() const noexcept { return current.empty(); }
};

// Outcome of a durable-cache lookup.
struct CachedValue {
    bool         wasCached{false};
    std::int64_t value{0};
    bool         failed{false};  // inputs could not be fetched or parsed; value is 0 and was not stored
};
