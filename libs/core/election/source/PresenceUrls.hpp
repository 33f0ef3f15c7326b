#pragma once
// ─────────────────────────────────────────────────────────────
// PresenceUrls – builds hourly and live snapshot URLs.
// {base}/{roundTag}/data/json/simpv/presence/{variant}_{YYYY-MM}-{DD}_{HH}-00.json
// {base}/{roundTag}/data/json/simpv/presence/{variant}_now.json
// ─────────────────────────────────────────────────────────────
#include <string>
#include "election/config/MonitorConfig.hpp"
#include "election/model/ElectionTypes.hpp"

enum class PresenceVariant {
    National, // "presence":    county-level records for the whole electorate
    Abroad    // "presence_sr": precinct-level records for voters abroad
};

class PresenceUrls {
public:
    explicit PresenceUrls(const MonitorConfig& cfg);

    // Round::Second is read at `ts`; Round::First at the same hour `dayOffset` days earlier.
    [[nodiscard]] std::string hourly(Round round, PresenceVariant variant, ObservationTimestamp ts) const;
    [[nodiscard]] std::string live(Round round, PresenceVariant variant) const;

    [[nodiscard]] int dayOffset() const noexcept { return m_dayOffset; }

private:
    [[nodiscard]] std::string prefix(Round round, PresenceVariant variant) const;
    [[nodiscard]] const RoundConfig& roundConfig(Round round) const;

    std::string m_base;
    RoundConfig m_round1;
    RoundConfig m_round2;
    int         m_dayOffset;
};
