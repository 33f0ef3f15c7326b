#include "PresenceUrls.hpp"
#include "election/time/TimeIndex.hpp"
#include <fmt/format.h>

namespace {

const char* variantName(PresenceVariant v) {
    switch (v) {
        case PresenceVariant::National: return "presence";
        case PresenceVariant::Abroad:   return "presence_sr";
    }
    return "presence";
}

} // namespace

PresenceUrls::PresenceUrls(const MonitorConfig& cfg)
    : m_base(cfg.baseUrl)
    , m_round1(cfg.round1)
    , m_round2(cfg.round2)
    , m_dayOffset(cfg.dayOffset)
{
    while (!m_base.empty() && m_base.back() == '/') {
        m_base.pop_back();
    }
}

const RoundConfig& PresenceUrls::roundConfig(Round round) const {
    return round == Round::First ? m_round1 : m_round2;
}

std::string PresenceUrls::prefix(Round round, PresenceVariant variant) const {
    return fmt::format("{}/{}/data/json/simpv/presence/{}", m_base, roundConfig(round).tag, variantName(variant));
}

std::string PresenceUrls::hourly(Round round, PresenceVariant variant, ObservationTimestamp ts) const {
    if (round == Round::First) {
        ts = TimeIndex::priorRound(ts, m_dayOffset);
    }
    return fmt::format("{}_{}-{:02d}_{:02d}-00.json", prefix(round, variant), roundConfig(round).month, ts.day, ts.hour);
}

std::string PresenceUrls::live(Round round, PresenceVariant variant) const {
    return prefix(round, variant) + "_now.json";
}
