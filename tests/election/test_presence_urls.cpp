#include <gtest/gtest.h>
#include "election/source/BeastHttpSource.hpp"
#include "election/source/PresenceUrls.hpp"

TEST(PresenceUrls, HourlyCurrentRound) {
    PresenceUrls urls(MonitorConfig::defaults());
    EXPECT_EQ(urls.hourly(Round::Second, PresenceVariant::Abroad, {16, 9}),
              "https://prezenta.roaep.ro/prezidentiale18052025/data/json/simpv/presence/presence_sr_2025-05-16_09-00.json");
    EXPECT_EQ(urls.hourly(Round::Second, PresenceVariant::National, {18, 0}),
              "https://prezenta.roaep.ro/prezidentiale18052025/data/json/simpv/presence/presence_2025-05-18_00-00.json");
}

TEST(PresenceUrls, HourlyPriorRoundShiftsDay) {
    PresenceUrls urls(MonitorConfig::defaults());
    EXPECT_EQ(urls.hourly(Round::First, PresenceVariant::National, {18, 21}),
              "https://prezenta.roaep.ro/prezidentiale04052025/data/json/simpv/presence/presence_2025-05-04_21-00.json");
}

TEST(PresenceUrls, LiveVariant) {
    PresenceUrls urls(MonitorConfig::defaults());
    EXPECT_EQ(urls.live(Round::Second, PresenceVariant::Abroad),
              "https://prezenta.roaep.ro/prezidentiale18052025/data/json/simpv/presence/presence_sr_now.json");
}

TEST(PresenceUrls, TrailingSlashOnBaseIsIgnored) {
    auto cfg = MonitorConfig::defaults();
    cfg.baseUrl = "https://mirror.example//";
    PresenceUrls urls(cfg);
    EXPECT_EQ(urls.live(Round::First, PresenceVariant::National),
              "https://mirror.example/prezidentiale04052025/data/json/simpv/presence/presence_now.json");
}

TEST(ParseHttpsUrl, SplitsHostPortAndTarget) {
    auto p = parseHttpsUrl("https://prezenta.roaep.ro/x/presence_now.json");
    EXPECT_EQ(p.host, "prezenta.roaep.ro");
    EXPECT_EQ(p.port, "443");
    EXPECT_EQ(p.target, "/x/presence_now.json");

    auto q = parseHttpsUrl("https://localhost:8443");
    EXPECT_EQ(q.host, "localhost");
    EXPECT_EQ(q.port, "8443");
    EXPECT_EQ(q.target, "/");
}

TEST(ParseHttpsUrl, RejectsOtherSchemes) {
    EXPECT_THROW(parseHttpsUrl("http://prezenta.roaep.ro/x.json"), FetchError);
    EXPECT_THROW(parseHttpsUrl("prezenta.roaep.ro/x.json"), FetchError);
    EXPECT_THROW(parseHttpsUrl("https:///x.json"), FetchError);
}
