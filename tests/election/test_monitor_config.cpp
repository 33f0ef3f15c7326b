#include <gtest/gtest.h>
#include "election/config/MonitorConfig.hpp"
#include "fixtures/temp_file.hpp"
#include <stdexcept>

TEST(MonitorConfig, DefaultsAreValid) {
    const auto cfg = MonitorConfig::defaults();
    EXPECT_NO_THROW(cfg.validate());
    EXPECT_EQ(cfg.dayOffset, 14);
    EXPECT_EQ(cfg.windowStart, (ObservationTimestamp{15, 22}));
    EXPECT_EQ(cfg.windowEnd, (ObservationTimestamp{18, 21}));
    EXPECT_EQ(cfg.refreshMinute, 1);
    EXPECT_EQ(cfg.refreshSecond, 1);
    EXPECT_EQ(cfg.http.userAgent, "Mozilla/5.0");
    EXPECT_EQ(cfg.defaultRegions.size(), 7u);
    EXPECT_EQ(cfg.displayNames.at("REGATUL UNIT AL MARII BRITANIEI ȘI AL IRLANDEI DE NORD"), "MAREA BRITANIE");
}

TEST(MonitorConfig, MissingFileFallsBackToDefaults) {
    TempFile file("config");
    const auto cfg = loadMonitorConfig(file.path());
    EXPECT_EQ(cfg.baseUrl, "https://prezenta.roaep.ro");
    EXPECT_EQ(cfg.cacheFile, "cache.json");
}

TEST(MonitorConfig, FileOverridesOnlyGivenFields) {
    TempFile file("config");
    file.write(R"({
        "baseUrl": "https://mirror.example",
        "round2": {"tag": "prezidentiale99"},
        "window": {"start": [16, 7], "end": [16, 21]},
        "refresh": {"second": 30},
        "http": {"timeoutSeconds": 5},
        "defaultRegions": ["ITALIA"]
    })");

    const auto cfg = loadMonitorConfig(file.path());

    EXPECT_EQ(cfg.baseUrl, "https://mirror.example");
    EXPECT_EQ(cfg.round2.tag, "prezidentiale99");
    EXPECT_EQ(cfg.round2.month, "2025-05");
    EXPECT_EQ(cfg.windowStart, (ObservationTimestamp{16, 7}));
    EXPECT_EQ(cfg.windowEnd, (ObservationTimestamp{16, 21}));
    EXPECT_EQ(cfg.refreshMinute, 1);
    EXPECT_EQ(cfg.refreshSecond, 30);
    EXPECT_EQ(cfg.http.timeoutSeconds, 5);
    EXPECT_EQ(cfg.http.userAgent, "Mozilla/5.0");
    EXPECT_EQ(cfg.defaultRegions, std::vector<std::string>{"ITALIA"});
    EXPECT_FALSE(cfg.displayNames.empty());
}

TEST(MonitorConfig, MalformedJsonThrows) {
    EXPECT_THROW(parseMonitorConfig("{ not json"), std::runtime_error);
    EXPECT_THROW(parseMonitorConfig("[1, 2]"), std::runtime_error);
    EXPECT_THROW(parseMonitorConfig(R"({"dayOffset": "fourteen"})"), std::runtime_error);
    EXPECT_THROW(parseMonitorConfig(R"({"window": {"start": [15]}})"), std::runtime_error);
}

TEST(MonitorConfig, InvalidRangesThrow) {
    EXPECT_THROW(parseMonitorConfig(R"({"window": {"start": [15, 24]}})"), std::runtime_error);
    EXPECT_THROW(parseMonitorConfig(R"({"window": {"start": [19, 0], "end": [18, 21]}})"), std::runtime_error);
    EXPECT_THROW(parseMonitorConfig(R"({"refresh": {"minute": 60}})"), std::runtime_error);
    EXPECT_THROW(parseMonitorConfig(R"({"refresh": {"minute": 0}})"), std::runtime_error);
    EXPECT_NO_THROW(parseMonitorConfig(R"({"refresh": {"minute": 59, "second": 0}})"));
    EXPECT_THROW(parseMonitorConfig(R"({"dayOffset": -1})"), std::runtime_error);
    EXPECT_THROW(parseMonitorConfig(R"({"dayOffset": 15})"), std::runtime_error);
    EXPECT_THROW(parseMonitorConfig(R"({"http": {"timeoutSeconds": 0}})"), std::runtime_error);
}

TEST(MonitorConfig, EmptyObjectIsDefaults) {
    const auto cfg = parseMonitorConfig("{}");
    EXPECT_EQ(cfg.round1.tag, "prezidentiale04052025");
    EXPECT_EQ(cfg.searchLimit, 10);
}
