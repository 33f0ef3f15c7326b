#include "MonitorConfig.hpp"
#include "Log.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

ObservationTimestamp readTimestamp(const nlohmann::json& j, const char* field) {
    if (!j.is_array() || j.size() != 2) {
        throw std::runtime_error(std::string("MonitorConfig: '") + field + "' must be a [day, hour] pair");
    }
    return ObservationTimestamp{j.at(0).get<int>(), j.at(1).get<int>()};
}

void readRound(const nlohmann::json& j, RoundConfig& round) {
    round.tag   = j.value("tag", round.tag);
    round.month = j.value("month", round.month);
}

void overlay(const nlohmann::json& j, MonitorConfig& cfg) {
    if (!j.is_object()) {
        throw std::runtime_error("MonitorConfig: top-level JSON value must be an object");
    }
    cfg.baseUrl   = j.value("baseUrl", cfg.baseUrl);
    cfg.dayOffset = j.value("dayOffset", cfg.dayOffset);
    cfg.cacheFile = j.value("cacheFile", cfg.cacheFile);
    cfg.homeCountry = j.value("homeCountry", cfg.homeCountry);
    cfg.searchLimit = j.value("searchLimit", cfg.searchLimit);

    if (j.contains("round1")) readRound(j["round1"], cfg.round1);
    if (j.contains("round2")) readRound(j["round2"], cfg.round2);

    if (j.contains("window")) {
        const auto& w = j["window"];
        if (w.contains("start")) cfg.windowStart = readTimestamp(w["start"], "window.start");
        if (w.contains("end"))   cfg.windowEnd   = readTimestamp(w["end"], "window.end");
    }
    if (j.contains("refresh")) {
        const auto& r = j["refresh"];
        cfg.refreshMinute = r.value("minute", cfg.refreshMinute);
        cfg.refreshSecond = r.value("second", cfg.refreshSecond);
    }
    if (j.contains("http")) {
        const auto& h = j["http"];
        cfg.http.timeoutSeconds = h.value("timeoutSeconds", cfg.http.timeoutSeconds);
        cfg.http.userAgent      = h.value("userAgent", cfg.http.userAgent);
        cfg.http.caBundle       = h.value("caBundle", cfg.http.caBundle);
    }
    if (j.contains("defaultRegions")) {
        cfg.defaultRegions = j["defaultRegions"].get<std::vector<std::string>>();
    }
    if (j.contains("displayNames")) {
        cfg.displayNames = j["displayNames"].get<std::map<std::string, std::string>>();
    }
}

} // namespace

MonitorConfig MonitorConfig::defaults() {
    MonitorConfig cfg;
    cfg.defaultRegions = {
        "REGATUL UNIT AL MARII BRITANII ȘI AL IRLANDEI DE NORD",
        "GERMANIA",
        "FRANȚA",
        "ITALIA",
        "SPANIA",
        "REGATUL ȚĂRILOR DE JOS",
        "REPUBLICA MOLDOVA",
    };
    cfg.displayNames = {
        {"REGATUL UNIT AL MARII BRITANIEI ȘI AL IRLANDEI DE NORD", "MAREA BRITANIE"},
        {"REGATUL UNIT AL MARII BRITANII ȘI AL IRLANDEI DE NORD", "MAREA BRITANIE"},
    };
    return cfg;
}

void MonitorConfig::validate() const {
    auto checkTimestamp = [](const ObservationTimestamp& ts, const char* what) {
        if (ts.day < 1 || ts.day > 31 || ts.hour < 0 || ts.hour > 23) {
            throw std::runtime_error(fmt::format("MonitorConfig: {} ({}, {}) is not a valid (day, hour)",
                                                 what, ts.day, ts.hour));
        }
    };
    checkTimestamp(windowStart, "window.start");
    checkTimestamp(windowEnd, "window.end");
    if (!(windowStart < windowEnd)) {
        throw std::runtime_error("MonitorConfig: window.start must precede window.end");
    }
    if (dayOffset < 0) {
        throw std::runtime_error("MonitorConfig: dayOffset must be non-negative");
    }
    if (windowStart.day - dayOffset < 1) {
        throw std::runtime_error("MonitorConfig: dayOffset moves the prior round before day 1");
    }
    if (refreshMinute < 0 || refreshMinute > 59 || refreshSecond < 0 || refreshSecond > 59) {
        throw std::runtime_error("MonitorConfig: refresh minute/second must be within 0..59");
    }
    // Minute 0 of every hour is never sampled, so a refresh there would never see new data.
    if (refreshMinute == 0) {
        throw std::runtime_error("MonitorConfig: refresh.minute must be at least 1");
    }
    if (http.timeoutSeconds <= 0) {
        throw std::runtime_error("MonitorConfig: http.timeoutSeconds must be positive");
    }
    if (searchLimit <= 0) {
        throw std::runtime_error("MonitorConfig: searchLimit must be positive");
    }
    if (baseUrl.empty() || round1.tag.empty() || round2.tag.empty()) {
        throw std::runtime_error("MonitorConfig: baseUrl and round tags must not be empty");
    }
}

MonitorConfig parseMonitorConfig(const std::string& jsonText) {
    MonitorConfig cfg = MonitorConfig::defaults();
    try {
        overlay(nlohmann::json::parse(jsonText), cfg);
    }
    catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error(std::string("MonitorConfig: invalid configuration: ") + ex.what());
    }
    cfg.validate();
    return cfg;
}

MonitorConfig loadMonitorConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_W("config", "config file '{}' not found, using built-in defaults", path);
        MonitorConfig cfg = MonitorConfig::defaults();
        cfg.validate();
        return cfg;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    auto cfg = parseMonitorConfig(buffer.str());
    LOG_I("config", "loaded {} (window ({},{})..({},{}), offset {} days)", path,
          cfg.windowStart.day, cfg.windowStart.hour, cfg.windowEnd.day, cfg.windowEnd.hour, cfg.dayOffset);
    return cfg;
}
