/*
Turnout – MonitorConfig
Role: Everything the core needs to know about one two-round election: round tags, the observation
      window, the refresh cadence, HTTP settings and the durable cache location.
Inputs/Outputs: Loaded from a JSON file; every field falls back to a built-in default.
Observability: Logs a warning when the file is missing; throws std::runtime_error when it is malformed.
Related: MonitorConfig.cpp, PresenceUrls.hpp, UpdateScheduler.hpp.
*/
#pragma once
#include <map>
#include <string>
#include <vector>
#include "election/model/ElectionTypes.hpp"

struct RoundConfig {
    std::string tag;    // path segment, e.g. "prezidentiale18052025"
    std::string month;  // "YYYY-MM" used in hourly file names
};

struct HttpConfig {
    int         timeoutSeconds{30};
    std::string userAgent{"Mozilla/5.0"};
    std::string caBundle{"/etc/ssl/certs/ca-certificates.crt"};
};

struct MonitorConfig {
    std::string          baseUrl{"https://prezenta.roaep.ro"};
    RoundConfig          round1{"prezidentiale04052025", "2025-05"};
    RoundConfig          round2{"prezidentiale18052025", "2025-05"};
    int                  dayOffset{14};
    ObservationTimestamp windowStart{15, 22};
    ObservationTimestamp windowEnd{18, 21};
    int                  refreshMinute{1};
    int                  refreshSecond{1};
    HttpConfig           http;
    std::string          cacheFile{"cache.json"};
    std::string          homeCountry{"ROMANIA"};
    std::vector<std::string> defaultRegions;
    std::map<std::string, std::string> displayNames;
    int                  searchLimit{10};

    // Built-in defaults, including the fallback region list and display aliases.
    static MonitorConfig defaults();

    // Throws std::runtime_error if a value is out of range.
    void validate() const;
};

// Returns defaults() overlaid with whatever the file provides. A missing file is not an error.
[[nodiscard]] MonitorConfig loadMonitorConfig(const std::string& path);

// Same as loadMonitorConfig, from an already-read JSON document.
[[nodiscard]] MonitorConfig parseMonitorConfig(const std::string& jsonText);
