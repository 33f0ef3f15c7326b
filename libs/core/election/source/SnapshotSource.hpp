#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

// Transport, status or body failure while fetching one snapshot.
class FetchError : public std::runtime_error {
public:
    FetchError(std::string url, const std::string& what)
        : std::runtime_error(what)
        , m_url(std::move(url))
    {}

    const std::string& url() const noexcept { return m_url; }

private:
    std::string m_url;
};

// Pure fetch interface (no caching, no extraction logic)
class SnapshotSource {
public:
    SnapshotSource() = default;
    virtual ~SnapshotSource() = default;

    SnapshotSource(const SnapshotSource&) = delete;
    SnapshotSource& operator=(const SnapshotSource&) = delete;

    // Blocking GET of one JSON snapshot. Throws FetchError on any failure.
    virtual nlohmann::json fetch(const std::string& url) = 0;
};
