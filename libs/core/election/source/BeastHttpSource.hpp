/*
Turnout – BeastHttpSource
Role: The production SnapshotSource: blocking HTTPS GET of one JSON document per call.
Inputs/Outputs: Takes an absolute https:// URL; returns the parsed body or throws FetchError.
Threading: Not thread-safe. Owns one io_context that is driven to completion inside fetch().
Performance: One TLS connection per request; fetches are serialized because the remote side is
             rate-sensitive and RequestCache already removes duplicate requests within a cycle.
Observability: Logs every request at debug level and every failure at error level.
Assumptions: The CA bundle configured in HttpConfig is readable; otherwise system defaults are used.
*/
#pragma once
#include "SnapshotSource.hpp"
#include "election/config/MonitorConfig.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <string>

namespace net = boost::asio;
namespace ssl = net::ssl;

struct ParsedUrl {
    std::string host;
    std::string port;
    std::string target;
};

// Splits "https://host[:port]/path". Throws FetchError for anything else.
[[nodiscard]] ParsedUrl parseHttpsUrl(const std::string& url);

class BeastHttpSource : public SnapshotSource {
public:
    explicit BeastHttpSource(HttpConfig cfg);

    nlohmann::json fetch(const std::string& url) override;

private:
    HttpConfig      m_cfg;
    net::io_context m_ioc;
    ssl::context    m_sslCtx{ssl::context::tlsv12_client};
};
