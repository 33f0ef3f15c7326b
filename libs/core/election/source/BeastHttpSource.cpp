#include "BeastHttpSource.hpp"
#include "Log.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <chrono>
#include <cstdint>
#include <string_view>
#include <utility>

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr std::uint64_t kBodyLimit = 64ull * 1024 * 1024;

// One GET, driven by the caller's io_context.
// resolve -> connect -> TLS handshake -> write -> read
class HttpsGet {
public:
    HttpsGet(net::io_context& ioc, ssl::context& sslCtx, ParsedUrl url, const HttpConfig& cfg)
        : m_resolver(ioc)
        , m_stream(ioc, sslCtx)
        , m_url(std::move(url))
        , m_timeout(cfg.timeoutSeconds)
    {
        m_req.method(http::verb::get);
        m_req.target(m_url.target);
        m_req.version(11);
        m_req.set(http::field::host, m_url.host);
        m_req.set(http::field::user_agent, cfg.userAgent);
        m_req.set(http::field::accept, "application/json");
        m_parser.body_limit(kBodyLimit);
    }

    void start() {
        if (!SSL_set_tlsext_host_name(m_stream.native_handle(), m_url.host.c_str())) {
            finish(beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
            return;
        }
        if (!SSL_set1_host(m_stream.native_handle(), m_url.host.c_str())) {
            finish(beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
            return;
        }
        m_stream.set_verify_mode(ssl::verify_peer);
        m_resolver.async_resolve(m_url.host, m_url.port,
            [this](beast::error_code ec, tcp::resolver::results_type results){ onResolve(ec, results); });
    }

    void cancel() {
        m_resolver.cancel();
        beast::error_code ignored;
        beast::get_lowest_layer(m_stream).socket().close(ignored);
    }

    [[nodiscard]] bool finished() const noexcept { return m_finished; }
    [[nodiscard]] const beast::error_code& error() const noexcept { return m_ec; }
    [[nodiscard]] const http::response<http::string_body>& response() const { return m_parser.get(); }

private:
    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) { finish(ec); return; }
        beast::get_lowest_layer(m_stream).expires_after(m_timeout);
        beast::get_lowest_layer(m_stream).async_connect(results,
            [this](beast::error_code ec, tcp::resolver::results_type::endpoint_type){ onConnect(ec); });
    }

    void onConnect(beast::error_code ec) {
        if (ec) { finish(ec); return; }
        beast::get_lowest_layer(m_stream).expires_after(m_timeout);
        m_stream.async_handshake(ssl::stream_base::client,
            [this](beast::error_code ec){ onHandshake(ec); });
    }

    void onHandshake(beast::error_code ec) {
        if (ec) { finish(ec); return; }
        beast::get_lowest_layer(m_stream).expires_after(m_timeout);
        http::async_write(m_stream, m_req,
            [this](beast::error_code ec, std::size_t){ onWrite(ec); });
    }

    void onWrite(beast::error_code ec) {
        if (ec) { finish(ec); return; }
        beast::get_lowest_layer(m_stream).expires_after(m_timeout);
        http::async_read(m_stream, m_buffer, m_parser,
            [this](beast::error_code ec, std::size_t){ onRead(ec); });
    }

    void onRead(beast::error_code ec) {
        finish(ec);
        beast::error_code ignored;
        beast::get_lowest_layer(m_stream).socket().shutdown(tcp::socket::shutdown_both, ignored);
    }

    void finish(beast::error_code ec) {
        m_ec = ec;
        m_finished = true;
    }

    tcp::resolver                                   m_resolver;
    beast::ssl_stream<beast::tcp_stream>            m_stream;
    beast::flat_buffer                              m_buffer;
    http::request<http::empty_body>                 m_req;
    http::response_parser<http::string_body>        m_parser;
    ParsedUrl                                       m_url;
    std::chrono::seconds                            m_timeout;
    beast::error_code                               m_ec;
    bool                                            m_finished{false};
};

} // namespace

ParsedUrl parseHttpsUrl(const std::string& url) {
    static constexpr std::string_view kScheme = "https://";
    if (url.compare(0, kScheme.size(), kScheme) != 0) {
        throw FetchError(url, "only https:// URLs are supported");
    }
    const auto rest = url.substr(kScheme.size());
    const auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    ParsedUrl out;
    out.target = slash == std::string::npos ? "/" : rest.substr(slash);
    const auto colon = authority.find(':');
    if (colon == std::string::npos) {
        out.host = authority;
        out.port = "443";
    } else {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    }
    if (out.host.empty() || out.port.empty()) {
        throw FetchError(url, "malformed URL authority");
    }
    return out;
}

BeastHttpSource::BeastHttpSource(HttpConfig cfg)
    : m_cfg(std::move(cfg))
{
    beast::error_code ec;
    m_sslCtx.load_verify_file(m_cfg.caBundle, ec);
    if (ec) {
        LOG_W("http", "cannot load CA bundle '{}' ({}), using system default paths", m_cfg.caBundle, ec.message());
        m_sslCtx.set_default_verify_paths();
    }
    m_sslCtx.set_verify_mode(ssl::verify_peer);
}

nlohmann::json BeastHttpSource::fetch(const std::string& url) {
    HttpsGet get(m_ioc, m_sslCtx, parseHttpsUrl(url), m_cfg);

    LOG_D("http", "GET {}", url);
    const auto started = std::chrono::steady_clock::now();

    m_ioc.restart();
    get.start();
    // The stream deadline covers connect/handshake/io; this bound also covers DNS resolution.
    m_ioc.run_for(std::chrono::seconds(m_cfg.timeoutSeconds) + std::chrono::seconds(5));
    if (!get.finished()) {
        get.cancel();
        m_ioc.restart();
        m_ioc.run();
        throw FetchError(url, fmt::format("request timed out after {}s", m_cfg.timeoutSeconds));
    }
    if (get.error()) {
        throw FetchError(url, "transport error: " + get.error().message());
    }

    const auto& res = get.response();
    if (res.result() != http::status::ok) {
        throw FetchError(url, fmt::format("HTTP status {}", res.result_int()));
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(res.body());
    }
    catch (const nlohmann::json::parse_error& ex) {
        throw FetchError(url, std::string("malformed JSON body: ") + ex.what());
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
    LOG_D("http", "200 {} ({} bytes, {} ms)", url, res.body().size(), ms);
    return body;
}
