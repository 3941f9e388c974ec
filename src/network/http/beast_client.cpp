#include "beast_client.hpp"
#include <stdexcept>
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../proxy/socks_handshake.hpp"

namespace Vortex {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

using Core::Request;
using Core::Response;
using Core::TransportError;

namespace {

// Raised while talking to the proxy so the failure is attributed to it.
class ProxyFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

http::verb to_verb(Core::Method method) {
    switch (method) {
        case Core::Method::Head:
            return http::verb::head;
        case Core::Method::Post:
            return http::verb::post;
        case Core::Method::Put:
            return http::verb::put;
        case Core::Method::Delete:
            return http::verb::delete_;
        case Core::Method::Get:
        default:
            return http::verb::get;
    }
}

template <typename Stream>
net::awaitable<void> read_response(Stream& stream, http::verb method, Response& response) {
    beast::flat_buffer                       buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(64 * 1024 * 1024);
    if (method == http::verb::head)
        parser.skip(true);

    co_await http::async_read(stream, buffer, parser, net::use_awaitable);

    auto& res            = parser.get();
    response.status_code = res.result_int();
    for (const auto& field : res) {
        std::string name = Utils::Text::to_lower(std::string(field.name_string()));
        std::string value(field.value());
        auto        it = response.headers.find(name);
        if (it != response.headers.end())
            it->second += ", " + value;
        else
            response.headers.emplace(std::move(name), std::move(value));
    }
    response.content_type = response.header("content-type");
    response.body         = std::move(res.body());
}

TransportError map_error(const boost::system::error_code& ec) {
    if (ec == beast::error::timeout || ec == net::error::timed_out)
        return TransportError::Timeout;
    if (ec == net::error::operation_aborted)
        return TransportError::Cancelled;
    return TransportError::Network;
}

}  // namespace

BeastClient::BeastClient() {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

void BeastClient::set_verify_peer(bool verify) {
    ssl_ctx_.set_verify_mode(verify ? ssl::verify_peer : ssl::verify_none);
}

net::awaitable<Response> BeastClient::fetch(const Request& request, const std::string& proxy) {
    auto started = std::chrono::steady_clock::now();
    auto parsed  = Utils::Url::parse(request.url);

    Response response;
    if (parsed.host.empty() || (parsed.scheme != "http" && parsed.scheme != "https")) {
        response.request    = request;
        response.error      = "Invalid URL";
        response.error_type = TransportError::Other;
        co_return response;
    }

    Target target;
    target.is_ssl = parsed.scheme == "https";
    target.host   = parsed.host;
    target.port   = parsed.port.empty() ? (target.is_ssl ? "443" : "80") : parsed.port;
    target.path   = parsed.path.empty() ? "/" : parsed.path;
    if (!parsed.query.empty())
        target.path += "?" + parsed.query;

    try {
        if (target.is_ssl)
            response = co_await perform_https_request(target, request, proxy);
        else
            response = co_await perform_http_request(target, request, proxy);
    } catch (const ProxyFailure& e) {
        response.error      = e.what();
        response.error_type = TransportError::Proxy;
    } catch (const boost::system::system_error& e) {
        response.error      = e.code().message();
        response.error_type = map_error(e.code());
    } catch (const std::exception& e) {
        response.error      = e.what();
        response.error_type = TransportError::Other;
    }

    if (response.error_type != TransportError::None)
        response.status_code = 0;
    response.request       = request;
    response.effective_url = request.url;
    response.elapsed       = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    co_return response;
}

net::awaitable<void> BeastClient::connect(beast::tcp_stream& stream,
                                          const Target&      target,
                                          const std::string& proxy) {
    std::string connect_host = target.host;
    std::string connect_port = target.port;

    Utils::UrlParsed proxy_parsed;
    if (!proxy.empty()) {
        proxy_parsed = Utils::Url::parse(proxy);
        if (proxy_parsed.host.empty())
            throw ProxyFailure("Invalid proxy URL: " + proxy);
        connect_host = proxy_parsed.host;
        connect_port = proxy_parsed.port.empty() ? "8080" : proxy_parsed.port;
    }

    tcp::resolver resolver(co_await net::this_coro::executor);
    stream.expires_after(connect_timeout_);
    try {
        auto results =
            co_await resolver.async_resolve(connect_host, connect_port, net::use_awaitable);
        co_await stream.async_connect(results, net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        if (proxy.empty() || e.code() == beast::error::timeout)
            throw;
        throw ProxyFailure("Proxy unreachable: " + e.code().message());
    }

    if (proxy.empty())
        co_return;

    try {
        co_await Proxy::SocksHandshake::perform(
            stream.socket(), proxy_parsed.scheme, target.host, target.port);
    } catch (const boost::system::system_error& e) {
        throw ProxyFailure(std::string("Proxy handshake failed: ") + e.what());
    } catch (const std::runtime_error& e) {
        throw ProxyFailure(e.what());
    }
}

http::request<http::string_body>
BeastClient::build_request(const Request& request, const Target& target, bool absolute_form) const {
    std::string req_target = target.path;
    if (absolute_form) {
        req_target = (target.is_ssl ? "https://" : "http://") + target.host + ":" + target.port
                     + target.path;
    }

    http::request<http::string_body> req{to_verb(request.method), req_target, 11};
    req.set(http::field::host, target.host);
    req.set(http::field::user_agent, Core::Constants::USER_AGENT);
    for (const auto& [name, value] : request.headers)
        req.set(name, value);
    if (request.body) {
        req.body() = *request.body;
        req.prepare_payload();
    }
    return req;
}

net::awaitable<Response> BeastClient::perform_http_request(const Target&      target,
                                                           const Request&     request,
                                                           const std::string& proxy) {
    Response          response;
    beast::tcp_stream stream(co_await net::this_coro::executor);
    co_await          connect(stream, target, proxy);

    bool plain_http_proxy = false;
    if (!proxy.empty()) {
        auto scheme      = Utils::Url::parse(proxy).scheme;
        plain_http_proxy = scheme.empty() || scheme == "http" || scheme == "https";
    }

    stream.expires_after(request_timeout_);
    auto req = build_request(request, target, plain_http_proxy);
    co_await http::async_write(stream, req, net::use_awaitable);
    co_await read_response(stream, req.method(), response);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return response;
}

net::awaitable<void> BeastClient::http_connect_tunnel(beast::tcp_stream& stream,
                                                      const Target&      target) {
    std::string authority = target.host + ":" + target.port;

    http::request<http::empty_body> req{http::verb::connect, authority, 11};
    req.set(http::field::host, authority);
    req.set(http::field::user_agent, Core::Constants::USER_AGENT);
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                      buffer;
    http::response_parser<http::empty_body> parser;
    parser.skip(true);
    co_await http::async_read_header(stream, buffer, parser, net::use_awaitable);

    if (parser.get().result() != http::status::ok) {
        throw ProxyFailure("Proxy CONNECT failed: HTTP "
                           + std::to_string(parser.get().result_int()));
    }
}

net::awaitable<Response> BeastClient::perform_https_request(const Target&      target,
                                                            const Request&     request,
                                                            const std::string& proxy) {
    Response                             response;
    beast::ssl_stream<beast::tcp_stream> ssl_stream(co_await net::this_coro::executor, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(ssl_stream.native_handle(), target.host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }

    auto& lowest = beast::get_lowest_layer(ssl_stream);
    co_await connect(lowest, target, proxy);

    if (!proxy.empty()) {
        auto scheme = Utils::Url::parse(proxy).scheme;
        if (!Utils::Text::starts_with(scheme, "socks")) {
            lowest.expires_after(connect_timeout_);
            co_await http_connect_tunnel(lowest, target);
        }
    }

    lowest.expires_after(connect_timeout_);
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    lowest.expires_after(request_timeout_);
    auto req = build_request(request, target, false);
    co_await http::async_write(ssl_stream, req, net::use_awaitable);
    co_await read_response(ssl_stream, req.method(), response);

    // Servers commonly close without close_notify.
    beast::error_code ec;
    co_await          ssl_stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    if (ec && ec != net::ssl::error::stream_truncated)
        Core::Logger::debug("TLS shutdown: " + ec.message());
    co_return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Vortex
