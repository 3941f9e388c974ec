#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <string>
#include "../../utils/url/url.hpp"
#include "http_client.hpp"

namespace Vortex {
namespace Network {
namespace Http {

class BeastClient : public HttpClient {
public:
    BeastClient();
    ~BeastClient() override = default;

    // Tests talk to loopback servers with self-signed certificates.
    void set_verify_peer(bool verify);

    boost::asio::awaitable<Core::Response> fetch(const Core::Request& request,
                                                 const std::string&   proxy) override;

private:
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};

    struct Target {
        std::string host;
        std::string port;
        std::string path;
        bool        is_ssl = false;
    };

    boost::asio::awaitable<Core::Response> perform_http_request(const Target&        target,
                                                                const Core::Request& request,
                                                                const std::string&   proxy);
    boost::asio::awaitable<Core::Response> perform_https_request(const Target&        target,
                                                                 const Core::Request& request,
                                                                 const std::string&   proxy);

    boost::asio::awaitable<void> connect(boost::beast::tcp_stream& stream,
                                         const Target&             target,
                                         const std::string&        proxy);
    boost::asio::awaitable<void> http_connect_tunnel(boost::beast::tcp_stream& stream,
                                                     const Target&             target);

    boost::beast::http::request<boost::beast::http::string_body>
    build_request(const Core::Request& request, const Target& target, bool absolute_form) const;
};

}  // namespace Http
}  // namespace Network
}  // namespace Vortex
