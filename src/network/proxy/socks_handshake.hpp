#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <string>

namespace Vortex::Network::Proxy {

/**
 * @brief SOCKS4/4a and SOCKS5 CONNECT handshakes over an already connected
 * proxy socket.
 *
 * Failures are reported by throwing std::runtime_error; the transport maps
 * them to a proxy error on the response.
 */
class SocksHandshake {
public:
    /**
     * @brief SOCKS4 when host is an IPv4 literal, SOCKS4a otherwise.
     */
    static boost::asio::awaitable<void> perform_socks4(boost::asio::ip::tcp::socket& socket,
                                                       const std::string&            host,
                                                       const std::string&            port);

    /**
     * @brief SOCKS5 without authentication.
     */
    static boost::asio::awaitable<void> perform_socks5(boost::asio::ip::tcp::socket& socket,
                                                       const std::string&            host,
                                                       const std::string&            port);

    // Dispatches on the proxy URL scheme; a no-op for plain HTTP proxies.
    static boost::asio::awaitable<void> perform(boost::asio::ip::tcp::socket& socket,
                                                const std::string&            proxy_scheme,
                                                const std::string&            host,
                                                const std::string&            port);
};

}  // namespace Vortex::Network::Proxy
