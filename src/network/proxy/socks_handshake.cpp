#include "socks_handshake.hpp"
#include <array>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace Vortex::Network::Proxy {

namespace net = boost::asio;

namespace {

constexpr uint8_t SOCKS4_VERSION   = 0x04;
constexpr uint8_t SOCKS5_VERSION   = 0x05;
constexpr uint8_t CMD_CONNECT      = 0x01;
constexpr uint8_t SOCKS4_GRANTED   = 0x5A;
constexpr uint8_t SOCKS5_NO_AUTH   = 0x00;
constexpr uint8_t SOCKS5_REJECTED  = 0xFF;
constexpr uint8_t SOCKS5_SUCCEEDED = 0x00;
constexpr uint8_t ATYP_IPV4        = 0x01;
constexpr uint8_t ATYP_DOMAIN      = 0x03;
constexpr uint8_t ATYP_IPV6        = 0x04;

uint16_t parse_port(const std::string& port) {
    int value = 0;
    try {
        value = std::stoi(port);
    } catch (const std::logic_error&) {
        throw std::runtime_error("SOCKS: invalid port '" + port + "'");
    }
    if (value <= 0 || value > 0xFFFF)
        throw std::runtime_error("SOCKS: port out of range '" + port + "'");
    return static_cast<uint16_t>(value);
}

void append_port(std::vector<uint8_t>& out, uint16_t port) {
    out.push_back(static_cast<uint8_t>(port >> 8));
    out.push_back(static_cast<uint8_t>(port & 0xFF));
}

}  // namespace

net::awaitable<void> SocksHandshake::perform_socks4(net::ip::tcp::socket& socket,
                                                    const std::string&    host,
                                                    const std::string&    port) {
    std::vector<uint8_t> request{SOCKS4_VERSION, CMD_CONNECT};
    append_port(request, parse_port(port));

    boost::system::error_code ec;
    net::ip::address          addr = net::ip::make_address(host, ec);
    bool                      socks4a = ec || !addr.is_v4();

    if (socks4a) {
        // 0.0.0.x tells the proxy to resolve the trailing hostname.
        request.insert(request.end(), {0x00, 0x00, 0x00, 0x01});
    }
    else {
        auto bytes = addr.to_v4().to_bytes();
        request.insert(request.end(), bytes.begin(), bytes.end());
    }
    request.push_back(0x00);  // empty user id
    if (socks4a) {
        request.insert(request.end(), host.begin(), host.end());
        request.push_back(0x00);
    }

    co_await net::async_write(socket, net::buffer(request), net::use_awaitable);

    std::array<uint8_t, 8> reply{};
    co_await               net::async_read(socket, net::buffer(reply), net::use_awaitable);
    if (reply[1] != SOCKS4_GRANTED) {
        throw std::runtime_error("SOCKS4 handshake failed");
    }
    co_return;
}

net::awaitable<void> SocksHandshake::perform_socks5(net::ip::tcp::socket& socket,
                                                    const std::string&    host,
                                                    const std::string&    port) {
    if (host.size() > 255)
        throw std::runtime_error("SOCKS5: hostname too long");

    std::array<uint8_t, 3> greeting{SOCKS5_VERSION, 0x01, SOCKS5_NO_AUTH};
    co_await net::async_write(socket, net::buffer(greeting), net::use_awaitable);

    std::array<uint8_t, 2> choice{};
    co_await               net::async_read(socket, net::buffer(choice), net::use_awaitable);
    if (choice[0] != SOCKS5_VERSION || choice[1] == SOCKS5_REJECTED) {
        throw std::runtime_error("SOCKS5 handshake failed (auth choice)");
    }

    std::vector<uint8_t> request{SOCKS5_VERSION, CMD_CONNECT, 0x00, ATYP_DOMAIN};
    request.push_back(static_cast<uint8_t>(host.size()));
    request.insert(request.end(), host.begin(), host.end());
    append_port(request, parse_port(port));
    co_await net::async_write(socket, net::buffer(request), net::use_awaitable);

    std::array<uint8_t, 4> header{};
    co_await               net::async_read(socket, net::buffer(header), net::use_awaitable);
    if (header[1] != SOCKS5_SUCCEEDED) {
        throw std::runtime_error("SOCKS5 connect failed (code " + std::to_string(header[1])
                                 + ")");
    }

    size_t len = 0;
    if (header[3] == ATYP_IPV4)
        len = 4;
    else if (header[3] == ATYP_IPV6)
        len = 16;
    else if (header[3] == ATYP_DOMAIN) {
        uint8_t  domain_len = 0;
        co_await net::async_read(socket, net::buffer(&domain_len, 1), net::use_awaitable);
        len = domain_len;
    }

    // Bound address and port are not needed.
    std::vector<uint8_t> bound(len + 2);
    co_await             net::async_read(socket, net::buffer(bound), net::use_awaitable);
    co_return;
}

net::awaitable<void> SocksHandshake::perform(net::ip::tcp::socket& socket,
                                             const std::string&    proxy_scheme,
                                             const std::string&    host,
                                             const std::string&    port) {
    if (proxy_scheme == "socks5" || proxy_scheme == "socks5h") {
        co_await perform_socks5(socket, host, port);
    }
    else if (proxy_scheme == "socks4" || proxy_scheme == "socks4a") {
        co_await perform_socks4(socket, host, port);
    }
    co_return;
}

}  // namespace Vortex::Network::Proxy
