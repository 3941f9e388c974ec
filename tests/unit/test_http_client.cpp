#include <gtest/gtest.h>
#include <string>
#include "../../src/network/http/beast_client.hpp"
#include "../../src/network/http/curl_client.hpp"
#include "test_helpers.hpp"

using namespace Vortex::Network::Http;
using namespace Vortex::Core;
using Vortex::Testing::run_awaitable;

namespace {
// Nothing listens on port 1 of the loopback interface.
const std::string REFUSED_URL = "http://127.0.0.1:1/page";
}  // namespace

TEST(HttpClientTest, BeastReportsRefusedConnectionAsValue) {
    BeastClient client;
    client.set_connect_timeout(std::chrono::milliseconds(500));

    Request  request  = Request::get(REFUSED_URL, 3);
    Response response = run_awaitable(client.fetch(request, ""));

    EXPECT_EQ(response.status_code, 0);
    EXPECT_EQ(response.error_type, TransportError::Network);
    EXPECT_FALSE(response.error.empty());
    EXPECT_EQ(response.request.url, REFUSED_URL);
    EXPECT_EQ(response.request.depth, 3u);
}

TEST(HttpClientTest, BeastRejectsNonHttpUrl) {
    BeastClient client;
    Response    response = run_awaitable(client.fetch(Request::get("ftp://example.com/"), ""));
    EXPECT_EQ(response.error_type, TransportError::Other);
}

TEST(HttpClientTest, BeastUnreachableProxyIsProxyError) {
    BeastClient client;
    client.set_connect_timeout(std::chrono::milliseconds(500));

    Response response =
        run_awaitable(client.fetch(Request::get("http://example.com/"), "socks5://127.0.0.1:1"));
    EXPECT_EQ(response.error_type, TransportError::Proxy);
}

TEST(HttpClientTest, CurlReportsRefusedConnectionAsValue) {
    CurlClient client(1);
    client.set_connect_timeout(std::chrono::milliseconds(500));

    Response response = run_awaitable(client.fetch(Request::get(REFUSED_URL), ""));
    EXPECT_EQ(response.status_code, 0);
    EXPECT_EQ(response.error_type, TransportError::Network);
    EXPECT_EQ(response.request.url, REFUSED_URL);
}

TEST(HttpClientTest, CurlRefusedProxyIsProxyError) {
    CurlClient client(1);
    client.set_connect_timeout(std::chrono::milliseconds(500));

    Response response =
        run_awaitable(client.fetch(Request::get("http://example.com/"), "http://127.0.0.1:1"));
    EXPECT_EQ(response.error_type, TransportError::Proxy);
}
