#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <string>

#include "../../core/types/constants.hpp"
#include "../../core/types/request.hpp"
#include "../../core/types/response.hpp"

namespace Vortex {
namespace Network {
namespace Http {

/**
 * @brief Transport seam used by the Downloader.
 *
 * Implementations perform exactly one HTTP exchange per call and never follow
 * redirects. Transport failures are returned in Response::error_type rather
 * than thrown. The returned Response carries the originating Request, the
 * measured latency and lower-cased header names; its FetchStatus is left for
 * the caller to assign.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void set_connect_timeout(std::chrono::milliseconds timeout) {
        connect_timeout_ = timeout;
    }
    virtual void set_request_timeout(std::chrono::milliseconds timeout) {
        request_timeout_ = timeout;
    }

    // proxy is a URL such as "http://h:3128" or "socks5://h:1080"; empty for a direct connection.
    virtual boost::asio::awaitable<Core::Response> fetch(const Core::Request& request,
                                                         const std::string&   proxy) = 0;

protected:
    std::chrono::milliseconds connect_timeout_{Core::Constants::CONNECT_TIMEOUT_MS};
    std::chrono::milliseconds request_timeout_{
        std::chrono::seconds(Core::Constants::REQUEST_TIMEOUT_SECONDS)};
};

}  // namespace Http
}  // namespace Network
}  // namespace Vortex
