#pragma once
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../core/types/constants.hpp"
#include "../core/types/request.hpp"
#include "../core/types/response.hpp"
#include "../network/http/http_client.hpp"
#include "autothrottle.hpp"
#include "middleware.hpp"

namespace Vortex {
namespace Download {

struct DownloaderConfig {
    int                       retry_cap = Core::Constants::DEFAULT_RETRY_CAP;
    std::chrono::milliseconds backoff_base{Core::Constants::DEFAULT_BACKOFF_BASE_MS};
    std::chrono::milliseconds backoff_max{Core::Constants::DEFAULT_BACKOFF_MAX_MS};
    int                       max_redirects = Core::Constants::DEFAULT_MAX_REDIRECTS;
    std::vector<long>         retry_http_codes;  // 4xx codes treated as retryable
    bool                      robots_crawl_delay = false;
    std::string               robots_user_agent  = Core::Constants::USER_AGENT;
};

struct Outcome {
    enum class Kind { Success, Redirect, SoftFailure, TerminalFailure, Cancelled };

    Kind                         kind = Kind::TerminalFailure;
    Core::Response               response;
    std::optional<Core::Request> follow_up;  // set for Redirect
    int                          attempts = 0;

    // Classification reported to the Scheduler.
    Core::FetchStatus status() const;
};

const char* to_string(Outcome::Kind kind);

struct DownloaderStats {
    size_t attempts       = 0;
    size_t retries        = 0;
    size_t redirects      = 0;
    size_t short_circuits = 0;
    size_t robots_fetched = 0;
};

/**
 * @brief Executes one dispatched request to a terminal Outcome.
 *
 * Every attempt passes through the middleware chain and the transport.
 * ServerError, Timeout and NetworkError (plus any status listed in
 * retry_http_codes) are retried up to retry_cap times, so a request is tried
 * at most retry_cap + 1 times. The wait before attempt n+1 is
 * max(backoff_base * 2^(n-1) capped at backoff_max, current throttle delay).
 *
 * 3xx responses with a Location header become a follow-up Request at the
 * same depth instead of being followed in place.
 */
class Downloader {
public:
    Downloader(DownloaderConfig                            config,
               std::shared_ptr<Network::Http::HttpClient> client,
               MiddlewareChain                             chain,
               std::shared_ptr<AutoThrottle>               throttle);

    boost::asio::awaitable<Outcome> fetch(Core::Request request);

    // Pending and future fetches resolve to Cancelled at their next suspension point.
    void cancel();
    bool cancelled() const {
        return cancelled_;
    }

    DownloaderStats         stats() const;
    const DownloaderConfig& config() const {
        return config_;
    }

private:
    bool                         should_retry(const Core::Response& response) const;
    std::optional<Core::Request> make_redirect(const Core::Request&  request,
                                               const Core::Response& response) const;

    boost::asio::awaitable<void> ensure_robots(const Core::Request& request,
                                               const std::string&   host);
    boost::asio::awaitable<void> sleep_for(std::chrono::milliseconds duration);

    Outcome cancelled_outcome(const Core::Request& request, int attempts) const;

    DownloaderConfig                           config_;
    std::shared_ptr<Network::Http::HttpClient> client_;
    MiddlewareChain                            chain_;
    std::shared_ptr<AutoThrottle>              throttle_;

    std::atomic<bool> cancelled_{false};

    std::mutex            robots_mutex_;
    std::set<std::string> robots_hosts_;

    std::atomic<size_t> attempts_{0};
    std::atomic<size_t> retries_{0};
    std::atomic<size_t> redirects_{0};
    std::atomic<size_t> short_circuits_{0};
    std::atomic<size_t> robots_fetched_{0};
};

}  // namespace Download
}  // namespace Vortex
