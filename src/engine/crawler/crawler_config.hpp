#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../downloader/autothrottle.hpp"
#include "../../scheduler/scheduler.hpp"

namespace Vortex {
namespace Engine {

enum class Transport { Beast, Curl };

std::optional<Transport> parse_transport(const std::string& name);

// Resolved, immutable settings of one crawl.
struct CrawlerConfig {
    Scheduling::Strategy strategy             = Scheduling::Strategy::BreadthFirst;
    int                  threads              = Core::Constants::DEFAULT_THREADS;
    int                  concurrency          = Core::Constants::DEFAULT_CONCURRENCY;
    int                  parser_threads       = Core::Constants::DEFAULT_PARSER_THREADS;
    int                  per_host_concurrency = Core::Constants::DEFAULT_PER_HOST_CONCURRENCY;
    int                  max_depth            = Core::Constants::DEFAULT_DEPTH;

    Download::ThrottleConfig throttle;

    int                       retry_cap = Core::Constants::DEFAULT_RETRY_CAP;
    std::chrono::milliseconds backoff_base{Core::Constants::DEFAULT_BACKOFF_BASE_MS};
    std::chrono::milliseconds backoff_max{Core::Constants::DEFAULT_BACKOFF_MAX_MS};
    int                       max_redirects = Core::Constants::DEFAULT_MAX_REDIRECTS;
    std::vector<long>         retry_http_codes;

    bool                       use_proxies = false;
    std::vector<std::string>   proxies;
    int                        proxy_retries = Core::Constants::DEFAULT_PROXY_RETRIES;
    std::map<std::string, int> proxy_priorities;

    std::vector<std::string> user_agents;  // one entry: fixed; several: rotation

    Transport                 transport = Transport::Beast;
    std::chrono::milliseconds connect_timeout{Core::Constants::CONNECT_TIMEOUT_MS};
    std::chrono::milliseconds request_timeout{
        std::chrono::seconds(Core::Constants::REQUEST_TIMEOUT_SECONDS)};

    std::vector<std::string> allowed_domains;
    std::vector<std::string> deny_patterns;

    bool                      robots_crawl_delay = false;
    std::chrono::milliseconds drain_timeout{Core::Constants::DEFAULT_DRAIN_TIMEOUT_MS};
    std::chrono::milliseconds stats_interval{Core::Constants::DEFAULT_STATS_INTERVAL_MS};
    int                       log_level      = Core::LOG_DEFAULT;
    bool                      handle_signals = true;

    // Throws Core::ConfigError on an out-of-range value.
    void validate() const;
};

}  // namespace Engine
}  // namespace Vortex
