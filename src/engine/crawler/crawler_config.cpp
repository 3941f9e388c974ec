#include "crawler_config.hpp"
#include "../../core/types/errors.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Vortex {
namespace Engine {

std::optional<Transport> parse_transport(const std::string& name) {
    std::string lower = Utils::Text::to_lower(name);
    if (lower == "beast" || lower == "asio")
        return Transport::Beast;
    if (lower == "curl" || lower == "libcurl")
        return Transport::Curl;
    return std::nullopt;
}

namespace {

void require(bool condition, const std::string& message) {
    if (!condition)
        throw Core::ConfigError(message);
}

}  // namespace

void CrawlerConfig::validate() const {
    require(threads > 0, "threads must be positive");
    require(concurrency > 0, "concurrency must be positive");
    require(parser_threads > 0, "parser_threads must be positive");
    require(per_host_concurrency >= 0, "per_host_concurrency must not be negative");
    require(retry_cap >= 0, "retry_cap must not be negative");
    require(max_redirects >= 0, "max_redirects must not be negative");
    require(backoff_base.count() >= 0 && backoff_max >= backoff_base,
            "backoff_max must be at least backoff_base");
    require(throttle.min_delay.count() >= 0 && throttle.max_delay >= throttle.min_delay,
            "throttle max_delay must be at least min_delay");
    require(throttle.decrease_factor > 0.0 && throttle.decrease_factor <= 1.0,
            "throttle decrease_factor must be in (0, 1]");
    require(throttle.target_error_rate >= 0.0 && throttle.target_error_rate <= 1.0,
            "throttle target_error_rate must be in [0, 1]");
    require(connect_timeout.count() > 0 && request_timeout.count() > 0,
            "timeouts must be positive");
    require(!use_proxies || !proxies.empty(), "proxy toggle is on but no proxies are configured");
    require(drain_timeout.count() >= 0, "drain_timeout must not be negative");
    for (const auto& code : retry_http_codes)
        require(code >= 100 && code <= 599, "invalid retry_http_codes entry");
}

}  // namespace Engine
}  // namespace Vortex
