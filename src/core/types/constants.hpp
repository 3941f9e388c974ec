#pragma once
#include <cctype>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace Vortex {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_THREADS              = 2;   // IO Threads
    static constexpr int         DEFAULT_CONCURRENCY          = 16;  // Coroutines
    static constexpr int         DEFAULT_PARSER_THREADS       = 2;   // CPU Threads
    static constexpr int         DEFAULT_PER_HOST_CONCURRENCY = 4;
    static constexpr int         DEFAULT_DEPTH                = 2;
    static constexpr const char* VERSION                      = "0.3.0";

    static constexpr int         DEFAULT_RETRY_CAP           = 3;
    static constexpr int         DEFAULT_BACKOFF_BASE_MS     = 500;
    static constexpr int         DEFAULT_BACKOFF_MAX_MS      = 30000;
    static constexpr int         DEFAULT_MAX_REDIRECTS       = 10;
    static constexpr int         REQUEST_TIMEOUT_SECONDS     = 10;
    static constexpr int         CONNECT_TIMEOUT_MS          = 5000;
    static constexpr const char* USER_AGENT                  = "Vortex-Crawler/0.3";
    static constexpr int         DEFAULT_PROXY_RETRIES       = 3;
    static constexpr int         DEFAULT_DRAIN_TIMEOUT_MS    = 10000;
    static constexpr int         DEFAULT_STATS_INTERVAL_MS   = 10000;

    // AutoThrottle (AIMD on per-host delay)
    static constexpr int    THROTTLE_START_DELAY_MS      = 0;
    static constexpr int    THROTTLE_MIN_DELAY_MS        = 0;
    static constexpr int    THROTTLE_MAX_DELAY_MS        = 60000;
    static constexpr int    THROTTLE_INCREASE_STEP_MS    = 250;
    static constexpr double THROTTLE_DECREASE_FACTOR     = 0.5;
    static constexpr int    THROTTLE_TARGET_LATENCY_MS   = 2000;
    static constexpr double THROTTLE_TARGET_ERROR_RATE   = 0.1;
    static constexpr double THROTTLE_ERROR_RATE_ALPHA    = 0.2;
    static constexpr double THROTTLE_LATENCY_ALPHA       = 0.3;

    // Scheduler feedback
    static constexpr int    DEGRADED_FAILURE_THRESHOLD   = 3;
    static constexpr double DEGRADED_PRIORITY_PENALTY    = 1000.0;
    static constexpr double FEEDBACK_FAILURE_PENALTY     = 1.0;
    static constexpr double FEEDBACK_SLOW_PENALTY        = 0.5;
    static constexpr double FEEDBACK_PENALTY_DECAY       = 0.5;
    static constexpr int    HOST_BACKOFF_BASE_MS         = 1000;
    static constexpr int    HOST_BACKOFF_MAX_MS          = 60000;
};

inline const std::vector<std::string>& get_text_mime_prefixes() {
    static const std::vector<std::string> prefixes = {"text/",
                                                      "application/xhtml",
                                                      "application/xml",
                                                      "application/json",
                                                      "application/ld+json"};
    return prefixes;
}

inline bool is_text_mime(const std::string& content_type) {
    if (content_type.empty())
        return true;

    std::string lower = content_type;
    for (char& c : lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    for (const auto& prefix : get_text_mime_prefixes()) {
        if (lower.rfind(prefix, 0) == 0)
            return true;
    }
    return false;
}

inline std::chrono::milliseconds get_backoff_time(int                       attempt,
                                                  std::chrono::milliseconds base,
                                                  std::chrono::milliseconds cap) {
    if (attempt <= 0)
        return std::chrono::milliseconds(0);
    int  shift = attempt - 1 > 20 ? 20 : attempt - 1;
    std::chrono::milliseconds delay = base * (1LL << shift);
    return delay > cap ? cap : delay;
}

}  // namespace Core
}  // namespace Vortex
