#pragma once
#include <atomic>
#include <chrono>
#include <string>

namespace Vortex {
namespace Engine {

enum class CrawlState { Idle, Running, Draining, Cancelling, Stopped };

const char* to_string(CrawlState state);

struct CrawlSummary {
    size_t dispatched        = 0;
    size_t ok                = 0;
    size_t client_errors     = 0;
    size_t server_errors     = 0;
    size_t timeouts          = 0;
    size_t network_errors    = 0;
    size_t retries           = 0;
    size_t redirects         = 0;
    size_t terminal_failures = 0;
    size_t soft_failures     = 0;
    size_t cancelled         = 0;

    size_t records             = 0;
    size_t discovered          = 0;
    size_t duplicates          = 0;
    size_t depth_exceeded      = 0;
    size_t filtered            = 0;
    size_t forced              = 0;
    size_t extraction_failures = 0;
    size_t sink_failures       = 0;

    std::chrono::milliseconds elapsed{0};
    CrawlState                final_state = CrawlState::Idle;

    // Multi-line, human readable.
    std::string describe() const;
};

/**
 * @brief Counters the engine updates from worker and parser threads.
 *
 * Admission and pipeline counters are owned by the Scheduler and the
 * Pipeline; they are merged in when the summary is taken.
 */
struct CrawlStats {
    std::atomic<size_t> dispatched{0};
    std::atomic<size_t> ok{0};
    std::atomic<size_t> client_errors{0};
    std::atomic<size_t> server_errors{0};
    std::atomic<size_t> timeouts{0};
    std::atomic<size_t> network_errors{0};
    std::atomic<size_t> terminal_failures{0};
    std::atomic<size_t> soft_failures{0};
    std::atomic<size_t> cancelled{0};
    std::atomic<size_t> records{0};
    std::atomic<size_t> discovered{0};
    std::atomic<size_t> extraction_failures{0};

    CrawlSummary snapshot() const;
};

}  // namespace Engine
}  // namespace Vortex
