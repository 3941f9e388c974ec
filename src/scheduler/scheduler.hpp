#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "../core/types/constants.hpp"
#include "../core/types/request.hpp"
#include "../core/types/response.hpp"
#include "../downloader/autothrottle.hpp"
#include "fingerprint.hpp"
#include "frontier.hpp"

class SchedulerTest_DegradedHostBacksOff_Test;

namespace Vortex {
namespace Scheduling {

enum class Strategy { BreadthFirst, DepthFirst, Fifo, Feedback };

std::optional<Strategy> parse_strategy(const std::string& name);
const char*             to_string(Strategy strategy);

enum class Admission { Admitted, DuplicateFingerprint, DepthExceeded, FilteredByRule };

const char* to_string(Admission admission);

struct SchedulerConfig {
    Strategy strategy             = Strategy::BreadthFirst;
    int      max_depth            = Core::Constants::DEFAULT_DEPTH;  // negative: unlimited
    int      per_host_concurrency = Core::Constants::DEFAULT_PER_HOST_CONCURRENCY;  // 0: unlimited

    std::vector<std::string> allowed_domains;
    std::vector<std::string> deny_patterns;

    int                       degraded_threshold = Core::Constants::DEGRADED_FAILURE_THRESHOLD;
    double                    degraded_penalty   = Core::Constants::DEGRADED_PRIORITY_PENALTY;
    std::chrono::milliseconds slow_threshold{Core::Constants::THROTTLE_TARGET_LATENCY_MS};
    std::chrono::milliseconds host_backoff_base{Core::Constants::HOST_BACKOFF_BASE_MS};
    std::chrono::milliseconds host_backoff_max{Core::Constants::HOST_BACKOFF_MAX_MS};
};

struct OutcomeReport {
    Core::FetchStatus         status = Core::FetchStatus::Ok;
    std::chrono::milliseconds latency{0};
};

struct SchedulerStats {
    size_t admitted       = 0;
    size_t forced         = 0;
    size_t duplicates     = 0;
    size_t depth_exceeded = 0;
    size_t filtered       = 0;
    size_t dispatched     = 0;
    size_t completed      = 0;
    size_t frontier_size  = 0;
    size_t in_flight      = 0;
    size_t pending_tasks  = 0;
    size_t seen           = 0;
    size_t degraded_hosts = 0;
};

/**
 * @brief Admission, ordering and host feedback for one crawl.
 *
 * The Scheduler is the only owner of the Frontier and the FingerprintStore;
 * every method takes the same mutex, so admission of concurrently discovered
 * duplicates is atomic and per-host dispatch bookkeeping is strictly ordered.
 * Per-host inter-dispatch delays are read from the shared AutoThrottle.
 */
class Scheduler {
#ifndef CPPCHECK
    friend class ::SchedulerTest_DegradedHostBacksOff_Test;
#endif

public:
    using Clock = std::chrono::steady_clock;

    explicit Scheduler(SchedulerConfig                         config,
                       std::shared_ptr<Download::AutoThrottle> throttle = nullptr);

    Admission admit(Core::Request request);
    size_t    admit_all(std::vector<Core::Request> requests);

    std::optional<Core::Request>             next(Clock::time_point now = Clock::now());
    std::optional<std::chrono::milliseconds> time_until_ready(Clock::time_point now = Clock::now());

    void report_outcome(const Core::Request& request,
                        const OutcomeReport& outcome,
                        Clock::time_point    now = Clock::now());

    // Follow-up work of a completed response (parsing, redirect admission)
    // counts against quiescence from begin_task() until end_task().
    void   begin_task();
    void   end_task();
    size_t pending_tasks() const;

    // Frontier empty, nothing in flight and no pending task.
    bool is_quiescent() const;
    bool is_degraded(const std::string& host) const;

    // Refuse every further admission.
    void close();
    bool closed() const;

    SchedulerStats         stats() const;
    const SchedulerConfig& config() const {
        return config_;
    }

private:
    struct HostState {
        int               in_flight            = 0;
        bool              dispatched_once      = false;
        Clock::time_point last_dispatch;
        Clock::time_point backoff_until;
        double            latency_ewma_ms      = 0.0;
        int               consecutive_failures = 0;
        double            penalty              = 0.0;
        bool              degraded             = false;
    };

    double base_priority(const Core::Request& request) const;
    bool   passes_filters(const std::string& url, const std::string& host) const;
    bool   host_eligible(const std::string& host, Clock::time_point now) const;
    double host_adjustment(const std::string& host) const;
    int    host_limit(const std::string& host) const;
    std::chrono::milliseconds host_delay(const std::string& host) const;

    SchedulerConfig                         config_;
    std::shared_ptr<Download::AutoThrottle> throttle_;
    std::vector<std::regex>                 deny_;

    mutable std::mutex                         mutex_;
    Frontier                                   frontier_;
    FingerprintStore                           seen_;
    std::unordered_map<std::string, HostState> hosts_;
    uint64_t                                   sequence_  = 0;
    size_t                                     in_flight_ = 0;
    size_t                                     pending_   = 0;
    bool                                       closed_    = false;
    SchedulerStats                             stats_;
};

}  // namespace Scheduling
}  // namespace Vortex
