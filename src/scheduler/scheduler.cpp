#include "scheduler.hpp"
#include <algorithm>
#include "../core/logger/logger.hpp"
#include "../core/types/errors.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace Vortex {
namespace Scheduling {

using Core::Logger;
using std::chrono::milliseconds;

namespace {
constexpr double LATENCY_ALPHA = Core::Constants::THROTTLE_LATENCY_ALPHA;
}  // namespace

std::optional<Strategy> parse_strategy(const std::string& name) {
    std::string lower = Utils::Text::to_lower(name);
    if (lower == "bfo" || lower == "breadth-first" || lower == "breadth")
        return Strategy::BreadthFirst;
    if (lower == "dfo" || lower == "depth-first" || lower == "depth")
        return Strategy::DepthFirst;
    if (lower == "fifo" || lower == "basic")
        return Strategy::Fifo;
    if (lower == "feedback")
        return Strategy::Feedback;
    return std::nullopt;
}

const char* to_string(Strategy strategy) {
    switch (strategy) {
        case Strategy::BreadthFirst: return "bfo";
        case Strategy::DepthFirst: return "dfo";
        case Strategy::Fifo: return "fifo";
        case Strategy::Feedback: return "feedback";
    }
    return "bfo";
}

const char* to_string(Admission admission) {
    switch (admission) {
        case Admission::Admitted: return "admitted";
        case Admission::DuplicateFingerprint: return "duplicate";
        case Admission::DepthExceeded: return "depth-exceeded";
        case Admission::FilteredByRule: return "filtered";
    }
    return "unknown";
}

Scheduler::Scheduler(SchedulerConfig config, std::shared_ptr<Download::AutoThrottle> throttle)
    : config_(std::move(config)), throttle_(std::move(throttle)) {
    for (auto& domain : config_.allowed_domains)
        domain = Utils::Text::to_lower(domain);

    for (const auto& pattern : config_.deny_patterns) {
        try {
            deny_.emplace_back(pattern);
        } catch (const std::regex_error& e) {
            throw Core::ConfigError("Invalid deny pattern '" + pattern + "': " + e.what());
        }
    }
}

double Scheduler::base_priority(const Core::Request& request) const {
    auto depth = static_cast<double>(request.depth);
    switch (config_.strategy) {
        case Strategy::DepthFirst: return depth + request.priority;
        case Strategy::Fifo: return request.priority;
        case Strategy::BreadthFirst:
        case Strategy::Feedback:
        default: return -depth + request.priority;
    }
}

bool Scheduler::passes_filters(const std::string& url, const std::string& host) const {
    if (!Utils::Url::is_http(url))
        return false;

    if (!config_.allowed_domains.empty()) {
        std::string bare = host.substr(0, host.find(':'));
        bool        allowed =
            std::any_of(config_.allowed_domains.begin(),
                        config_.allowed_domains.end(),
                        [&](const std::string& domain) {
                            return bare == domain || Utils::Text::ends_with(bare, "." + domain);
                        });
        if (!allowed)
            return false;
    }

    return std::none_of(deny_.begin(), deny_.end(), [&](const std::regex& re) {
        return std::regex_search(url, re);
    });
}

Admission Scheduler::admit(Core::Request request) {
    request.url      = Utils::Url::strip_fragment(request.url);
    std::string host = Utils::Url::host_key(request.url);

    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.max_depth >= 0 && request.depth > static_cast<unsigned>(config_.max_depth)) {
        stats_.depth_exceeded++;
        return Admission::DepthExceeded;
    }

    if (closed_ || !passes_filters(request.url, host)) {
        stats_.filtered++;
        return Admission::FilteredByRule;
    }

    std::string fp    = fingerprint(request);
    bool        fresh = seen_.insert(fp);
    if (!fresh) {
        if (!request.dont_filter) {
            stats_.duplicates++;
            return Admission::DuplicateFingerprint;
        }
        stats_.forced++;
        Logger::debug("Scheduler: forced re-admission of " + request.url);
    }

    FrontierEntry entry;
    entry.priority         = base_priority(request);
    entry.request          = std::move(request);
    entry.request.priority = entry.priority;
    entry.sequence         = sequence_++;
    entry.fingerprint      = std::move(fp);
    entry.host             = std::move(host);
    frontier_.push(std::move(entry));

    stats_.admitted++;
    return Admission::Admitted;
}

size_t Scheduler::admit_all(std::vector<Core::Request> requests) {
    size_t admitted = 0;
    for (auto& request : requests) {
        if (admit(std::move(request)) == Admission::Admitted)
            admitted++;
    }
    return admitted;
}

milliseconds Scheduler::host_delay(const std::string& host) const {
    return throttle_ ? throttle_->delay(host) : milliseconds(0);
}

int Scheduler::host_limit(const std::string& host) const {
    // A throttled host is dispatched one request at a time so the delay holds between fetches.
    if (host_delay(host) > milliseconds(0))
        return 1;
    return config_.per_host_concurrency;
}

bool Scheduler::host_eligible(const std::string& host, Clock::time_point now) const {
    auto it = hosts_.find(host);
    if (it == hosts_.end())
        return true;

    const HostState& state = it->second;
    int              limit = host_limit(host);
    if (limit > 0 && state.in_flight >= limit)
        return false;
    if (state.dispatched_once && now < state.last_dispatch + host_delay(host))
        return false;
    return now >= state.backoff_until;
}

double Scheduler::host_adjustment(const std::string& host) const {
    auto it = hosts_.find(host);
    if (it == hosts_.end())
        return 0.0;

    double adjustment = 0.0;
    if (config_.strategy == Strategy::Feedback)
        adjustment -= it->second.penalty;
    if (it->second.degraded)
        adjustment -= config_.degraded_penalty;
    return adjustment;
}

std::optional<Core::Request> Scheduler::next(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto entry = frontier_.pop_best([&](const std::string& host) { return host_eligible(host, now); },
                                    [&](const std::string& host) { return host_adjustment(host); });
    if (!entry)
        return std::nullopt;

    HostState& state = hosts_[entry->host];
    state.in_flight++;
    state.dispatched_once = true;
    state.last_dispatch   = now;

    in_flight_++;
    stats_.dispatched++;
    return std::move(entry->request);
}

std::optional<milliseconds> Scheduler::time_until_ready(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<milliseconds> soonest;
    frontier_.for_each_host([&](const std::string& host, size_t /*pending*/) {
        auto it = hosts_.find(host);
        if (it == hosts_.end()) {
            soonest = milliseconds(0);
            return;
        }

        const HostState& state = it->second;
        int              limit = host_limit(host);
        if (limit > 0 && state.in_flight >= limit)
            return;  // becomes ready on completion, not on a timer

        Clock::time_point ready = state.backoff_until;
        if (state.dispatched_once)
            ready = std::max(ready, state.last_dispatch + host_delay(host));

        milliseconds wait = ready > now
                                ? std::chrono::duration_cast<milliseconds>(ready - now)
                                : milliseconds(0);
        if (!soonest || wait < *soonest)
            soonest = wait;
    });
    return soonest;
}

void Scheduler::report_outcome(const Core::Request& request,
                               const OutcomeReport& outcome,
                               Clock::time_point    now) {
    std::string host = Utils::Url::host_key(request.url);

    std::lock_guard<std::mutex> lock(mutex_);
    HostState&                  state = hosts_[host];

    if (state.in_flight <= 0 || in_flight_ == 0) {
        Logger::warn("Scheduler: outcome reported for a request not in flight: " + request.url);
        return;
    }
    state.in_flight--;
    in_flight_--;
    stats_.completed++;

    auto latency_ms       = static_cast<double>(outcome.latency.count());
    state.latency_ewma_ms = state.latency_ewma_ms == 0.0
                                ? latency_ms
                                : LATENCY_ALPHA * latency_ms
                                      + (1.0 - LATENCY_ALPHA) * state.latency_ewma_ms;

    if (Core::is_retryable(outcome.status)) {
        state.consecutive_failures++;
        state.penalty += Core::Constants::FEEDBACK_FAILURE_PENALTY;

        if (state.consecutive_failures >= config_.degraded_threshold) {
            if (!state.degraded)
                Logger::warn("Scheduler: host degraded after "
                             + std::to_string(state.consecutive_failures)
                             + " consecutive failures: " + host);
            state.degraded = true;
            int  step      = state.consecutive_failures - config_.degraded_threshold + 1;
            auto backoff   = Core::get_backoff_time(
                step, config_.host_backoff_base, config_.host_backoff_max);
            state.backoff_until = now + backoff;
        }
        return;
    }

    state.consecutive_failures = 0;
    if (state.degraded)
        Logger::info("Scheduler: host recovered: " + host);
    state.degraded      = false;
    state.backoff_until = Clock::time_point{};

    if (outcome.latency > config_.slow_threshold)
        state.penalty += Core::Constants::FEEDBACK_SLOW_PENALTY;
    else
        state.penalty *= Core::Constants::FEEDBACK_PENALTY_DECAY;
}

void Scheduler::begin_task() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_++;
}

void Scheduler::end_task() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_ == 0) {
        Logger::warn("Scheduler: end_task() without a matching begin_task()");
        return;
    }
    pending_--;
}

size_t Scheduler::pending_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

bool Scheduler::is_quiescent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frontier_.empty() && in_flight_ == 0 && pending_ == 0;
}

bool Scheduler::is_degraded(const std::string& host) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = hosts_.find(host);
    return it != hosts_.end() && it->second.degraded;
}

void Scheduler::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool Scheduler::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

SchedulerStats Scheduler::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SchedulerStats              out = stats_;
    out.frontier_size               = frontier_.size();
    out.in_flight                   = in_flight_;
    out.pending_tasks               = pending_;
    out.seen                        = seen_.size();
    out.degraded_hosts              = static_cast<size_t>(
        std::count_if(hosts_.begin(), hosts_.end(), [](const auto& h) { return h.second.degraded; }));
    return out;
}

}  // namespace Scheduling
}  // namespace Vortex
