#include "autothrottle.hpp"
#include <algorithm>
#include "../core/logger/logger.hpp"

namespace Vortex {
namespace Download {

using std::chrono::milliseconds;

AutoThrottle::AutoThrottle(ThrottleConfig config) : config_(config) {
    if (config_.max_delay < config_.min_delay)
        config_.max_delay = config_.min_delay;
    if (config_.decrease_factor <= 0.0 || config_.decrease_factor > 1.0)
        config_.decrease_factor = Core::Constants::THROTTLE_DECREASE_FACTOR;
}

milliseconds AutoThrottle::effective_floor(const HostState& state) const {
    return std::min(std::max(config_.min_delay, state.floor), config_.max_delay);
}

AutoThrottle::HostState& AutoThrottle::state_for(const std::string& host) {
    auto it = hosts_.find(host);
    if (it != hosts_.end())
        return it->second;

    HostState state;
    state.delay = std::clamp(config_.start_delay, config_.min_delay, config_.max_delay);
    return hosts_.emplace(host, state).first->second;
}

void AutoThrottle::observe(const std::string& host, milliseconds latency, bool error) {
    std::lock_guard<std::mutex> lock(mutex_);
    HostState&                  state = state_for(host);

    state.samples++;
    state.error_rate = config_.error_rate_alpha * (error ? 1.0 : 0.0)
                       + (1.0 - config_.error_rate_alpha) * state.error_rate;
    if (!error) {
        double sample         = static_cast<double>(latency.count());
        state.latency_ewma_ms = state.samples == 1 || state.latency_ewma_ms == 0.0
                                    ? sample
                                    : config_.latency_alpha * sample
                                          + (1.0 - config_.latency_alpha) * state.latency_ewma_ms;
    }

    if (!config_.enabled) {
        state.delay = effective_floor(state);
        return;
    }

    milliseconds floor    = effective_floor(state);
    milliseconds previous = state.delay;
    bool         slow     = latency > config_.target_latency;

    if (error || slow) {
        state.delay = std::min(std::max(state.delay, floor) + config_.increase_step,
                               config_.max_delay);
    }
    else if (state.error_rate <= config_.target_error_rate) {
        auto relaxed = milliseconds(
            static_cast<milliseconds::rep>(state.delay.count() * config_.decrease_factor));
        state.delay = std::max(relaxed, floor);
    }
    else {
        state.delay = std::max(state.delay, floor);
    }

    if (state.delay != previous) {
        Core::Logger::debug("AutoThrottle: " + host + " delay " + std::to_string(previous.count())
                            + "ms -> " + std::to_string(state.delay.count()) + "ms");
    }
}

milliseconds AutoThrottle::delay(const std::string& host) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = hosts_.find(host);
    if (it == hosts_.end()) {
        if (!config_.enabled)
            return config_.min_delay;
        return std::clamp(config_.start_delay, config_.min_delay, config_.max_delay);
    }
    if (!config_.enabled)
        return effective_floor(it->second);
    return std::max(it->second.delay, effective_floor(it->second));
}

void AutoThrottle::set_floor(const std::string& host, milliseconds floor) {
    std::lock_guard<std::mutex> lock(mutex_);
    HostState&                  state = state_for(host);
    state.floor                       = std::min(std::max(floor, milliseconds(0)), config_.max_delay);
    state.delay                       = std::max(state.delay, effective_floor(state));
}

std::optional<AutoThrottle::HostSnapshot> AutoThrottle::snapshot(const std::string& host) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = hosts_.find(host);
    if (it == hosts_.end())
        return std::nullopt;

    const HostState& s = it->second;
    return HostSnapshot{.delay           = std::max(s.delay, effective_floor(s)),
                        .floor           = effective_floor(s),
                        .latency_ewma_ms = s.latency_ewma_ms,
                        .error_rate      = s.error_rate,
                        .samples         = s.samples};
}

}  // namespace Download
}  // namespace Vortex
