#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "../core/types/constants.hpp"

namespace Vortex {
namespace Download {

struct ThrottleConfig {
    bool                      enabled = true;
    std::chrono::milliseconds start_delay{Core::Constants::THROTTLE_START_DELAY_MS};
    std::chrono::milliseconds min_delay{Core::Constants::THROTTLE_MIN_DELAY_MS};
    std::chrono::milliseconds max_delay{Core::Constants::THROTTLE_MAX_DELAY_MS};
    std::chrono::milliseconds increase_step{Core::Constants::THROTTLE_INCREASE_STEP_MS};
    double                    decrease_factor = Core::Constants::THROTTLE_DECREASE_FACTOR;
    std::chrono::milliseconds target_latency{Core::Constants::THROTTLE_TARGET_LATENCY_MS};
    double                    target_error_rate = Core::Constants::THROTTLE_TARGET_ERROR_RATE;
    double                    error_rate_alpha  = Core::Constants::THROTTLE_ERROR_RATE_ALPHA;
    double                    latency_alpha     = Core::Constants::THROTTLE_LATENCY_ALPHA;
};

/**
 * @brief Per-host AIMD controller for the delay between two dispatches.
 *
 * An observation is unhealthy when it is an error or slower than
 * target_latency; the delay then grows by increase_step up to max_delay. A
 * healthy observation shrinks the delay by decrease_factor down to the floor,
 * which is max(min_delay, robots crawl-delay of the host). While the host's
 * error-rate EWMA is above target_error_rate a healthy observation leaves the
 * delay unchanged.
 *
 * When disabled the delay is pinned to the floor.
 */
class AutoThrottle {
public:
    struct HostSnapshot {
        std::chrono::milliseconds delay{0};
        std::chrono::milliseconds floor{0};
        double                    latency_ewma_ms = 0.0;
        double                    error_rate      = 0.0;
        size_t                    samples         = 0;
    };

    explicit AutoThrottle(ThrottleConfig config = {});

    void observe(const std::string& host, std::chrono::milliseconds latency, bool error);

    std::chrono::milliseconds delay(const std::string& host) const;

    // robots.txt Crawl-delay, clamped to max_delay.
    void set_floor(const std::string& host, std::chrono::milliseconds floor);

    std::optional<HostSnapshot> snapshot(const std::string& host) const;
    const ThrottleConfig&       config() const {
        return config_;
    }

private:
    struct HostState {
        std::chrono::milliseconds delay{0};
        std::chrono::milliseconds floor{0};
        double                    latency_ewma_ms = 0.0;
        double                    error_rate      = 0.0;
        size_t                    samples         = 0;
    };

    HostState&                state_for(const std::string& host);
    std::chrono::milliseconds effective_floor(const HostState& state) const;

    ThrottleConfig                   config_;
    mutable std::mutex               mutex_;
    std::map<std::string, HostState> hosts_;
};

}  // namespace Download
}  // namespace Vortex
