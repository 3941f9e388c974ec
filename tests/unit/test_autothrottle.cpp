#include <gtest/gtest.h>
#include "../../src/downloader/autothrottle.hpp"

using namespace Vortex::Download;
using std::chrono::milliseconds;

namespace {

ThrottleConfig bounded() {
    ThrottleConfig config;
    config.start_delay     = milliseconds(0);
    config.min_delay       = milliseconds(0);
    config.max_delay       = milliseconds(1000);
    config.increase_step   = milliseconds(250);
    config.decrease_factor = 0.5;
    config.target_latency  = milliseconds(500);
    return config;
}

}  // namespace

TEST(AutoThrottleTest, UnknownHostStartsAtClampedStartDelay) {
    ThrottleConfig config = bounded();
    config.start_delay    = milliseconds(5000);
    AutoThrottle throttle(config);
    EXPECT_EQ(throttle.delay("example.com"), milliseconds(1000));
    EXPECT_FALSE(throttle.snapshot("example.com").has_value());
}

TEST(AutoThrottleTest, ErrorsIncreaseUpToMax) {
    AutoThrottle throttle(bounded());
    throttle.observe("a.com", milliseconds(10), true);
    EXPECT_EQ(throttle.delay("a.com"), milliseconds(250));
    throttle.observe("a.com", milliseconds(10), true);
    EXPECT_EQ(throttle.delay("a.com"), milliseconds(500));

    for (int i = 0; i < 10; ++i)
        throttle.observe("a.com", milliseconds(10), true);
    EXPECT_EQ(throttle.delay("a.com"), milliseconds(1000));

    // Other hosts are unaffected.
    EXPECT_EQ(throttle.delay("b.com"), milliseconds(0));
}

TEST(AutoThrottleTest, SlowResponsesCountAsUnhealthy) {
    AutoThrottle throttle(bounded());
    throttle.observe("a.com", milliseconds(900), false);
    EXPECT_EQ(throttle.delay("a.com"), milliseconds(250));
}

TEST(AutoThrottleTest, HighErrorRateHoldsDelay) {
    AutoThrottle throttle(bounded());
    throttle.observe("a.com", milliseconds(10), true);
    throttle.observe("a.com", milliseconds(10), true);
    ASSERT_EQ(throttle.delay("a.com"), milliseconds(500));

    // The error-rate EWMA stays above the target for a few healthy samples.
    throttle.observe("a.com", milliseconds(10), false);
    EXPECT_EQ(throttle.delay("a.com"), milliseconds(500));

    int healthy = 0;
    while (throttle.delay("a.com") == milliseconds(500) && healthy < 50) {
        throttle.observe("a.com", milliseconds(10), false);
        healthy++;
    }
    EXPECT_LT(healthy, 50);
    EXPECT_EQ(throttle.delay("a.com"), milliseconds(250));
    EXPECT_LE(throttle.snapshot("a.com")->error_rate, throttle.config().target_error_rate);
}

TEST(AutoThrottleTest, DelayMovesMonotonicallyWithHealth) {
    AutoThrottle throttle(bounded());
    const bool   pattern[] = {true, false, true, true, false, false, false, true,
                              false, false, false, false, false, false, true, false};

    milliseconds previous = throttle.delay("a.com");
    for (bool error : pattern) {
        throttle.observe("a.com", milliseconds(20), error);
        milliseconds current = throttle.delay("a.com");
        if (error)
            EXPECT_GE(current, previous);
        else
            EXPECT_LE(current, previous);
        EXPECT_GE(current, milliseconds(0));
        EXPECT_LE(current, milliseconds(1000));
        previous = current;
    }
}

TEST(AutoThrottleTest, FloorFromCrawlDelay) {
    AutoThrottle throttle(bounded());
    throttle.set_floor("a.com", milliseconds(400));
    EXPECT_EQ(throttle.delay("a.com"), milliseconds(400));

    for (int i = 0; i < 20; ++i)
        throttle.observe("a.com", milliseconds(10), false);
    EXPECT_EQ(throttle.delay("a.com"), milliseconds(400));

    // Crawl-delay beyond max_delay is clamped.
    throttle.set_floor("b.com", milliseconds(10000));
    EXPECT_EQ(throttle.delay("b.com"), milliseconds(1000));
}

TEST(AutoThrottleTest, DisabledPinsToFloor) {
    ThrottleConfig config = bounded();
    config.enabled        = false;
    config.min_delay      = milliseconds(100);
    AutoThrottle throttle(config);

    for (int i = 0; i < 5; ++i)
        throttle.observe("a.com", milliseconds(10), true);
    EXPECT_EQ(throttle.delay("a.com"), milliseconds(100));

    auto snap = throttle.snapshot("a.com");
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->samples, 5u);
    EXPECT_GT(snap->error_rate, 0.5);
}

TEST(AutoThrottleTest, InvalidBoundsAreRepaired) {
    ThrottleConfig config  = bounded();
    config.min_delay       = milliseconds(300);
    config.max_delay       = milliseconds(100);
    config.decrease_factor = 2.0;
    AutoThrottle throttle(config);

    EXPECT_EQ(throttle.config().max_delay, milliseconds(300));
    EXPECT_DOUBLE_EQ(throttle.config().decrease_factor, 0.5);
    EXPECT_EQ(throttle.delay("a.com"), milliseconds(300));
}
