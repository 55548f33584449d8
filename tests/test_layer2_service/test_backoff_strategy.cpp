// tests/test_layer2_service/test_backoff_strategy.cpp
/**
 * @file test_backoff_strategy.cpp
 * @brief Layer 2 tests for ReconnectBackoff and ReadinessBackoff.
 *
 * The policies only compute delays, so every test calls delay_for() directly and
 * nothing sleeps.
 */
#include "test_entrypoint.h"
#include "utils/backoff_strategy.hpp"

#include <chrono>
#include <climits>

using namespace testrelay::utils;
using namespace std::chrono_literals;

// ============================================================================
// ReconnectBackoff
// ============================================================================

TEST(BackoffStrategyTest, Reconnect_FirstAttemptIsImmediate)
{
    ReconnectBackoff backoff;
    EXPECT_EQ(backoff.delay_for(1), 0s);
    EXPECT_EQ(backoff.delay_for(0), 0s);
    EXPECT_EQ(backoff.delay_for(-3), 0s);
}

TEST(BackoffStrategyTest, Reconnect_DoublesThenCaps)
{
    ReconnectBackoff backoff{30s};
    EXPECT_EQ(backoff.delay_for(2), 2s);
    EXPECT_EQ(backoff.delay_for(3), 4s);
    EXPECT_EQ(backoff.delay_for(4), 8s);
    EXPECT_EQ(backoff.delay_for(5), 16s);
    EXPECT_EQ(backoff.delay_for(6), 30s);
    EXPECT_EQ(backoff.delay_for(10), 30s);
}

TEST(BackoffStrategyTest, Reconnect_HugeAttemptDoesNotOverflow)
{
    ReconnectBackoff backoff{30s};
    EXPECT_EQ(backoff.delay_for(64), 30s);
    EXPECT_EQ(backoff.delay_for(INT_MAX), 30s);
}

TEST(BackoffStrategyTest, Reconnect_ZeroCapNeverWaits)
{
    ReconnectBackoff backoff{0s};
    for (int attempt = 1; attempt < 12; ++attempt)
    {
        EXPECT_EQ(backoff.delay_for(attempt), 0s) << "attempt " << attempt;
    }
}

// ============================================================================
// ReadinessBackoff
// ============================================================================

TEST(BackoffStrategyTest, Readiness_DefaultSchedule)
{
    ReadinessBackoff backoff;
    EXPECT_EQ(backoff.delay_for(1), 500ms);
    EXPECT_EQ(backoff.delay_for(2), 1000ms);
    EXPECT_EQ(backoff.delay_for(3), 2000ms);
    EXPECT_EQ(backoff.delay_for(4), 4000ms);
    EXPECT_EQ(backoff.delay_for(6), 16000ms);
    EXPECT_EQ(backoff.delay_for(7), 30000ms);
    EXPECT_EQ(backoff.delay_for(8), 30000ms);
    EXPECT_EQ(backoff.delay_for(1000), 30000ms);
}

TEST(BackoffStrategyTest, Readiness_CustomBaseAndCap)
{
    ReadinessBackoff backoff{10ms, 50ms};
    EXPECT_EQ(backoff.delay_for(0), 10ms);
    EXPECT_EQ(backoff.delay_for(1), 10ms);
    EXPECT_EQ(backoff.delay_for(2), 20ms);
    EXPECT_EQ(backoff.delay_for(3), 40ms);
    EXPECT_EQ(backoff.delay_for(4), 50ms);
}
