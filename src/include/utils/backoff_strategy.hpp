#pragma once
/**
 * @file backoff_strategy.hpp
 * @brief Header-only backoff policies for reconnect and readiness loops.
 *
 * Policies only compute delays; the caller decides how to wait (usually on a
 * condition variable so that stop() can cut the wait short).
 *
 * Usage Scenarios:
 * - ConnectionSupervisor: ReconnectBackoff (event channel reconnect)
 * - ConnectionSupervisor: ReadinessBackoff (waiting for a healthy dispatcher)
 * - Unit Tests: call delay_for() directly, no sleeping involved
 */
#include <algorithm>
#include <chrono>
#include <cstdint>

namespace testrelay::utils
{

/**
 * @brief Capped power-of-two backoff for event channel reconnection.
 * @details The first attempt after a disconnect is immediate; attempt N (N >= 2)
 *          waits 2^(N-1) seconds, capped at max_delay.
 *
 * Delay at attempt N with max_delay = 30s:
 * - N=1: 0s
 * - N=2: 2s
 * - N=3: 4s
 * - N=5: 16s
 * - N=6+: 30s
 *
 * @example
 * ReconnectBackoff backoff{std::chrono::seconds(30)};
 * auto wait = backoff.delay_for(attempts); // attempts already incremented
 */
struct ReconnectBackoff
{
    std::chrono::seconds max_delay{30};

    /**
     * @param attempt 1-based reconnect attempt number.
     */
    [[nodiscard]] std::chrono::seconds delay_for(int attempt) const noexcept
    {
        if (attempt <= 1)
        {
            return std::chrono::seconds{0};
        }
        // 2^(attempt-1) overflows long before the cap matters; clamp the exponent.
        const int exponent = std::min(attempt - 1, 30);
        const auto raw = std::chrono::seconds{int64_t{1} << exponent};
        return std::min(raw, max_delay);
    }
};

/**
 * @brief Exponential backoff with a fractional base for readiness checks.
 * @details Attempt N waits base * 2^(N-1), capped at max_delay. Used while waiting
 *          for the dispatcher to answer health checks before the first subscribe.
 *
 * Delay at attempt N with the defaults (base 500ms, cap 30s):
 * - N=1: 0.5s
 * - N=2: 1s
 * - N=4: 4s
 * - N=8+: 30s
 */
struct ReadinessBackoff
{
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{30000};

    [[nodiscard]] std::chrono::milliseconds delay_for(int attempt) const noexcept
    {
        const int exponent = std::clamp(attempt - 1, 0, 30);
        const auto raw = base_delay * (int64_t{1} << exponent);
        return std::min<std::chrono::milliseconds>(raw, max_delay);
    }
};

} // namespace testrelay::utils
