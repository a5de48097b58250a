#pragma once
/**
 * @file backoff_strategy.hpp
 * @brief Header-only backoff strategies for retry loops.
 *
 * Strategies are small callables taking the 0-based attempt number. The
 * handshake client uses ExponentialBackoff between registration attempts;
 * a zero base turns the sleep into a yield, which keeps retry tests fast.
 */
#include <algorithm>
#include <chrono>
#include <thread>

namespace gwbridge::utils
{

/**
 * @brief Doubling backoff with an upper bound.
 *
 * Sleeps `base * 2^iteration`, clamped to `cap`:
 * - base=200ms, cap=5s: 200ms, 400ms, 800ms, 1.6s, 3.2s, 5s, 5s, ...
 *
 * @example
 * ExponentialBackoff backoff{std::chrono::milliseconds(200), std::chrono::seconds(5)};
 * for (int attempt = 0; !try_connect(); ++attempt) {
 *     if (attempt + 1 >= max_attempts) { give_up(); break; }
 *     backoff(attempt);
 * }
 */
struct ExponentialBackoff
{
    std::chrono::milliseconds base{200};
    std::chrono::milliseconds cap{std::chrono::seconds(5)};

    [[nodiscard]] std::chrono::milliseconds delay_for(int iteration) const noexcept
    {
        if (base.count() <= 0)
            return std::chrono::milliseconds(0);
        // Past 2^20 every realistic base is already beyond the cap.
        const int shift = std::clamp(iteration, 0, 20);
        const auto scaled = base * (1LL << shift);
        return std::min<std::chrono::milliseconds>(scaled, cap);
    }

    void operator()(int iteration) const noexcept
    {
        const auto delay = delay_for(iteration);
        if (delay.count() > 0)
            std::this_thread::sleep_for(delay);
        else
            std::this_thread::yield();
    }
};

} // namespace gwbridge::utils
