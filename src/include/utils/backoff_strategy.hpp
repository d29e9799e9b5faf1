#pragma once
/**
 * @file backoff_strategy.hpp
 * @brief Waits between attempts of a retry loop.
 *
 * A strategy is called as `strategy(attempt)` with a zero-based attempt number
 * and waits before the next try. Two are used by the bus:
 *  - CappedExponentialBackoff for catalog lease acquisition.
 *  - ExponentialBackoff for short transient failures (a rename hitting EBUSY).
 * NoBackoff lets tests drive retry loops without waiting.
 */
#include <algorithm>
#include <chrono>
#include <concepts>
#include <thread>

namespace artbus::utils
{

template <typename S>
concept BackoffStrategy = std::invocable<const S &, int>;

/// Yields for the first attempts, then sleeps `10 * attempt` microseconds.
struct ExponentialBackoff
{
    static constexpr int kYieldAttempts = 4;

    void operator()(int attempt) const noexcept
    {
        if (attempt < kYieldAttempts)
        {
            std::this_thread::yield();
            return;
        }
        std::this_thread::sleep_for(std::chrono::microseconds(10L * attempt));
    }
};

/// `initial`, then doubling on each attempt, never above `cap`.
struct CappedExponentialBackoff
{
    std::chrono::milliseconds initial{5};
    std::chrono::milliseconds cap{250};

    CappedExponentialBackoff() = default;
    CappedExponentialBackoff(std::chrono::milliseconds first, std::chrono::milliseconds ceiling)
        : initial(first), cap(ceiling)
    {
    }

    /// Delay before retry `attempt`; callers use it to clamp a sleep to a deadline.
    [[nodiscard]] std::chrono::milliseconds delay_for(int attempt) const noexcept
    {
        std::chrono::milliseconds delay = initial;
        while (attempt-- > 0 && delay < cap)
        {
            delay *= 2;
        }
        return std::min(delay, cap);
    }

    void operator()(int attempt) const noexcept { std::this_thread::sleep_for(delay_for(attempt)); }
};

struct NoBackoff
{
    void operator()(int) const noexcept {}
};

static_assert(BackoffStrategy<ExponentialBackoff>);
static_assert(BackoffStrategy<CappedExponentialBackoff>);
static_assert(BackoffStrategy<NoBackoff>);

} // namespace artbus::utils
