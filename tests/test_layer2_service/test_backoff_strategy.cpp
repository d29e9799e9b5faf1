/**
 * @file test_backoff_strategy.cpp
 * @brief Layer 2 tests for the retry backoff strategies.
 *
 * The catalog lease retries on CappedExponentialBackoff, so its schedule is
 * checked exactly. Sleeping strategies only get loose timing bounds.
 */
#include "abus_service.hpp"
#include <gtest/gtest.h>
#include <chrono>

using namespace artbus::utils;
using namespace std::chrono_literals;

namespace
{
template <BackoffStrategy S> std::chrono::microseconds time_one_wait(const S &strategy, int attempt)
{
    const auto before = std::chrono::steady_clock::now();
    strategy(attempt);
    return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() -
                                                                 before);
}
} // namespace

TEST(BackoffStrategyTest, LeaseScheduleDoublesUpToCap)
{
    const CappedExponentialBackoff lease;
    const std::chrono::milliseconds expected[] = {5ms, 10ms, 20ms, 40ms, 80ms, 160ms, 250ms, 250ms};
    for (int attempt = 0; attempt < 8; ++attempt)
    {
        EXPECT_EQ(lease.delay_for(attempt), expected[attempt]) << "attempt " << attempt;
    }
    EXPECT_EQ(lease.delay_for(1000), 250ms);
}

TEST(BackoffStrategyTest, HugeAttemptDoesNotOverflow)
{
    const CappedExponentialBackoff backoff(1ms, 4ms);
    EXPECT_EQ(backoff.delay_for(0), 1ms);
    EXPECT_EQ(backoff.delay_for(2), 4ms);
    EXPECT_EQ(backoff.delay_for(1 << 30), 4ms);
}

TEST(BackoffStrategyTest, CappedSleepsAtLeastItsDelay)
{
    const CappedExponentialBackoff backoff(2ms, 8ms);
    EXPECT_GE(time_one_wait(backoff, 1), 4ms);
}

TEST(BackoffStrategyTest, NoBackoffReturnsAtOnce)
{
    const NoBackoff none;
    for (int attempt = 0; attempt < 100; ++attempt)
    {
        EXPECT_LT(time_one_wait(none, attempt), 20ms);
    }
}

TEST(BackoffStrategyTest, ShortBackoffStartsByYielding)
{
    const ExponentialBackoff quick;
    for (int attempt = 0; attempt < ExponentialBackoff::kYieldAttempts; ++attempt)
    {
        EXPECT_LT(time_one_wait(quick, attempt), 20ms);
    }
    EXPECT_GE(time_one_wait(quick, 100), 1ms);
}
