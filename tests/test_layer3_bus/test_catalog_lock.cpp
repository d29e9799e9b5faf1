/**
 * @file test_catalog_lock.cpp
 * @brief Catalog lease: exclusivity, bounded waiting, release and stale reclaim.
 */
#include "abus_bus.hpp"
#include "shared_test_helpers.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace artbus;
using namespace artbus::bus;
using namespace artbus::tests::helper;
using namespace std::chrono_literals;
using nlohmann::json;

TEST(CatalogLockTest, AcquireWritesHolderAndReleaseRemovesIt)
{
    TempDir dir("catlock");
    CatalogLock lock(dir / "catalog.lock");
    {
        auto lease = lock.acquire(1s);
        ASSERT_TRUE(lease.is_ok()) << lease.error_message();
        EXPECT_TRUE(lease.content().held());
        EXPECT_TRUE(lease.content().issued_by(lock));

        auto holder = lock.holder();
        ASSERT_TRUE(holder.has_value());
        EXPECT_EQ(holder->pid, platform::get_pid());
        EXPECT_EQ(holder->token, lease.content().token());
        EXPECT_FALSE(holder->acquired_at.empty());
    }
    EXPECT_FALSE(fs::exists(dir / "catalog.lock"));
    EXPECT_FALSE(lock.holder().has_value());
}

/**
 * A second acquirer gives up after its timeout with LockTimeout naming the holder.
 */
TEST(CatalogLockTest, SecondAcquirerTimesOut)
{
    TempDir dir("catlock");
    CatalogLock first(dir / "catalog.lock");
    CatalogLock second(dir / "catalog.lock");

    auto held = first.acquire(1s);
    ASSERT_TRUE(held.is_ok());

    const auto start = std::chrono::steady_clock::now();
    auto blocked = second.acquire(150ms);
    const auto waited = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(blocked.is_error());
    EXPECT_EQ(blocked.error(), BusError::LockTimeout);
    EXPECT_NE(blocked.error_message().find(std::to_string(platform::get_pid())), std::string::npos)
        << blocked.error_message();
    EXPECT_GE(waited, 140ms);
    EXPECT_LT(waited, 3s);
}

/**
 * A backoff step longer than the timeout is cut short at the deadline.
 */
TEST(CatalogLockTest, BackoffSleepIsClampedToDeadline)
{
    TempDir dir("catlock");
    CatalogLock first(dir / "catalog.lock");
    CatalogLock second(dir / "catalog.lock");
    second.set_backoff(utils::CappedExponentialBackoff(2s, 2s));

    auto held = first.acquire(1s);
    ASSERT_TRUE(held.is_ok());

    const auto start = std::chrono::steady_clock::now();
    auto blocked = second.acquire(100ms);
    const auto waited = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(blocked.is_error());
    EXPECT_EQ(blocked.error(), BusError::LockTimeout);
    EXPECT_LT(waited, 1s);
}

TEST(CatalogLockTest, WaiterSucceedsAfterRelease)
{
    TempDir dir("catlock");
    CatalogLock first(dir / "catalog.lock");
    CatalogLock second(dir / "catalog.lock");

    auto held = first.acquire(1s);
    ASSERT_TRUE(held.is_ok());
    std::thread releaser(
        [&held]
        {
            std::this_thread::sleep_for(50ms);
            held.content().release();
        });
    auto waited = second.acquire(5s);
    releaser.join();
    ASSERT_TRUE(waited.is_ok()) << waited.error_message();
}

TEST(CatalogLockTest, ReleaseIsIdempotentAndMoveTransfersOwnership)
{
    TempDir dir("catlock");
    CatalogLock lock(dir / "catalog.lock");
    auto acquired = lock.acquire(1s);
    ASSERT_TRUE(acquired.is_ok());

    CatalogLease lease = std::move(acquired).content();
    EXPECT_TRUE(lease.held());
    CatalogLease moved(std::move(lease));
    EXPECT_FALSE(lease.held());
    EXPECT_TRUE(moved.held());
    EXPECT_TRUE(fs::exists(dir / "catalog.lock"));

    moved.release();
    moved.release();
    EXPECT_FALSE(moved.held());
    EXPECT_FALSE(fs::exists(dir / "catalog.lock"));
}

/**
 * A record left by a dead process on this host is reclaimed immediately.
 */
TEST(CatalogLockTest, StaleHolderIsReclaimed)
{
    TempDir dir("catlock");
    LockHolder dead;
    dead.pid = 999999999;
    dead.token = "deadbeefdeadbeefdeadbeefdeadbeef";
    dead.acquired_at = "2026-10-17T00:00:00.000Z";
    dead.host = platform::get_hostname();
    write_file(dir / "catalog.lock", dead.to_json().dump());

    CatalogLock lock(dir / "catalog.lock");
    const auto start = std::chrono::steady_clock::now();
    auto lease = lock.acquire(2s);
    ASSERT_TRUE(lease.is_ok()) << lease.error_message();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(lock.holder()->pid, platform::get_pid());
}

TEST(CatalogLockTest, MalformedRecordIsReclaimed)
{
    TempDir dir("catlock");
    write_file(dir / "catalog.lock", "not json at all");
    CatalogLock lock(dir / "catalog.lock");
    auto lease = lock.acquire(2s);
    ASSERT_TRUE(lease.is_ok()) << lease.error_message();
}

/**
 * A live holder on another host is never treated as stale.
 */
TEST(CatalogLockTest, ForeignHostHolderIsRespected)
{
    TempDir dir("catlock");
    LockHolder other;
    other.pid = 999999999;
    other.token = "0123456789abcdef0123456789abcdef";
    other.host = "some-other-host.invalid";
    write_file(dir / "catalog.lock", other.to_json().dump());

    CatalogLock lock(dir / "catalog.lock");
    auto lease = lock.acquire(100ms);
    ASSERT_TRUE(lease.is_error());
    EXPECT_EQ(lease.error(), BusError::LockTimeout);
}

/**
 * A release that cannot take the guard leaves the record behind. The next
 * acquire through the same CatalogLock reclaims it; other instances still wait.
 */
TEST(CatalogLockTest, RecordOfUnfinishedReleaseIsReclaimedByOwner)
{
    TempDir dir("catlock");
    const fs::path path = dir / "catalog.lock";
    CatalogLock lock(path);
    CatalogLock other(path);

    auto first = lock.acquire(1s);
    ASSERT_TRUE(first.is_ok()) << first.error_message();
    const std::string released_token = first.content().token();
    {
        utils::FileLock blocker(path, utils::ResourceType::File, utils::LockMode::NonBlocking);
        ASSERT_TRUE(blocker.valid()) << blocker.error_code().message();
        first.content().release();
    }
    EXPECT_FALSE(first.content().held());
    ASSERT_TRUE(lock.holder().has_value());
    EXPECT_EQ(lock.holder()->token, released_token);

    auto blocked = other.acquire(100ms);
    ASSERT_TRUE(blocked.is_error());
    EXPECT_EQ(blocked.error(), BusError::LockTimeout);

    const auto start = std::chrono::steady_clock::now();
    auto second = lock.acquire(2s);
    ASSERT_TRUE(second.is_ok()) << second.error_message();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(lock.holder()->token, second.content().token());
    EXPECT_NE(second.content().token(), released_token);

    second.content().release();
    EXPECT_FALSE(fs::exists(path));
}

/**
 * A timeout too large for the clock still waits for the holder instead of
 * failing at once.
 */
TEST(CatalogLockTest, HugeTimeoutStillWaits)
{
    TempDir dir("catlock");
    CatalogLock first(dir / "catalog.lock");
    CatalogLock second(dir / "catalog.lock");

    auto held = first.acquire(1s);
    ASSERT_TRUE(held.is_ok());
    std::thread releaser(
        [&held]
        {
            std::this_thread::sleep_for(100ms);
            held.content().release();
        });
    auto waited = second.acquire(std::chrono::milliseconds::max());
    releaser.join();
    ASSERT_TRUE(waited.is_ok()) << waited.error_message();
}

TEST(CatalogLockTest, HolderFromJsonValidatesFields)
{
    EXPECT_FALSE(LockHolder::from_json(json::object()).has_value());
    EXPECT_FALSE(LockHolder::from_json(json{{"pid", -1}, {"token", "x"}}).has_value());
    EXPECT_FALSE(LockHolder::from_json(json{{"pid", 5}}).has_value());
    auto ok = LockHolder::from_json(json{{"pid", 5}, {"token", "x"}});
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->pid, 5u);
    EXPECT_TRUE(ok->host.empty());
}

/**
 * Threads in one process each holding the lease never overlap.
 */
TEST(CatalogLockTest, LeasesAreMutuallyExclusive)
{
    TempDir dir("catlock");
    CatalogLock lock(dir / "catalog.lock");
    std::atomic<int> inside{0};
    std::atomic<int> overlaps{0};
    std::atomic<int> acquired{0};

    race_threads(4,
                 [&](int)
                 {
                     for (int i = 0; i < 10; ++i)
                     {
                         auto lease = lock.acquire(10s);
                         ASSERT_TRUE(lease.is_ok()) << lease.error_message();
                         if (inside.fetch_add(1) != 0)
                         {
                             overlaps.fetch_add(1);
                         }
                         std::this_thread::sleep_for(1ms);
                         inside.fetch_sub(1);
                         acquired.fetch_add(1);
                     }
                 });

    EXPECT_EQ(overlaps.load(), 0);
    EXPECT_EQ(acquired.load(), 40);
}
