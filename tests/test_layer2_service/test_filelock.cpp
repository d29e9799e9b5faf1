/**
 * @file test_filelock.cpp
 * @brief Layer 2 single-process tests for FileLock.
 *
 * The catalog lease relies on FileLock for its short critical section, so
 * exclusivity within one process (several daemons' threads in tests) matters
 * as much as across processes.
 */
#include "abus_service.hpp"
#include "shared_test_helpers.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace artbus::utils;
using namespace artbus::tests::helper;
using namespace std::chrono_literals;

TEST(FileLockTest, ModuleIsInitialized)
{
    EXPECT_TRUE(FileLock::lifecycle_initialized());
}

TEST(FileLockTest, BlockingLockIsValid)
{
    TempDir dir("filelock");
    FileLock lock(dir / "catalog.lock", ResourceType::File, LockMode::Blocking);
    ASSERT_TRUE(lock.valid());
    EXPECT_FALSE(lock.error_code());

    const auto held = lock.get_canonical_lock_file_path();
    ASSERT_TRUE(held.has_value());
    EXPECT_TRUE(fs::exists(*held));
}

/**
 * A second non-blocking attempt on a held resource fails immediately and
 * succeeds once the first holder is gone.
 */
TEST(FileLockTest, NonBlockingFailsWhileHeld)
{
    TempDir dir("filelock");
    const fs::path resource = dir / "catalog.lock";
    {
        FileLock first(resource, ResourceType::File, LockMode::Blocking);
        ASSERT_TRUE(first.valid());

        auto second = FileLock::try_lock(resource, ResourceType::File, LockMode::NonBlocking);
        EXPECT_FALSE(second.has_value());
    }
    auto third = FileLock::try_lock(resource, ResourceType::File, LockMode::NonBlocking);
    EXPECT_TRUE(third.has_value());
}

TEST(FileLockTest, TimedLockExpires)
{
    TempDir dir("filelock");
    const fs::path resource = dir / "catalog.lock";
    FileLock first(resource, ResourceType::File, LockMode::Blocking);
    ASSERT_TRUE(first.valid());

    const auto start = std::chrono::steady_clock::now();
    FileLock second(resource, ResourceType::File, 60ms);
    const auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(second.valid());
    EXPECT_TRUE(second.error_code() == std::errc::timed_out);
    EXPECT_GE(waited, 50ms);
    EXPECT_LT(waited, 5s);
}

TEST(FileLockTest, TimedLockSucceedsWhenReleasedInTime)
{
    TempDir dir("filelock");
    const fs::path resource = dir / "catalog.lock";
    auto first = FileLock::try_lock(resource, ResourceType::File, LockMode::Blocking);
    ASSERT_TRUE(first.has_value());

    std::thread releaser(
        [&first]
        {
            std::this_thread::sleep_for(30ms);
            first.reset();
        });
    FileLock second(resource, ResourceType::File, 5s);
    releaser.join();
    EXPECT_TRUE(second.valid());
}

/**
 * Many threads incrementing a counter under the lock never overlap.
 */
TEST(FileLockTest, ThreadsAreMutuallyExclusive)
{
    TempDir dir("filelock");
    const fs::path resource = dir / "counter.lock";
    std::atomic<int> inside{0};
    std::atomic<int> overlaps{0};
    int counter = 0;

    race_threads(8,
                 [&](int)
                 {
                     for (int i = 0; i < 50; ++i)
                     {
                         FileLock lock(resource, ResourceType::File, LockMode::Blocking);
                         ASSERT_TRUE(lock.valid());
                         if (inside.fetch_add(1) != 0)
                             overlaps.fetch_add(1);
                         ++counter;
                         inside.fetch_sub(1);
                     }
                 });

    EXPECT_EQ(overlaps.load(), 0);
    EXPECT_EQ(counter, 8 * 50);
}

TEST(FileLockTest, ExpectedLockNameForFileAndDirectory)
{
    TempDir dir("filelock");
    const auto file_lock = FileLock::get_expected_lock_fullname_for(dir / "a.json", ResourceType::File);
    const auto dir_lock = FileLock::get_expected_lock_fullname_for(dir.path(), ResourceType::Directory);
    EXPECT_FALSE(file_lock.empty());
    EXPECT_FALSE(dir_lock.empty());
    EXPECT_NE(file_lock, dir_lock);
    EXPECT_EQ(file_lock.parent_path(), fs::weakly_canonical(dir.path()));
    EXPECT_EQ(file_lock.filename(), "a.json.lock");
}
