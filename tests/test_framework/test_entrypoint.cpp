// tests/test_framework/test_entrypoint.cpp
/**
 * @file test_entrypoint.cpp
 * @brief Main entry point shared by the test executables.
 *
 * Starts the lifecycle modules the bus needs (Logger, FileLock, CryptoUtils,
 * CatalogStore) once for the whole executable, then runs GoogleTest. Tests must
 * not initialize or finalize the lifecycle themselves.
 */
#include "abus_bus.hpp"

#include <gtest/gtest.h>

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    artbus::utils::LifecycleGuard test_lifecycle(artbus::utils::make_module_list(
        artbus::utils::Logger::GetLifecycleModule(), artbus::utils::FileLock::GetLifecycleModule(),
        artbus::crypto::GetLifecycleModule(), artbus::bus::CatalogStore::GetLifecycleModule()));

    // Keep test output readable; tests that inspect logs raise the level themselves.
    artbus::utils::Logger::instance().set_level(artbus::utils::Logger::Level::L_WARNING);

    return RUN_ALL_TESTS();
}
