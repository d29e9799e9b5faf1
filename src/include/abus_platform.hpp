#pragma once
/**
 * @file abus_platform.hpp
 * @brief Layer 0: platform detection and the few OS queries the bus needs.
 *
 * The commit protocol depends on POSIX rename, link and flock semantics, so only
 * POSIX targets are accepted.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(__linux__)
#define ARTBUS_PLATFORM_LINUX 1
#elif defined(__APPLE__) && defined(__MACH__)
#define ARTBUS_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define ARTBUS_PLATFORM_FREEBSD 1
#else
#error "artbus builds on Linux, macOS or FreeBSD only"
#endif

#if __cplusplus < 202002L
#error "artbus needs C++20"
#endif

#include "artbus_export.h"

namespace artbus::platform
{

/// Kernel thread id of the caller (the tid `ps -L` shows on Linux).
ARTBUS_EXPORT uint64_t get_native_thread_id() noexcept;

ARTBUS_EXPORT uint64_t get_pid();

/// Host name, or "localhost" if it cannot be read. Recorded in lock holder records.
ARTBUS_EXPORT std::string get_hostname() noexcept;

/// Package version, e.g. "0.3.1".
ARTBUS_EXPORT const char *get_version_string() noexcept;

/**
 * @brief True if a process with this pid exists. A process owned by another
 *        user counts as alive; pid 0 never does.
 */
ARTBUS_EXPORT bool is_process_alive(uint64_t pid) noexcept;

} // namespace artbus::platform
