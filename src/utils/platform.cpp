/**
 * @file platform.cpp
 * @brief POSIX process, thread and host queries.
 */
#include "abus_base.hpp"
#include "artbus_version.h"

#include <array>
#include <cerrno>
#include <functional>
#include <thread>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>
#if defined(ARTBUS_PLATFORM_LINUX)
#include <sys/syscall.h>
#endif

namespace artbus::platform
{

uint64_t get_pid()
{
    return static_cast<uint64_t>(::getpid());
}

uint64_t get_native_thread_id() noexcept
{
#if defined(ARTBUS_PLATFORM_LINUX)
    return static_cast<uint64_t>(::syscall(SYS_gettid));
#elif defined(ARTBUS_PLATFORM_APPLE)
    uint64_t tid = 0;
    ::pthread_threadid_np(nullptr, &tid);
    return tid;
#else
    return static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
#endif
}

std::string get_hostname() noexcept
{
    std::array<char, 256> name{};
    if (::gethostname(name.data(), name.size() - 1) != 0 || name[0] == '\0')
    {
        return "localhost";
    }
    return std::string(name.data());
}

const char *get_version_string() noexcept
{
    return ARTBUS_VERSION_STRING;
}

bool is_process_alive(uint64_t pid) noexcept
{
    if (pid == 0)
    {
        return false;
    }
    if (::kill(static_cast<pid_t>(pid), 0) == 0)
    {
        return true;
    }
    return errno == EPERM;
}

} // namespace artbus::platform
