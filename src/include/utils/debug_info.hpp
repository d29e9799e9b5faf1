/**
 * @file debug_info.hpp
 * @brief ABUS_PANIC and ABUS_DEBUG: stderr diagnostics that bypass the Logger.
 *
 * Both work before the lifecycle has started and after it has stopped. A panic
 * prints its location, the message and a stack trace, then aborts.
 */
#pragma once

#include <cstdio>
#include <fmt/format.h>
#include <source_location>
#include <string_view>
#include <utility>

#include "artbus_export.h"

namespace artbus::debug
{

/// Prints the current call stack to stderr, symbolized where `dladdr` can.
ARTBUS_EXPORT void print_stack_trace() noexcept;

/// Writes the panic report for `body` and aborts.
[[noreturn]] ARTBUS_EXPORT void abort_with(const std::source_location &loc,
                                           std::string_view body) noexcept;

template <typename... Args>
[[noreturn]] void panic(const std::source_location &loc, fmt::format_string<Args...> fmt_str,
                        Args &&...args) noexcept
{
    try
    {
        abort_with(loc, fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    catch (const std::exception &e)
    {
        abort_with(loc, e.what());
    }
}

template <typename... Args>
void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, "[DBG]  {}\n", fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  unformattable message: %s\n", e.what());
    }
}

} // namespace artbus::debug

#ifndef ABUS_PANIC
#define ABUS_PANIC(fmt, ...)                                                                       \
    ::artbus::debug::panic(std::source_location::current(), FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

#ifndef ABUS_DEBUG
#if defined(ARTBUS_ENABLE_DEBUG_MESSAGES)
#define ABUS_DEBUG(fmt, ...) ::artbus::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define ABUS_DEBUG(fmt, ...)                                                                       \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
