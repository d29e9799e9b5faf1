#pragma once
/**
 * @file format_tools.hpp
 * @brief Timestamp rendering and small fmt helpers shared by the logger and the bus.
 */
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "artbus_export.h"

namespace artbus::format_tools
{

/// Local time, "YYYY-MM-DD HH:MM:SS.uuuuuu". Used for log lines.
ARTBUS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/// UTC, "YYYY-MM-DDTHH:MM:SS.mmmZ". Used in manifests, sidecars and the ledger.
ARTBUS_EXPORT std::string iso8601_utc(std::chrono::system_clock::time_point timestamp);

ARTBUS_EXPORT std::string iso8601_utc_now();

ARTBUS_EXPORT int64_t epoch_millis(std::chrono::system_clock::time_point timestamp) noexcept;

/// Formats into a fresh `fmt::memory_buffer` (the logger's record body type).
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), fmt_str, std::forward<Args>(args)...);
    return out;
}

/// The part of `file_path` after the last '/'.
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const size_t slash = file_path.rfind('/');
    return slash == std::string_view::npos ? file_path : file_path.substr(slash + 1);
}

} // namespace artbus::format_tools
