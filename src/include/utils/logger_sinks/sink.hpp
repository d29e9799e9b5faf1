#pragma once
/**
 * @file sink.hpp
 * @brief Log record and the destination interface the logger worker writes to.
 */
#include "abus_base.hpp"

namespace artbus::utils
{

/// A log record queued by the calling thread and rendered by the worker.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // numeric Logger::Level
    fmt::memory_buffer body;
};

/**
 * @brief Where rendered log lines go. Called only from the logger worker.
 */
class ARTBUS_EXPORT Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    /// "TRACE" .. "SYSTEM", or "?" for an out-of-range level.
    static std::string_view level_name(int level) noexcept;

    /// `<ISO time> <LEVEL> [<pid>:<tid>] <body>\n`
    static std::string render(const LogMessage &msg);
};

} // namespace artbus::utils
