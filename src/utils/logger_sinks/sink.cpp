#include "abus_base.hpp"
#include "utils/logger_sinks/sink.hpp"

#include <array>

namespace artbus::utils
{

namespace
{
// Indexed by Logger::Level.
constexpr std::array<std::string_view, 6> kLevelNames{"TRACE", "DEBUG", "INFO",
                                                      "WARN",  "ERROR", "SYSTEM"};
} // namespace

std::string_view Sink::level_name(int level) noexcept
{
    if (level < 0 || static_cast<size_t>(level) >= kLevelNames.size())
    {
        return "?";
    }
    return kLevelNames[static_cast<size_t>(level)];
}

std::string Sink::render(const LogMessage &msg)
{
    return fmt::format("{} {:<6} [{}:{}] {}\n", format_tools::formatted_time(msg.timestamp),
                       level_name(msg.level), msg.process_id, msg.thread_id,
                       std::string_view(msg.body.data(), msg.body.size()));
}

} // namespace artbus::utils
