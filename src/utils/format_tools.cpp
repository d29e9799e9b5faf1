/**
 * @file format_tools.cpp
 */
#include "abus_base.hpp"

#include <ctime>

namespace artbus::format_tools
{

namespace
{
/// Whole seconds as `std::tm` plus the non-negative sub-second remainder in `Unit`.
template <typename Unit> struct SplitTime
{
    std::tm calendar{};
    long long fraction{0};
};

template <typename Unit>
SplitTime<Unit> split(std::chrono::system_clock::time_point timestamp, bool utc)
{
    using namespace std::chrono;
    const auto whole = floor<seconds>(timestamp);
    SplitTime<Unit> out;
    out.fraction = duration_cast<Unit>(timestamp - whole).count();
    const std::time_t tt = system_clock::to_time_t(whole);
    if (utc)
    {
        gmtime_r(&tt, &out.calendar);
    }
    else
    {
        localtime_r(&tt, &out.calendar);
    }
    return out;
}
} // namespace

std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    const auto t = split<std::chrono::microseconds>(timestamp, false);
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06d}", t.calendar, t.fraction);
}

std::string iso8601_utc(std::chrono::system_clock::time_point timestamp)
{
    const auto t = split<std::chrono::milliseconds>(timestamp, true);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", t.calendar, t.fraction);
}

std::string iso8601_utc_now()
{
    return iso8601_utc(std::chrono::system_clock::now());
}

int64_t epoch_millis(std::chrono::system_clock::time_point timestamp) noexcept
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch())
        .count();
}

} // namespace artbus::format_tools
