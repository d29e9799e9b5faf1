/**
 * @file debug_info.cpp
 * @brief Panic reports and stack traces on POSIX (`backtrace` + `dladdr`).
 */
#include "abus_base.hpp"

#include <array>
#include <cstdlib>
#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>
#include <memory>

namespace artbus::debug
{

namespace
{
constexpr int kMaxFrames = 64;

struct FreeDeleter
{
    void operator()(char *p) const noexcept { std::free(p); }
};

std::string symbol_name(const char *mangled)
{
    if (mangled == nullptr)
    {
        return "??";
    }
    int status = 0;
    std::unique_ptr<char, FreeDeleter> plain(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status));
    return (status == 0 && plain) ? std::string(plain.get()) : std::string(mangled);
}
} // namespace

void print_stack_trace() noexcept
{
    std::array<void *, kMaxFrames> frames{};
    const int depth = ::backtrace(frames.data(), kMaxFrames);
    try
    {
        fmt::print(stderr, "--- stack trace ({} frames) ---\n", depth);
        // Skip this function.
        for (int i = 1; i < depth; ++i)
        {
            void *frame = frames[static_cast<size_t>(i)];
            Dl_info info{};
            if (::dladdr(frame, &info) == 0)
            {
                fmt::print(stderr, "  #{:<2} {}\n", i, frame);
                continue;
            }
            const std::string_view object = info.dli_fname != nullptr
                                                ? format_tools::filename_only(info.dli_fname)
                                                : std::string_view{"?"};
            fmt::print(stderr, "  #{:<2} {} ({})\n", i, symbol_name(info.dli_sname), object);
        }
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "--- stack trace unavailable: %s ---\n", e.what());
    }
    std::fflush(stderr);
}

void abort_with(const std::source_location &loc, std::string_view body) noexcept
{
    std::fprintf(stderr, "[PANIC] %s:%u %s -- %.*s\n",
                 std::string(format_tools::filename_only(loc.file_name())).c_str(),
                 static_cast<unsigned>(loc.line()), loc.function_name(),
                 static_cast<int>(body.size()), body.data());
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

} // namespace artbus::debug
