/**
 * @file logger.cpp
 * @brief The logger's command queue and worker thread.
 */
#include "abus_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <variant>

using artbus::format_tools::make_buffer;

namespace artbus::utils
{

namespace
{
enum class Phase
{
    NotStarted,
    Running,
    Stopping,
    Stopped
};

std::atomic<Phase> g_phase{Phase::NotStarted};

/// Records allowed to wait in the queue; control commands are never dropped.
constexpr size_t kQueueCapacity = 10000;

constexpr std::chrono::milliseconds kStopBudget{5000};

void require_started(std::string_view call)
{
    if (g_phase.load(std::memory_order_acquire) == Phase::NotStarted)
    {
        ABUS_PANIC("Logger::{} called before the Logger module was started", call);
    }
}

LogMessage make_record(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{std::chrono::system_clock::now(), platform::get_pid(),
                      platform::get_native_thread_id(), static_cast<int>(lvl), std::move(body)};
}

struct SwapSink
{
    std::unique_ptr<Sink> sink;
    std::promise<bool> done;
};

struct FlushSink
{
    std::promise<void> done;
};

using Command = std::variant<LogMessage, SwapSink, FlushSink>;
} // namespace

// ============================================================================
// Worker
// ============================================================================

struct Logger::Impl
{
    std::mutex mutex;
    std::condition_variable wake;
    std::deque<Command> pending;
    size_t queued_records{0};
    bool stop_requested{false};

    std::atomic<Level> level{Level::L_INFO};
    std::atomic<size_t> dropped{0};

    // Touched by the worker only, once it runs.
    std::unique_ptr<Sink> sink = std::make_unique<ConsoleSink>();
    std::thread worker;

    ~Impl() { stop(); }

    void start()
    {
        if (!worker.joinable())
        {
            worker = std::thread([this] { run(); });
        }
    }

    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            stop_requested = true;
        }
        wake.notify_one();
        if (worker.joinable())
        {
            worker.join();
        }
    }

    /// False if the command was not queued (stopping, or the queue is full).
    bool push(Command &&cmd)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stop_requested)
            {
                return false;
            }
            if (std::holds_alternative<LogMessage>(cmd))
            {
                if (queued_records >= kQueueCapacity)
                {
                    dropped.fetch_add(1, std::memory_order_relaxed);
                    return false;
                }
                ++queued_records;
            }
            pending.push_back(std::move(cmd));
        }
        wake.notify_one();
        return true;
    }

    void emit(const LogMessage &record)
    {
        try
        {
            sink->write(record);
        }
        catch (const std::exception &e)
        {
            fmt::print(stderr, "artbus logger: {} failed: {}\n", sink->description(), e.what());
        }
    }

    void emit_system(fmt::memory_buffer &&text) { emit(make_record(Level::L_SYSTEM, std::move(text))); }

    void flush_sink()
    {
        try
        {
            sink->flush();
        }
        catch (const std::exception &e)
        {
            fmt::print(stderr, "artbus logger: flush of {} failed: {}\n", sink->description(),
                       e.what());
        }
    }

    void apply(Command &cmd)
    {
        if (auto *record = std::get_if<LogMessage>(&cmd))
        {
            if (record->level >= static_cast<int>(level.load(std::memory_order_relaxed)))
            {
                emit(*record);
            }
        }
        else if (auto *swap = std::get_if<SwapSink>(&cmd))
        {
            const std::string from = sink->description();
            emit_system(make_buffer("log output moves to {}", swap->sink->description()));
            flush_sink();
            sink = std::move(swap->sink);
            emit_system(make_buffer("log output continued from {}", from));
            swap->done.set_value(true);
        }
        else if (auto *flush = std::get_if<FlushSink>(&cmd))
        {
            flush_sink();
            flush->done.set_value();
        }
    }

    void run()
    {
        std::deque<Command> batch;
        for (;;)
        {
            bool last = false;
            {
                std::unique_lock<std::mutex> lock(mutex);
                wake.wait(lock, [this] { return stop_requested || !pending.empty(); });
                batch.swap(pending);
                queued_records = 0;
                last = stop_requested;
            }

            for (auto &cmd : batch)
            {
                apply(cmd);
            }
            batch.clear();

            if (const size_t lost = dropped.exchange(0, std::memory_order_relaxed); lost > 0)
            {
                emit(make_record(Level::L_WARNING,
                                 make_buffer("logger queue full: {} records dropped", lost)));
            }

            if (last)
            {
                emit_system(make_buffer("logger stopped"));
                flush_sink();
                return;
            }
        }
    }
};

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger logger;
    return logger;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_phase.load(std::memory_order_acquire) != Phase::NotStarted;
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name) noexcept
{
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static constexpr std::pair<std::string_view, Level> kNames[] = {
        {"trace", Level::L_TRACE}, {"debug", Level::L_DEBUG},   {"info", Level::L_INFO},
        {"warn", Level::L_WARNING}, {"warning", Level::L_WARNING}, {"error", Level::L_ERROR},
        {"system", Level::L_SYSTEM}};
    for (const auto &[text, lvl] : kNames)
    {
        if (key == text)
        {
            return lvl;
        }
    }
    return std::nullopt;
}

bool Logger::set_console()
{
    require_started("set_console");
    SwapSink cmd{std::make_unique<ConsoleSink>(), {}};
    auto done = cmd.done.get_future();
    return pImpl->push(std::move(cmd)) && done.get();
}

bool Logger::set_logfile(const std::string &path, bool use_flock)
{
    require_started("set_logfile");
    SwapSink cmd;
    try
    {
        cmd.sink = std::make_unique<FileSink>(path, use_flock);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("cannot log to '{}': {}", path, e.what());
        return false;
    }
    auto done = cmd.done.get_future();
    return pImpl->push(std::move(cmd)) && done.get();
}

void Logger::flush()
{
    require_started("flush");
    FlushSink cmd;
    auto done = cmd.done.get_future();
    if (pImpl->push(std::move(cmd)))
    {
        done.get();
    }
}

void Logger::shutdown()
{
    Phase expected = Phase::Running;
    if (!g_phase.compare_exchange_strong(expected, Phase::Stopping))
    {
        return;
    }
    pImpl->stop();
    g_phase.store(Phase::Stopped, std::memory_order_release);
}

void Logger::set_level(Level lvl)
{
    require_started("set_level");
    pImpl->level.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level.load(std::memory_order_relaxed);
}

bool Logger::should_log(Level lvl) const noexcept
{
    return g_phase.load(std::memory_order_acquire) == Phase::Running &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->level.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    try
    {
        return pImpl->push(make_record(lvl, std::move(body)));
    }
    catch (const std::bad_alloc &)
    {
        return false;
    }
}

bool Logger::enqueue_log(Level lvl, std::string &&body) noexcept
{
    try
    {
        fmt::memory_buffer buf;
        buf.append(body.data(), body.data() + body.size());
        return enqueue_log(lvl, std::move(buf));
    }
    catch (const std::bad_alloc &)
    {
        return false;
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

void start_logger(const char *)
{
    Logger::instance().pImpl->start();
    g_phase.store(Phase::Running, std::memory_order_release);
}

namespace
{
void stop_logger(const char *)
{
    Logger::instance().shutdown();
}
} // namespace

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("Logger");
    module.on_start(&start_logger).on_stop(&stop_logger, kStopBudget);
    return module;
}

} // namespace artbus::utils
