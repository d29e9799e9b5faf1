/**
 * @file file_lock.cpp
 * @brief FileLock: a per-path gate for threads, then `flock()` for processes.
 */
#include "abus_base.hpp"

#include "utils/file_lock.hpp"
#include "utils/lifecycle.hpp"

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <mutex>
#include <new>
#include <thread>
#include <unordered_map>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace artbus::utils
{

namespace
{
std::atomic<bool> g_running{false};

constexpr mode_t kLockFileMode = 0644;
constexpr std::chrono::milliseconds kStopBudget = 2000ms;
constexpr std::chrono::milliseconds kPollInterval = 20ms;

using Clock = std::chrono::steady_clock;
using Deadline = std::optional<Clock::time_point>;

Deadline deadline_after(std::optional<std::chrono::milliseconds> timeout)
{
    if (!timeout)
    {
        return std::nullopt;
    }
    return Clock::now() + *timeout;
}

std::error_code errno_code(int err)
{
    return {err, std::generic_category()};
}

std::string gate_key_for(const fs::path &lock_file)
{
    std::error_code ec;
    const fs::path abs = fs::absolute(lock_file, ec);
    return (ec ? lock_file : abs).lexically_normal().generic_string();
}

/// Lets one thread of this process at a time hold a given lock file.
class ThreadGate
{
  public:
    static ThreadGate &instance()
    {
        static ThreadGate gate;
        return gate;
    }

    std::error_code enter(const std::string &key, LockMode mode, Deadline deadline)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto &slot = m_entries[key];
        if (!slot)
        {
            slot = std::make_unique<Entry>();
        }
        Entry &entry = *slot;

        if (entry.held)
        {
            if (mode == LockMode::NonBlocking)
            {
                return std::make_error_code(std::errc::resource_unavailable_try_again);
            }
            ++entry.waiting;
            const auto is_free = [&entry] { return !entry.held; };
            bool got_it = true;
            if (deadline)
            {
                got_it = entry.freed.wait_until(lock, *deadline, is_free);
            }
            else
            {
                entry.freed.wait(lock, is_free);
            }
            --entry.waiting;
            if (!got_it)
            {
                return std::make_error_code(std::errc::timed_out);
            }
        }
        entry.held = true;
        return {};
    }

    void leave(const std::string &key) noexcept
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(key);
        if (it == m_entries.end())
        {
            return;
        }
        it->second->held = false;
        if (it->second->waiting == 0)
        {
            m_entries.erase(it);
        }
        else
        {
            it->second->freed.notify_all();
        }
    }

  private:
    struct Entry
    {
        bool held{false};
        int waiting{0};
        std::condition_variable freed;
    };

    std::mutex m_mutex;
    std::unordered_map<std::string, std::unique_ptr<Entry>> m_entries;
};

/// Opens `lock_file` and takes LOCK_EX on it. On success `fd` owns the descriptor.
std::error_code lock_os_file(const fs::path &lock_file, LockMode mode, Deadline deadline, int &fd)
{
    if (const fs::path parent = lock_file.parent_path(); !parent.empty())
    {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec)
        {
            return ec;
        }
    }

    const int opened =
        ::open(lock_file.c_str(), O_CREAT | O_RDWR | O_CLOEXEC | O_NOFOLLOW, kLockFileMode);
    if (opened == -1)
    {
        return errno_code(errno);
    }
    auto close_fd = artbus::basics::make_scope_guard([opened] { ::close(opened); });

    if (mode == LockMode::Blocking && !deadline)
    {
        while (::flock(opened, LOCK_EX) != 0)
        {
            if (errno != EINTR)
            {
                return errno_code(errno);
            }
        }
        close_fd.dismiss();
        fd = opened;
        return {};
    }

    for (;;)
    {
        if (::flock(opened, LOCK_EX | LOCK_NB) == 0)
        {
            close_fd.dismiss();
            fd = opened;
            return {};
        }
        const int err = errno;
        if (err != EWOULDBLOCK && err != EINTR)
        {
            return errno_code(err);
        }
        if (mode == LockMode::NonBlocking)
        {
            return std::make_error_code(std::errc::resource_unavailable_try_again);
        }
        if (Clock::now() >= *deadline)
        {
            return std::make_error_code(std::errc::timed_out);
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

[[noreturn]] void not_started()
{
    ABUS_PANIC("FileLock used before the FileLock module was started");
}
} // namespace

// ============================================================================
// FileLockImpl
// ============================================================================

struct FileLockImpl
{
    fs::path lock_file;
    std::string gate_key;
    bool in_gate{false};
    int fd{-1};
    std::error_code ec;

    FileLockImpl() = default;
    FileLockImpl(const FileLockImpl &) = delete;
    FileLockImpl &operator=(const FileLockImpl &) = delete;
    ~FileLockImpl() { release(); }

    [[nodiscard]] bool valid() const noexcept { return fd != -1; }

    void acquire(const fs::path &path, ResourceType type, LockMode mode,
                 std::optional<std::chrono::milliseconds> timeout) noexcept
    {
        try
        {
            lock_file = FileLock::get_expected_lock_fullname_for(path, type);
            if (lock_file.empty())
            {
                ec = std::make_error_code(std::errc::invalid_argument);
                return;
            }
            const Deadline deadline = deadline_after(timeout);

            gate_key = gate_key_for(lock_file);
            ec = ThreadGate::instance().enter(gate_key, mode, deadline);
            if (ec)
            {
                return;
            }
            in_gate = true;

            ec = lock_os_file(lock_file, mode, deadline, fd);
            if (ec)
            {
                ABUS_DEBUG("FileLock: flock on '{}' failed: {}", lock_file.string(), ec.message());
                release();
            }
        }
        catch (const std::system_error &e)
        {
            ec = e.code();
            release();
        }
        catch (const std::bad_alloc &)
        {
            ec = std::make_error_code(std::errc::not_enough_memory);
            release();
        }
    }

    void release() noexcept
    {
        if (fd != -1)
        {
            ::flock(fd, LOCK_UN);
            ::close(fd);
            fd = -1;
        }
        if (in_gate)
        {
            ThreadGate::instance().leave(gate_key);
            in_gate = false;
        }
    }
};

namespace
{
std::unique_ptr<FileLockImpl> lock_now(const fs::path &path, ResourceType type, LockMode mode,
                                       std::optional<std::chrono::milliseconds> timeout) noexcept
{
    std::unique_ptr<FileLockImpl> impl(new (std::nothrow) FileLockImpl);
    if (impl)
    {
        impl->acquire(path, type, mode, timeout);
    }
    return impl;
}
} // namespace

// ============================================================================
// FileLock
// ============================================================================

fs::path FileLock::get_expected_lock_fullname_for(const fs::path &path, ResourceType type) noexcept
{
    try
    {
        if (path.empty())
        {
            return {};
        }
        for (const char ch : path.native())
        {
            if (static_cast<unsigned char>(ch) < 0x20)
            {
                return {};
            }
        }

        std::error_code ec;
        fs::path target = fs::weakly_canonical(path, ec);
        if (ec)
        {
            target = fs::absolute(path).lexically_normal();
        }
        if (!target.has_filename())
        {
            target = target.parent_path();
        }

        if (type == ResourceType::File)
        {
            target += ".lock";
            return target;
        }
        fs::path name = target.filename();
        if (name.empty() || name == "." || name == "..")
        {
            name = "artbus_root";
        }
        name += ".dir.lock";
        return target.parent_path() / name;
    }
    catch (const std::exception &)
    {
        return {};
    }
}

FileLock::FileLock(const fs::path &path, ResourceType type, LockMode mode) noexcept
    : pImpl(lifecycle_initialized() ? lock_now(path, type, mode, std::nullopt) : nullptr)
{
    if (!lifecycle_initialized() && !pImpl)
    {
        not_started();
    }
}

FileLock::FileLock(const fs::path &path, ResourceType type,
                   std::chrono::milliseconds timeout) noexcept
    : pImpl(lifecycle_initialized() ? lock_now(path, type, LockMode::Blocking, timeout) : nullptr)
{
    if (!lifecycle_initialized() && !pImpl)
    {
        not_started();
    }
}

FileLock::FileLock(std::unique_ptr<FileLockImpl> impl) noexcept : pImpl(std::move(impl)) {}

FileLock::~FileLock() = default;
FileLock::FileLock(FileLock &&) noexcept = default;
FileLock &FileLock::operator=(FileLock &&) noexcept = default;

std::optional<FileLock> FileLock::try_lock(const fs::path &path, ResourceType type,
                                           LockMode mode) noexcept
{
    if (!lifecycle_initialized())
    {
        return std::nullopt;
    }
    auto impl = lock_now(path, type, mode, std::nullopt);
    if (!impl || !impl->valid())
    {
        return std::nullopt;
    }
    return FileLock(std::move(impl));
}

std::optional<FileLock> FileLock::try_lock(const fs::path &path, ResourceType type,
                                           std::chrono::milliseconds timeout) noexcept
{
    if (!lifecycle_initialized())
    {
        return std::nullopt;
    }
    auto impl = lock_now(path, type, LockMode::Blocking, timeout);
    if (!impl || !impl->valid())
    {
        return std::nullopt;
    }
    return FileLock(std::move(impl));
}

bool FileLock::valid() const noexcept
{
    return pImpl && pImpl->valid();
}

std::error_code FileLock::error_code() const noexcept
{
    return pImpl ? pImpl->ec : std::make_error_code(std::errc::not_enough_memory);
}

std::optional<fs::path> FileLock::get_canonical_lock_file_path() const noexcept
{
    if (!valid())
    {
        return std::nullopt;
    }
    return pImpl->lock_file;
}

// ============================================================================
// Lifecycle
// ============================================================================

bool FileLock::lifecycle_initialized() noexcept
{
    return g_running.load(std::memory_order_acquire);
}

namespace
{
void start_file_lock(const char *)
{
    g_running.store(true, std::memory_order_release);
}

void stop_file_lock(const char *)
{
    g_running.store(false, std::memory_order_release);
}
} // namespace

ModuleDef FileLock::GetLifecycleModule()
{
    ModuleDef module("FileLock");
    module.depends_on("Logger").on_start(&start_file_lock).on_stop(&stop_file_lock, kStopBudget);
    return module;
}

} // namespace artbus::utils
